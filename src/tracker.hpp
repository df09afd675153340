#pragma once
#include <memory>
#include <sstream>
#include <string>
#include "tracked.hpp"

namespace rtrack {

/**
 * Per-category factory of handles.
 * Copies share the same counter. Cache it instead of asking the registry every time.
 */
class Tracker
{
private:
    SharedCounterPtr count_;

public:
    explicit Tracker(const SharedCounterPtr &count) : count_(count) {
    }
    /**
     * Hold 1 count against the category until the returned handle is closed.
     */
    Count track() const {
        return Count(count_);
    }
    /**
     * Hold initial against the category until the returned handle is closed.
     * The handle can be resized later, e.g. when a buffer grows.
     */
    Size trackSized(int64_t initial) const {
        return Size(count_, initial);
    }
    int64_t total() const {
        return count_->read();
    }
    /**
     * True if both trackers update the same counter.
     */
    bool isSame(const Tracker &rhs) const {
        return count_ == rhs.count_;
    }
    std::string str() const {
        std::stringstream ss;
        ss << total();
        return ss.str();
    }
    friend inline std::ostream &operator<<(std::ostream &os, const Tracker &t) {
        os << t.str();
        return os;
    }
};

} // namespace rtrack
