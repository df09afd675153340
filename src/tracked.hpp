#pragma once
/**
 * @file
 * @brief Scoped handles holding a contribution to a category counter.
 */
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include "shared_counter.hpp"
#include "cybozu/exception.hpp"

namespace rtrack {

using SharedCounterPtr = std::shared_ptr<SharedCounter>;

/**
 * Fixed handle for a resource that is only counted by its existence.
 *
 * Usage:
 *
 * <pre>
 * struct ExpensiveResource
 * {
 *     std::string payload;
 *     rtrack::Count count; // initialized with tracker.track().
 * };
 * </pre>
 *
 * The counter is incremented when the handle is created by Tracker::track()
 * and decremented once by close() or the destructor.
 * A moved-from handle holds nothing.
 */
class Count
{
private:
    SharedCounterPtr total_;

public:
    explicit Count(const SharedCounterPtr &total) : total_(total) {
        if (total_) total_->incrementBy(1);
    }
    Count() : total_() {
    }
    DISABLE_COPY_AND_ASSIGN(Count);
    Count(Count &&rhs) noexcept : total_(std::move(rhs.total_)) {
    }
    Count &operator=(Count &&rhs) noexcept {
        if (this != &rhs) {
            close();
            total_ = std::move(rhs.total_);
        }
        return *this;
    }
    ~Count() noexcept {
        close();
    }
    void close() noexcept {
        if (!total_) return;
        total_->incrementBy(-1);
        total_.reset();
    }
    bool isClosed() const { return !total_; }
    int64_t total() const {
        return total_ ? total_->read() : 0;
    }
    std::string str() const {
        std::stringstream ss;
        ss << "Count: " << total();
        return ss.str();
    }
    friend inline std::ostream &operator<<(std::ostream &os, const Count &c) {
        os << c.str();
        return os;
    }
};

/**
 * Mutable handle for a resource of changing size.
 *
 * The handle remembers its net contribution (local).
 * close() and the destructor subtract exactly that amount,
 * so the counter returns to the value it would have without this handle.
 *
 * Mutating a closed handle is a bug of the caller and throws cybozu::Exception.
 */
class Size
{
private:
    SharedCounterPtr total_;
    int64_t local_;

public:
    Size(const SharedCounterPtr &total, int64_t initial)
        : total_(total), local_(0) {
        if (!total_) return;
        total_->incrementBy(initial);
        local_ = initial;
    }
    Size() : total_(), local_(0) {
    }
    DISABLE_COPY_AND_ASSIGN(Size);
    Size(Size &&rhs) noexcept
        : total_(std::move(rhs.total_)), local_(rhs.local_) {
        rhs.local_ = 0;
    }
    Size &operator=(Size &&rhs) noexcept {
        if (this != &rhs) {
            close();
            total_ = std::move(rhs.total_);
            local_ = rhs.local_;
            rhs.local_ = 0;
        }
        return *this;
    }
    ~Size() noexcept {
        close();
    }
    /**
     * delta may be negative.
     */
    void add(int64_t delta) {
        check(__func__);
        total_->incrementBy(delta);
        local_ = wrappingAdd(local_, delta);
    }
    /**
     * Same as add(newSize - get()).
     */
    void set(int64_t newSize) {
        add(wrappingSub(newSize, local_));
    }
    /**
     * Decrease the contribution by amount, but not below zero.
     * A handle with a negative contribution is left as it is.
     */
    void subtract(int64_t amount) {
        check(__func__);
        if (amount < 0) {
            throw cybozu::Exception("Size:subtract:negative amount") << amount;
        }
        if (local_ <= 0) return;
        add(-std::min(amount, local_));
    }
    int64_t get() const { return local_; }
    int64_t total() const {
        return total_ ? total_->read() : 0;
    }
    void close() noexcept {
        if (!total_) return;
        total_->incrementBy(wrappingNeg(local_));
        total_.reset();
        local_ = 0;
    }
    bool isClosed() const { return !total_; }
    std::string str() const {
        std::stringstream ss;
        ss << "Size: total " << total() << " local " << local_;
        return ss.str();
    }
    friend inline std::ostream &operator<<(std::ostream &os, const Size &s) {
        os << s.str();
        return os;
    }
private:
    void check(const char *msg) const {
        if (!total_) {
            throw cybozu::Exception("Size:closed") << msg;
        }
    }
};

} // namespace rtrack
