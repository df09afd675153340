#pragma once
/**
 * @file
 * @brief Atomic counter cell shared by trackers and handles.
 */
#include <atomic>
#include <cstdint>
#include "util.hpp"

namespace rtrack {

/**
 * Overflow policy: wrap.
 *
 * std::atomic<int64_t> arithmetic uses two's complement without undefined results.
 * The handles keep their own net contribution with the same wrapping arithmetic,
 * so closing a handle always reverses exactly what it applied,
 * even if the total passed INT64_MAX in between.
 */
inline int64_t wrappingAdd(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

inline int64_t wrappingSub(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

inline int64_t wrappingNeg(int64_t a)
{
    return wrappingSub(0, a);
}

/**
 * Usage:
 *
 * <pre>
 * auto c = std::make_shared<SharedCounter>();
 *
 * // any thread
 * c->incrementBy(3);
 * c->incrementBy(-3);
 *
 * // any other thread
 * int64_t v = c->read();
 * </pre>
 *
 * read() returns a value that was valid at some instant during the call.
 * There is no ordering guarantee among different counters.
 */
class SharedCounter
{
private:
    std::atomic<int64_t> v_;

public:
    explicit SharedCounter(int64_t initial = 0) : v_(initial) {
    }
    DISABLE_COPY_AND_ASSIGN(SharedCounter);
    DISABLE_MOVE(SharedCounter);

    void incrementBy(int64_t delta) noexcept {
        v_.fetch_add(delta);
    }
    int64_t read() const noexcept {
        return v_.load();
    }
};

} // namespace rtrack
