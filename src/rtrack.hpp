#pragma once
/**
 * @file
 * @brief Live resource counting.
 *
 * <pre>
 * enum class Category { Misc, Buffer };
 *
 * auto reg = rtrack::newRegistry<Category>();
 * rtrack::Tracker counts = reg.category(Category::Misc);
 * rtrack::Tracker bytes = reg.category(Category::Buffer);
 *
 * struct TrackedBuffer
 * {
 *     std::string buf;
 *     rtrack::Count count;
 *     rtrack::Size size;
 *     void append(const std::string &s) {
 *         buf += s;
 *         size.add(s.size());
 *     }
 * };
 * TrackedBuffer b{"", counts.track(), bytes.trackSized(0)};
 * b.append("hello");
 * // reg.readCounts() contains (Misc, 1) and (Buffer, 5).
 * </pre>
 *
 * Use only track() or only trackSized() for a category.
 * Counts and sizes can be mixed in a registry.
 */
#include "shared_counter.hpp"
#include "tracked.hpp"
#include "tracker.hpp"
#include "registry.hpp"

namespace rtrack {

template <typename Id, typename Hash = std::hash<Id>, typename Pred = std::equal_to<Id>>
inline Registry<Id, Hash, Pred> newRegistry()
{
    return Registry<Id, Hash, Pred>();
}

} // namespace rtrack
