#pragma once
/**
 * @file
 * @brief Put count snapshots of a registry to logs.
 */
#include <algorithm>
#include <sstream>
#include <string>
#include "registry.hpp"
#include "rtrack_logger.hpp"

namespace rtrack {

/**
 * Id must have operator<.
 */
template <typename Id, typename Hash, typename Pred>
inline CountVec<Id> sortedCounts(const Registry<Id, Hash, Pred> &reg)
{
    CountVec<Id> v = reg.readCounts();
    std::sort(v.begin(), v.end());
    return v;
}

/**
 * Sorted categories whose count is not zero.
 * Empty when nothing is live, e.g. after all the handles are closed.
 */
template <typename Id, typename Hash, typename Pred>
inline CountVec<Id> nonZeroCounts(const Registry<Id, Hash, Pred> &reg)
{
    CountVec<Id> v = sortedCounts(reg);
    v.erase(std::remove_if(v.begin(), v.end(),
                           [](const std::pair<Id, int64_t> &p) { return p.second == 0; }),
            v.end());
    return v;
}

/**
 * "id:count id:count ...". Id must be printable.
 */
template <typename Id>
inline std::string countsToStr(const CountVec<Id> &v)
{
    std::stringstream ss;
    bool isFirst = true;
    for (const std::pair<Id, int64_t> &p : v) {
        if (!isFirst) ss << ' ';
        ss << p.first << ':' << p.second;
        isFirst = false;
    }
    return ss.str();
}

/**
 * Put a sorted snapshot of all the categories in one log line.
 */
template <typename Id, typename Hash, typename Pred>
inline void putCounts(const Logger &logger, const Registry<Id, Hash, Pred> &reg,
                      const std::string &title, cybozu::LogPriority pri = cybozu::LogInfo)
{
    const CountVec<Id> v = sortedCounts(reg);
    if (v.empty()) {
        logger.writeS(pri, title + " no category");
        return;
    }
    logger.writeS(pri, title + " " + countsToStr(v));
}

} // namespace rtrack
