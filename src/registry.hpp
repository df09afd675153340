#pragma once
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cassert>
#include "shared_counter.hpp"
#include "tracker.hpp"

namespace rtrack {

template <typename Id>
using CountVec = std::vector<std::pair<Id, int64_t>>;

/**
 * Category id to counter mapping.
 *
 * Id must be copyable, equality comparable and hashable.
 * Enums are recommended. If Id is expensive to copy, wrap it with a smart pointer
 * and give a hash/equality for it, since readCounts() copies every id.
 *
 * Categories are created on the first category() call and never removed,
 * so a new registry has no counts at all.
 *
 * The mutex protects the map only. Counters are atomic and shared with handles,
 * so handles may outlive the registry.
 */
template <typename Id, typename Hash = std::hash<Id>, typename Pred = std::equal_to<Id>>
class Registry
{
    mutable std::mutex mu_;
    using Map = std::unordered_map<Id, SharedCounterPtr, Hash, Pred>;
    using AutoLock = std::lock_guard<std::mutex>;
    Map map_;
public:
    Registry() : mu_(), map_() {
    }
    DISABLE_COPY_AND_ASSIGN(Registry);
    /**
     * Moves lock the mutexes. Locking std::mutex fails only on a broken system.
     */
    Registry(Registry &&rhs) noexcept : mu_(), map_() {
        AutoLock al(rhs.mu_);
        map_ = std::move(rhs.map_);
    }
    Registry &operator=(Registry &&rhs) noexcept {
        if (this == &rhs) return *this;
        std::unique_lock<std::mutex> lk0(mu_, std::defer_lock);
        std::unique_lock<std::mutex> lk1(rhs.mu_, std::defer_lock);
        std::lock(lk0, lk1);
        map_ = std::move(rhs.map_);
        return *this;
    }
    /**
     * Get the tracker of a category. Its counter starts with 0.
     * This takes the mutex, so cache the returned tracker in latency-sensitive paths.
     */
    Tracker category(const Id &id) {
        AutoLock al(mu_);
        typename Map::iterator itr;
        itr = map_.find(id);
        if (itr == map_.end()) {
            bool maked;
            std::tie(itr, maked) = map_.emplace(id, std::make_shared<SharedCounter>());
            assert(maked);
        }
        assert(itr->second);
        return Tracker(itr->second);
    }
    /**
     * Snapshot of all the known categories in unspecified order.
     * Values of different categories are not read at the same instant.
     * This contends with category(). Use it in a background job.
     */
    CountVec<Id> readCounts() const {
        return readCountsAs<CountVec<Id> >();
    }
    /**
     * C must accept insert(pos, std::pair<Id, int64_t>),
     * e.g. std::vector, std::map, std::unordered_map.
     */
    template <typename C>
    C readCountsAs() const {
        C ret;
        auto out = std::inserter(ret, ret.end());
        AutoLock al(mu_);
        for (const typename Map::value_type &p : map_) {
            *out = std::make_pair(p.first, p.second->read());
            ++out;
        }
        return ret;
    }
    size_t size() const {
        AutoLock al(mu_);
        return map_.size();
    }
    /**
     * Id must be printable.
     */
    std::string str() const {
        std::stringstream ss;
        ss << "Registry {";
        bool isFirst = true;
        for (const std::pair<Id, int64_t> &p : readCounts()) {
            if (!isFirst) ss << ", ";
            ss << p.first << ": " << p.second;
            isFirst = false;
        }
        ss << "}";
        return ss.str();
    }
    friend inline std::ostream &operator<<(std::ostream &os, const Registry &reg) {
        os << reg.str();
        return os;
    }
    // We can not remove categories
    // because live handles still refer to their counters.
};

} // namespace rtrack
