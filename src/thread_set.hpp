#pragma once
/**
 * @file
 * @brief Start threads one by one and join them in bulk.
 */
#include <atomic>
#include <exception>
#include <memory>
#include <thread>
#include <utility>
#include <vector>
#include "util.hpp"

namespace rtrack {

/**
 * Each added function runs in its own thread at once.
 * An exception thrown in a function is kept and returned by join().
 *
 * The destructor joins the running threads,
 * so a failure while adding threads does not leave joinable std::thread objects.
 */
class ThreadSet /* final */
{
private:
    struct Slot
    {
        std::exception_ptr ep;
        std::atomic<bool> isEnd;
        Slot() : ep(), isEnd(false) {}
    };
    using SlotPtr = std::shared_ptr<Slot>;

    std::vector<std::thread> thV_;
    std::vector<SlotPtr> slotV_;

public:
    ThreadSet() : thV_(), slotV_() {}
    DISABLE_COPY_AND_ASSIGN(ThreadSet);
    ~ThreadSet() noexcept {
        joinAll();
    }
    template <typename Func>
    void add(Func &&func) {
        SlotPtr slot = std::make_shared<Slot>();
        slotV_.push_back(slot);
        try {
            thV_.emplace_back([slot, f = std::forward<Func>(func)]() mutable {
                try {
                    f();
                } catch (...) {
                    slot->ep = std::current_exception();
                }
                slot->isEnd = true;
            });
        } catch (...) {
            slotV_.pop_back();
            throw;
        }
    }
    size_t size() const { return thV_.size(); }
    bool isAllEnd() const {
        for (const SlotPtr &slot : slotV_) {
            if (!slot->isEnd.load()) return false;
        }
        return true;
    }
    /**
     * Wait for all the threads.
     * The i-th item is the exception of the i-th added function, or null.
     */
    std::vector<std::exception_ptr> join() {
        joinAll();
        std::vector<std::exception_ptr> epV;
        for (const SlotPtr &slot : slotV_) epV.push_back(slot->ep);
        thV_.clear();
        slotV_.clear();
        return epV;
    }
private:
    void joinAll() noexcept {
        for (std::thread &th : thV_) {
            if (th.joinable()) th.join();
        }
    }
};

} // namespace rtrack
