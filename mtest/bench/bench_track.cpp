#include "rtrack.hpp"
#include <cstdio>
#include <cinttypes>

using namespace rtrack;

enum class Category { Misc };

uint64_t rdtscp()
{
    uint32_t a, d;
    __asm__ volatile ("rdtscp" : "=a" (a), "=d" (d) :: "ecx");
    return uint64_t(a) | (uint64_t(d) << 32);
}

template <typename F>
uint64_t measure(F &&f, size_t n)
{
    const uint64_t t0 = rdtscp();
    for (size_t i = 0; i < n; i++) f();
    const uint64_t t1 = rdtscp();
    return (t1 - t0) / n;
}

int main()
{
    const size_t n = 1000000;
    Registry<Category> reg = newRegistry<Category>();
    const Tracker tracker = reg.category(Category::Misc);

    for (size_t i = 0; i < 10; i++) {
        // Looking up the registry takes a mutex. Cache trackers whenever possible.
        const uint64_t uncached = measure([&]() { Count c = reg.category(Category::Misc).track(); }, n);
        const uint64_t cached = measure([&]() { Count c = tracker.track(); }, n);
        const uint64_t sized = measure([&]() { Size s = tracker.trackSized(64); s.add(64); }, n);
        ::printf("uncached %" PRIu64 " cached %" PRIu64 " sized %" PRIu64 " total %" PRId64 "\n"
                 , uncached, cached, sized, tracker.total());
    }
}
