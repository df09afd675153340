#include "cybozu/test.hpp"
#include "rtrack.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace rtrack;

enum class Category {
    Misc,
    SpecificOne,
    A,
    B,
    C,
};

using CatVec = CountVec<Category>;

CatVec sorted(CatVec v)
{
    std::sort(v.begin(), v.end());
    return v;
}

CYBOZU_TEST_AUTO(countFollowsCounters)
{
    Registry<Category> reg = newRegistry<Category>();
    CYBOZU_TEST_ASSERT(reg.readCounts().empty());
    CYBOZU_TEST_EQUAL(reg.size(), 0);

    Tracker misc = reg.category(Category::Misc);
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::Misc, 0}}));
    {
        Count c = misc.track();
        CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::Misc, 1}}));
    }
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::Misc, 0}}));
}

CYBOZU_TEST_AUTO(countDoesNotResetOnRead)
{
    Registry<Category> reg;
    Count c = reg.category(Category::SpecificOne).track();
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::SpecificOne, 1}}));
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::SpecificOne, 1}}));
}

CYBOZU_TEST_AUTO(sameIdSharesCounter)
{
    Registry<Category> reg;
    Tracker t0 = reg.category(Category::A);
    Tracker t1 = reg.category(Category::A);
    CYBOZU_TEST_ASSERT(t0.isSame(t1));
    CYBOZU_TEST_EQUAL(reg.size(), 1);

    Count c0 = t0.track();
    Count c1 = t1.track();
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::A, 2}}));
    CYBOZU_TEST_EQUAL(t0.total(), 2);
}

CYBOZU_TEST_AUTO(untouchedCategoriesDoNotAppear)
{
    Registry<Category> reg;
    Count c = reg.category(Category::B).track();
    for (const std::pair<Category, int64_t> &p : reg.readCounts()) {
        CYBOZU_TEST_ASSERT(p.first == Category::B);
    }
    CYBOZU_TEST_EQUAL(reg.size(), 1);
}

CYBOZU_TEST_AUTO(twoCategories)
{
    Registry<Category> reg;
    {
        Count a = reg.category(Category::A).track();
        Count b0 = reg.category(Category::B).track();
        Count b1 = reg.category(Category::B).track();
        CYBOZU_TEST_ASSERT(sorted(reg.readCounts()) == CatVec({{Category::A, 1}, {Category::B, 2}}));
    }
    CYBOZU_TEST_ASSERT(sorted(reg.readCounts()) == CatVec({{Category::A, 0}, {Category::B, 0}}));
}

CYBOZU_TEST_AUTO(sizedCategory)
{
    Registry<Category> reg;
    Tracker t = reg.category(Category::C);
    {
        Size s = t.trackSized(0);
        s.add(5);
        s.add(-2);
        CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::C, 3}}));
    }
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::C, 0}}));
}

CYBOZU_TEST_AUTO(sizeAddThenRelease)
{
    Registry<Category> reg;
    Tracker t = reg.category(Category::SpecificOne);
    {
        Size s = t.trackSized(4);
        CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::SpecificOne, 4}}));
        s.add(3);
        CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::SpecificOne, 7}}));
    }
    CYBOZU_TEST_ASSERT(reg.readCounts() == CatVec({{Category::SpecificOne, 0}}));
}

CYBOZU_TEST_AUTO(mixCountAndSize)
{
    Registry<Category> reg;
    Tracker counts = reg.category(Category::A);
    Tracker weights = reg.category(Category::B);

    struct TrackedVector
    {
        std::vector<std::string> v;
        Count count;
        Size weight;
        void push(const std::string &s) {
            v.push_back(s);
            weight.add(s.size());
        }
    };
    {
        TrackedVector tv{{}, counts.track(), weights.trackSized(0)};
        tv.push("hello");
        CYBOZU_TEST_ASSERT(sorted(reg.readCounts()) == CatVec({{Category::A, 1}, {Category::B, 5}}));
        TrackedVector tv2{{}, counts.track(), weights.trackSized(0)};
        tv2.push("ab");
        CYBOZU_TEST_ASSERT(sorted(reg.readCounts()) == CatVec({{Category::A, 2}, {Category::B, 7}}));
    }
    CYBOZU_TEST_ASSERT(sorted(reg.readCounts()) == CatVec({{Category::A, 0}, {Category::B, 0}}));
}

CYBOZU_TEST_AUTO(stringRegistry)
{
    Registry<std::string> reg = newRegistry<std::string>();
    Tracker t = reg.category("plain string category");
    Count c = t.track();
    CYBOZU_TEST_ASSERT(reg.readCounts() == CountVec<std::string>({{"plain string category", 1}}));
    CYBOZU_TEST_EQUAL(reg.str(), "Registry {plain string category: 1}");
}

/*
 * Ids that are expensive to copy can be shared.
 */
using SharedStr = std::shared_ptr<const std::string>;

struct SharedStrHash
{
    size_t operator()(const SharedStr &s) const {
        return std::hash<std::string>()(*s);
    }
};

struct SharedStrEqual
{
    bool operator()(const SharedStr &a, const SharedStr &b) const {
        return *a == *b;
    }
};

CYBOZU_TEST_AUTO(sharedStringRegistry)
{
    auto reg = newRegistry<SharedStr, SharedStrHash, SharedStrEqual>();
    Tracker t0 = reg.category(std::make_shared<const std::string>("dynamic"));
    Tracker t1 = reg.category(std::make_shared<const std::string>("dynamic"));
    CYBOZU_TEST_ASSERT(t0.isSame(t1));

    Count c = t1.track();
    const CountVec<SharedStr> v = reg.readCounts();
    CYBOZU_TEST_EQUAL(v.size(), 1);
    CYBOZU_TEST_EQUAL(*v[0].first, "dynamic");
    CYBOZU_TEST_EQUAL(v[0].second, 1);
}

CYBOZU_TEST_AUTO(readCountsAs)
{
    Registry<std::string> reg;
    Count a = reg.category("a").track();
    Size b = reg.category("b").trackSized(10);

    const std::map<std::string, int64_t> m = reg.readCountsAs<std::map<std::string, int64_t> >();
    CYBOZU_TEST_EQUAL(m.size(), 2);
    CYBOZU_TEST_EQUAL(m.at("a"), 1);
    CYBOZU_TEST_EQUAL(m.at("b"), 10);

    const std::unordered_map<std::string, int64_t> um =
        reg.readCountsAs<std::unordered_map<std::string, int64_t> >();
    CYBOZU_TEST_EQUAL(um.size(), 2);
    CYBOZU_TEST_EQUAL(um.at("b"), 10);
}

CYBOZU_TEST_AUTO(registryMove)
{
    Registry<std::string> reg0;
    Count c = reg0.category("x").track();
    Registry<std::string> reg1(std::move(reg0));
    CYBOZU_TEST_EQUAL(reg1.size(), 1);
    CYBOZU_TEST_ASSERT(reg1.category("x").total() == 1);

    Registry<std::string> reg2;
    reg2 = std::move(reg1);
    CYBOZU_TEST_EQUAL(reg2.category("x").total(), 1);
}

CYBOZU_TEST_AUTO(registryMoveIsNoexcept)
{
    CYBOZU_TEST_ASSERT(std::is_nothrow_move_constructible<Registry<std::string> >::value);
    CYBOZU_TEST_ASSERT(std::is_nothrow_move_assignable<Registry<std::string> >::value);
    CYBOZU_TEST_ASSERT(std::is_nothrow_move_constructible<Registry<Category> >::value);

    Registry<Category> reg0;
    Size s = reg0.category(Category::A).trackSized(7);
    Registry<Category> reg1;
    reg1 = std::move(reg0);
    reg1 = std::move(reg1);
    CYBOZU_TEST_EQUAL(reg1.size(), 1);
    CYBOZU_TEST_EQUAL(reg1.category(Category::A).total(), 7);
}

CYBOZU_TEST_AUTO(handlesOutliveRegistry)
{
    Count c;
    Size s;
    {
        Registry<Category> reg;
        c = reg.category(Category::A).track();
        s = reg.category(Category::B).trackSized(3);
    }
    CYBOZU_TEST_EQUAL(c.total(), 1);
    s.add(1);
    CYBOZU_TEST_EQUAL(s.total(), 4);
}

CYBOZU_TEST_AUTO(concurrentCategory)
{
    Registry<std::string> reg;
    const std::vector<std::string> tbl({"a0", "a1", "a2"});
    const size_t nrThreads = 10;
    const size_t nrIter = 1000;

    std::vector<std::vector<Count> > held(nrThreads);
    std::vector<std::thread> v;
    for (size_t i = 0; i < nrThreads; i++) {
        v.emplace_back([&, i]() {
            for (size_t j = 0; j < nrIter; j++) {
                for (const std::string &s : tbl) {
                    Count tmp = reg.category(s).track();
                }
                held[i].push_back(reg.category(tbl[j % tbl.size()]).track());
            }
        });
    }
    for (auto &th : v) {
        th.join();
    }
    CYBOZU_TEST_EQUAL(reg.size(), tbl.size());
    const CountVec<std::string> cv = reg.readCounts();
    int64_t sum = 0;
    for (const std::pair<std::string, int64_t> &p : cv) sum += p.second;
    CYBOZU_TEST_EQUAL(sum, int64_t(nrThreads * nrIter));
    CYBOZU_TEST_EQUAL(reg.category("a0").total(), int64_t(nrThreads * 334));

    held.clear();
    for (const std::pair<std::string, int64_t> &p : reg.readCounts()) {
        CYBOZU_TEST_EQUAL(p.second, 0);
    }
}
