/**
 * @file
 * @brief Multi-threaded tracking workload.
 *
 * Workers create and drop Count and Size handles on a shared registry
 * while the main thread puts snapshots to the log.
 * All the categories must be zero at the end.
 */
#include <chrono>
#include <cinttypes>
#include <deque>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "rtrack.hpp"
#include "count_report.hpp"
#include "rtrack_util.hpp"
#include "thread_set.hpp"
#include "rtrack_logger.hpp"
#include "cybozu/option.hpp"
#include "cybozu/exception.hpp"

using namespace rtrack;

using StrRegistry = Registry<std::string>;

struct Option
{
    size_t nrThreads;
    size_t nrIter;
    size_t nrCategories;
    std::string maxSizeStr;
    uint64_t maxSize;
    size_t intervalMs;
    bool isCached;
    std::string logPath;
    bool isDebug;

    Option(int argc, char *argv[]) {
        cybozu::Option opt;
        opt.setDescription("rtrack-stress: track and drop handles from many threads.\n");
        opt.appendOpt(&nrThreads, 4, "t", ": number of worker threads. (default: 4)");
        opt.appendOpt(&nrIter, 100000, "n", ": iterations per worker. (default: 100000)");
        opt.appendOpt(&nrCategories, 4, "c", ": number of count categories and size categories. (default: 4)");
        opt.appendOpt(&maxSizeStr, "4k", "s", ": max size delta with unit suffix. (default: 4k)");
        opt.appendOpt(&intervalMs, 1000, "i", ": report interval [ms]. (default: 1000)");
        opt.appendBoolOpt(&isCached, "cached", ": reuse trackers instead of looking up the registry every time.");
        opt.appendOpt(&logPath, "-", "l", ": log output path. '-' for stderr. (default: '-')");
        opt.appendBoolOpt(&isDebug, "debug", ": put debug messages.");
        opt.appendHelp("h", ": put this message.");
        if (!opt.parse(argc, argv)) {
            opt.usage();
            ::exit(1);
        }
        if (nrThreads == 0) {
            throw cybozu::Exception(__func__) << "nrThreads must be > 0";
        }
        if (nrCategories == 0) {
            throw cybozu::Exception(__func__) << "nrCategories must be > 0";
        }
        if (intervalMs == 0) {
            throw cybozu::Exception(__func__) << "intervalMs must be > 0";
        }
        maxSize = util::parseSize(maxSizeStr);
        if (maxSize == 0 || maxSize > uint64_t(INT32_MAX)) {
            throw cybozu::Exception(__func__) << "bad max size" << maxSizeStr;
        }
    }
};

struct Names
{
    std::vector<std::string> countV;
    std::vector<std::string> sizeV;

    explicit Names(size_t nr) {
        for (size_t i = 0; i < nr; i++) {
            countV.push_back(util::formatString("count%zu", i));
            sizeV.push_back(util::formatString("size%zu", i));
        }
    }
};

/**
 * A business object with its count and size.
 */
struct Resource
{
    Count count;
    Size size;
};

class Worker
{
private:
    const Option &opt_;
    const Names &names_;
    StrRegistry &reg_;
    std::vector<Tracker> countTrackers_;
    std::vector<Tracker> sizeTrackers_;
    TaggedLogger logger_;
    std::mt19937_64 rand_;

    static const size_t MAX_LIVE = 16;

public:
    Worker(const Option &opt, const Names &names, StrRegistry &reg, size_t id)
        : opt_(opt), names_(names), reg_(reg)
        , countTrackers_(), sizeTrackers_()
        , logger_(util::formatString("worker%zu", id))
        , rand_(id) {
        if (opt_.isCached) {
            for (size_t i = 0; i < names_.countV.size(); i++) {
                countTrackers_.push_back(reg_.category(names_.countV[i]));
                sizeTrackers_.push_back(reg_.category(names_.sizeV[i]));
            }
        }
    }
    void run() {
        std::deque<Resource> liveQ;
        for (size_t i = 0; i < opt_.nrIter; i++) {
            const size_t k = rand_() % names_.countV.size();
            Resource res = create(k);
            res.size.add(randomSize());
            if (rand_() % 2 == 0) {
                res.size.set(randomSize());
            } else {
                res.size.subtract(randomSize());
            }
            liveQ.push_back(std::move(res));
            if (liveQ.size() > MAX_LIVE) liveQ.pop_front();
        }
        logger_.writeF(cybozu::LogDebug, "done %zu iterations, %zu live", opt_.nrIter, liveQ.size());
    }
private:
    Resource create(size_t k) {
        const int64_t initial = randomSize();
        if (opt_.isCached) {
            return Resource{countTrackers_[k].track(), sizeTrackers_[k].trackSized(initial)};
        }
        return Resource{reg_.category(names_.countV[k]).track(),
                reg_.category(names_.sizeV[k]).trackSized(initial)};
    }
    int64_t randomSize() {
        return int64_t(rand_() % (opt_.maxSize + 1));
    }
};

void verifyAllZero(const StrRegistry &reg)
{
    const CountVec<std::string> v = nonZeroCounts(reg);
    if (v.empty()) return;
    for (const std::pair<std::string, int64_t> &p : v) {
        LOGe("not zero %s %" PRId64 "", p.first.c_str(), p.second);
    }
    throw cybozu::Exception("verifyAllZero:not zero") << v.size() << "categories";
}

int doMain(int argc, char *argv[])
{
    Option opt(argc, argv);
    util::setLogSetting(util::LogSetting{opt.logPath, opt.isDebug});

    LOGi("start threads %zu iterations %zu categories %zu cached %d"
         , opt.nrThreads, opt.nrIter, opt.nrCategories, opt.isCached);
    LOGd("max size %" PRIu64 " interval %zu ms", opt.maxSize, opt.intervalMs);
    const size_t nrCpus = std::thread::hardware_concurrency();
    if (nrCpus != 0 && opt.nrThreads > nrCpus) {
        LOGw("threads %zu exceed cpus %zu", opt.nrThreads, nrCpus);
    }

    StrRegistry reg = newRegistry<std::string>();
    const Names names(opt.nrCategories);

    const std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
    std::vector<std::exception_ptr> epV;
    {
        ThreadSet thS;
        for (size_t i = 0; i < opt.nrThreads; i++) {
            thS.add([&, i]() {
                Worker worker(opt, names, reg, i);
                worker.run();
            });
        }
        size_t nrReports = 0;
        while (!thS.isAllEnd()) {
            util::sleepMs(opt.intervalMs);
            putCounts(LOGs, reg, "running");
            nrReports++;
        }
        epV = thS.join();
        if (nrReports == 1) {
            LOGw("finished within one report interval %zu ms", opt.intervalMs);
        }
    }
    const double elapsed = util::elapsedSec(begin);

    size_t nrFailed = 0;
    for (size_t i = 0; i < epV.size(); i++) {
        if (!epV[i]) continue;
        putErrorLogIfNecessary(epV[i], TaggedLogger(util::formatString("worker%zu", i)), "failed");
        nrFailed++;
    }
    if (nrFailed > 0) throw cybozu::Exception(__func__) << "failed workers" << nrFailed;

    putCounts(LOGs, reg, "finished");
    verifyAllZero(reg);
    LOGs.info() << "elapsed" << elapsed << "iterations/s"
                << (elapsed > 0 ? double(opt.nrThreads * opt.nrIter) / elapsed : 0.0);
    return 0;
}

RTRACK_DEFINE_MAIN("rtrack-stress")
