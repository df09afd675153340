#include "rtrack_util.hpp"
#include <cstdio>

namespace rtrack {
namespace util {

void setLogSetting(const LogSetting &setting)
{
    if (setting.path == "-") {
        cybozu::SetLogFILE(::stderr);
    } else {
        cybozu::OpenLogFile(setting.path);
    }
    cybozu::SetLogUseMsec(true);
    cybozu::SetLogPriority(setting.isDebug ? cybozu::LogDebug : cybozu::LogInfo);
}

int runMain(int (*doMain)(int, char *[]), int argc, char *argv[], const char *progName) noexcept
{
    std::exception_ptr ep;
    try {
        setLogSetting(LogSetting{"-", false});
        return doMain(argc, argv);
    } catch (...) {
        ep = std::current_exception();
    }
    putErrorLogIfNecessary(ep, TaggedLogger(progName), "exit");
    return 1;
}

}} // rtrack::util
