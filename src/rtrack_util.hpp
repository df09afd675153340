#pragma once
/**
 * @file
 * @brief Helpers shared by rtrack tools.
 */
#include <chrono>
#include <string>
#include <thread>
#include "util.hpp"
#include "rtrack_logger.hpp"

namespace rtrack {
namespace util {

/**
 * Log destination and threshold for a tool.
 * path "-" means stderr.
 */
struct LogSetting
{
    std::string path;
    bool isDebug;
};

void setLogSetting(const LogSetting &setting);

inline void sleepMs(size_t ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

inline double elapsedSec(std::chrono::steady_clock::time_point begin)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
}

/**
 * Log to stderr until doMain changes the setting.
 * An exception escaping doMain is put with the program name and gives exit code 1.
 */
int runMain(int (*doMain)(int, char *[]), int argc, char *argv[], const char *progName) noexcept;

}} // rtrack::util

#define RTRACK_DEFINE_MAIN(progName)                                    \
    int main(int argc, char *argv[]) {                                  \
        return rtrack::util::runMain(doMain, argc, argv, progName);     \
    }
