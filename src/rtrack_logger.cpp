#include "rtrack_logger.hpp"

namespace rtrack {

void Logger::writeF(cybozu::LogPriority pri, const char *format, ...) const noexcept
{
    va_list args;
    va_start(args, format);
    try {
        writeS(pri, util::formatStringV(format, args));
    } catch (std::exception &) {
        write(pri, format);
    }
    va_end(args);
}

const char *priorityName(cybozu::LogPriority pri) noexcept
{
    switch (pri) {
    case cybozu::LogDebug: return "DEBUG";
    case cybozu::LogInfo: return "INFO";
    case cybozu::LogWarning: return "WARNING";
    case cybozu::LogError: return "ERROR";
    default: return "UNKNOWN";
    }
}

void putErrorLogIfNecessary(std::exception_ptr ep, const Logger &logger, const char *msg) noexcept
{
    if (!ep) return;
    try {
        std::rethrow_exception(ep);
    } catch (std::exception &e) {
        logger.writeF(cybozu::LogError, "%s:%s", msg, e.what());
    } catch (...) {
        logger.writeF(cybozu::LogError, "%s:unknown error", msg);
    }
}

} //namespace rtrack
