#pragma once
/**
 * @file
 * @brief Loggers on top of cybozu logger.
 */
#include "cybozu/log.hpp"
#include "util.hpp"
#include <exception>
#include <sstream>
#include <string>
#include <cstdarg>

#define LOGd(...) LOGd2(__VA_ARGS__, "")
#define LOGd2(fmt, ...) \
    cybozu::PutLog(cybozu::LogDebug, "DEBUG (%s:%d) " fmt "%s", __func__, __LINE__, __VA_ARGS__)
#define LOGi(...) cybozu::PutLog(cybozu::LogInfo, "INFO " __VA_ARGS__)
#define LOGw(...) cybozu::PutLog(cybozu::LogWarning, "WARNING " __VA_ARGS__)
#define LOGe(...) cybozu::PutLog(cybozu::LogError, "ERROR " __VA_ARGS__)

#define LOGs rtrack::SimpleLogger()

namespace rtrack {

/**
 * Where the lines go is decided by cybozu logger settings.
 * See util::setLogSetting().
 */
class Logger
{
public:
    virtual ~Logger() noexcept = default;
    virtual void write(cybozu::LogPriority pri, const char *msg) const noexcept = 0;

    void writeS(cybozu::LogPriority pri, const std::string &msg) const noexcept {
        write(pri, msg.c_str());
    }
    void writeF(cybozu::LogPriority pri, const char *format, ...) const noexcept
#ifdef __GNUC__
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    /**
     * One log line built with operator<<.
     * Items are joined with ':' and written when the line is destroyed.
     * Nothing is written if no item was given.
     */
    class Line
    {
    private:
        const Logger &logger_;
        cybozu::LogPriority pri_;
        std::ostringstream os_;
        bool isEmpty_;
    public:
        Line(const Logger &logger, cybozu::LogPriority pri)
            : logger_(logger), pri_(pri), os_(), isEmpty_(true) {}
        Line(Line &&rhs)
            : logger_(rhs.logger_), pri_(rhs.pri_), os_(), isEmpty_(rhs.isEmpty_) {
            os_ << rhs.os_.str();
            rhs.isEmpty_ = true;
        }
        ~Line() noexcept {
            if (isEmpty_) return;
            try {
                logger_.writeS(pri_, os_.str());
            } catch (std::exception &) {
                logger_.write(pri_, "Logger::Line: lost a line.");
            }
        }
        template <typename T>
        Line &operator<<(const T &t) {
            if (!isEmpty_) os_ << ':';
            os_ << t;
            isEmpty_ = false;
            return *this;
        }
    };

    Line info() const { return Line(*this, cybozu::LogInfo); }
    Line error() const { return Line(*this, cybozu::LogError); }
};

const char *priorityName(cybozu::LogPriority pri) noexcept;

/**
 * Lines go to the cybozu logger with the priority name.
 */
class SimpleLogger : public Logger
{
public:
    void write(cybozu::LogPriority pri, const char *msg) const noexcept override {
        cybozu::PutLog(pri, "%s %s", priorityName(pri), msg);
    }
};

/**
 * SimpleLogger with "[tag]" after the priority name, e.g. a worker name.
 */
class TaggedLogger : public Logger
{
private:
    std::string tag_;
public:
    explicit TaggedLogger(const std::string &tag) : tag_(tag) {}
    void write(cybozu::LogPriority pri, const char *msg) const noexcept override {
        cybozu::PutLog(pri, "%s [%s] %s", priorityName(pri), tag_.c_str(), msg);
    }
};

/**
 * Put "msg:what()" as an error if ep holds an exception.
 */
void putErrorLogIfNecessary(std::exception_ptr ep, const Logger &logger, const char *msg) noexcept;

} //namespace rtrack
