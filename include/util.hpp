#pragma once
/**
 * @file
 * @brief Utilities.
 */
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cctype>
#include "cybozu/exception.hpp"

#define DISABLE_COPY_AND_ASSIGN(ClassName)              \
    ClassName(const ClassName &rhs) = delete;           \
    ClassName &operator=(const ClassName &rhs) = delete

#define DISABLE_MOVE(ClassName)                     \
    ClassName(ClassName &&rhs) = delete;            \
    ClassName &operator=(ClassName &&rhs) = delete

namespace rtrack {
namespace util {

/**
 * printf-like formatting to std::string.
 * args is consumed.
 */
inline std::string formatStringV(const char *format, va_list args)
{
    va_list args2;
    va_copy(args2, args);
    const int len = ::vsnprintf(nullptr, 0, format, args2);
    va_end(args2);
    if (len < 0) throw cybozu::Exception("formatStringV:bad format") << format;
    std::vector<char> buf(size_t(len) + 1);
    ::vsnprintf(buf.data(), buf.size(), format, args);
    return std::string(buf.data(), size_t(len));
}

#ifdef __GNUC__
__attribute__((format(printf, 1, 2)))
#endif
inline std::string formatString(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    try {
        std::string s = formatStringV(format, args);
        va_end(args);
        return s;
    } catch (...) {
        va_end(args);
        throw;
    }
}

/**
 * Parse a byte size such as "512", "4k" or "16M".
 * Suffixes are powers of 1024 up to 'e'.
 */
inline uint64_t parseSize(const std::string &s)
{
    const char *const FUNC = "parseSize";
    size_t i = 0;
    uint64_t val = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        const uint64_t d = uint64_t(s[i] - '0');
        if (val > (UINT64_MAX - d) / 10) throw cybozu::Exception(FUNC) << "overflow" << s;
        val = val * 10 + d;
        i++;
    }
    if (i == 0) throw cybozu::Exception(FUNC) << "no digits" << s;
    if (i == s.size()) return val;
    if (i + 1 != s.size()) throw cybozu::Exception(FUNC) << "bad suffix" << s;

    static const char units[] = "kmgtpe";
    int shift = 0;
    for (const char *p = units; *p != '\0'; p++) {
        shift += 10;
        if (std::tolower(static_cast<unsigned char>(s[i])) == *p) {
            if (val > (UINT64_MAX >> shift)) throw cybozu::Exception(FUNC) << "overflow" << s;
            return val << shift;
        }
    }
    throw cybozu::Exception(FUNC) << "bad suffix" << s;
}

} //namespace util
} //namespace rtrack
