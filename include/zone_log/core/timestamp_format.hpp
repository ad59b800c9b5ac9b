#ifndef ZONE_LOG_TIMESTAMP_FORMAT_HPP
#define ZONE_LOG_TIMESTAMP_FORMAT_HPP

#include "utc_offset.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace zonelog {
    /// Requested fractional-second resolution of rendered timestamps.
    enum class TimestampPrecision {
        Seconds,
        Millis,
        Micros,
        Nanos
    };

    static const char *const kTimestampFormatSeconds = "%Y-%m-%d %H:%M:%S %:z";
    static const char *const kTimestampFormatMillis  = "%Y-%m-%d %H:%M:%S%.3f %:z";
    static const char *const kTimestampFormatMicros  = "%Y-%m-%d %H:%M:%S%.6f %:z";

    /// Nanos deliberately shares the microsecond pattern.
    inline const char *timestampFormatFor(TimestampPrecision precision) {
        switch (precision) {
            case TimestampPrecision::Seconds: return kTimestampFormatSeconds;
            case TimestampPrecision::Millis:  return kTimestampFormatMillis;
            case TimestampPrecision::Micros:  return kTimestampFormatMicros;
            case TimestampPrecision::Nanos:   return kTimestampFormatMicros;
            default: return kTimestampFormatMillis;
        }
    }

namespace detail {
    inline void appendStrftime(std::string &out, const std::string &pattern, const std::tm &tmBuf) {
        if (pattern.empty()) return;
        // strftime returns 0 when the buffer is too small; directives expand
        // to at most a few dozen characters, so this is generous.
        std::vector<char> buf(pattern.size() * 8 + 64);
        size_t written = std::strftime(buf.data(), buf.size(), pattern.c_str(), &tmBuf);
        if (written > 0) out.append(buf.data(), written);
    }

    inline void appendFraction(std::string &out, long long nanos, int digits) {
        long long divisor = 1;
        for (int i = digits; i < 9; ++i) divisor *= 10;

        char buf[16];
        std::snprintf(buf, sizeof(buf), ".%0*lld", digits, nanos / divisor);
        out += buf;
    }
} // namespace detail

    /// Format @p tp as wall-clock time at @p offset.
    ///
    /// Pattern syntax is strftime plus:
    ///   %.Nf  fractional seconds truncated to N digits (1-9), dot included
    ///   %:z   offset as +HH:MM
    ///   %z    offset as +HHMM
    /// Everything else is handed to strftime over the shifted UTC time, so
    /// %Z is not meaningful for a fixed offset.
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &tp,
                                       const FixedOffset &offset,
                                       const std::string &pattern) {
        long long totalNanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
            tp.time_since_epoch()).count();
        long long secs = totalNanos / 1000000000LL;
        long long nanos = totalNanos % 1000000000LL;
        if (nanos < 0) {
            nanos += 1000000000LL;
            --secs;
        }

        std::tm tmBuf;
        detail::toUtcTm(static_cast<std::time_t>(secs + offset.seconds()), tmBuf);

        std::string result;
        result.reserve(pattern.size() + 16);
        std::string chunk;

        size_t i = 0;
        const size_t n = pattern.size();
        while (i < n) {
            if (pattern[i] != '%' || i + 1 >= n) {
                chunk += pattern[i];
                ++i;
                continue;
            }

            char next = pattern[i + 1];
            if (next == '.' && i + 3 < n
                && std::isdigit(static_cast<unsigned char>(pattern[i + 2]))
                && pattern[i + 2] != '0'
                && pattern[i + 3] == 'f') {
                detail::appendStrftime(result, chunk, tmBuf);
                chunk.clear();
                detail::appendFraction(result, nanos, pattern[i + 2] - '0');
                i += 4;
            } else if (next == ':' && i + 2 < n && pattern[i + 2] == 'z') {
                detail::appendStrftime(result, chunk, tmBuf);
                chunk.clear();
                result += offset.toString(true);
                i += 3;
            } else if (next == 'z') {
                detail::appendStrftime(result, chunk, tmBuf);
                chunk.clear();
                result += offset.toString(false);
                i += 2;
            } else {
                // Keep the pair together so "%%" never splits across chunks.
                chunk += pattern[i];
                chunk += next;
                i += 2;
            }
        }
        detail::appendStrftime(result, chunk, tmBuf);
        return result;
    }
} // namespace zonelog

#endif // ZONE_LOG_TIMESTAMP_FORMAT_HPP
