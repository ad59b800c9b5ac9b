#ifndef ZONE_LOG_UTC_OFFSET_HPP
#define ZONE_LOG_UTC_OFFSET_HPP

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace zonelog {
namespace detail {
    inline void toLocalTm(std::time_t t, std::tm &out) {
#if defined(_MSC_VER)
        localtime_s(&out, &t);
#else
        localtime_r(&t, &out);
#endif
    }

    inline void toUtcTm(std::time_t t, std::tm &out) {
#if defined(_MSC_VER)
        gmtime_s(&out, &t);
#else
        gmtime_r(&t, &out);
#endif
    }

    /// Local UTC offset in seconds in effect at @p t.
    inline int localUtcOffsetAt(std::time_t t) {
        std::tm localTm;
        std::tm utcTm;
        toLocalTm(t, localTm);
        toUtcTm(t, utcTm);

        // The two broken-down times are at most one day apart.
        int dayDiff = localTm.tm_yday - utcTm.tm_yday;
        if (localTm.tm_year != utcTm.tm_year) {
            dayDiff = (localTm.tm_year > utcTm.tm_year) ? 1 : -1;
        }
        return dayDiff * 86400
            + (localTm.tm_hour - utcTm.tm_hour) * 3600
            + (localTm.tm_min - utcTm.tm_min) * 60
            + (localTm.tm_sec - utcTm.tm_sec);
    }
} // namespace detail

    /// A UTC offset that never changes once resolved.
    ///
    /// Valid offsets lie strictly between -24h and +24h. A local offset is
    /// captured at the instant local() is called and does not follow later
    /// daylight-saving transitions.
    class FixedOffset {
    public:
        static const int kSecondsPerDay = 86400;

        static bool isValid(int seconds) {
            return seconds > -kSecondsPerDay && seconds < kSecondsPerDay;
        }

        /// @throws std::invalid_argument if @p seconds is not a valid offset.
        static FixedOffset east(int seconds) {
            if (!isValid(seconds)) {
                throw std::invalid_argument(
                    "UTC offset out of range: " + std::to_string(seconds) + "s");
            }
            return FixedOffset(seconds);
        }

        static FixedOffset utc() { return FixedOffset(0); }

        static FixedOffset local() {
            return FixedOffset(detail::localUtcOffsetAt(
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())));
        }

        int seconds() const { return m_seconds; }

        /// "+HH:MM" (withColon) or "+HHMM". Sub-minute seconds are not shown.
        std::string toString(bool withColon = true) const {
            int total = m_seconds;
            char sign = '+';
            if (total < 0) {
                sign = '-';
                total = -total;
            }
            char buf[16];
            std::snprintf(buf, sizeof(buf), withColon ? "%c%02d:%02d" : "%c%02d%02d",
                          sign, total / 3600, (total % 3600) / 60);
            return std::string(buf);
        }

        bool operator==(const FixedOffset &other) const { return m_seconds == other.m_seconds; }
        bool operator!=(const FixedOffset &other) const { return m_seconds != other.m_seconds; }

    private:
        explicit FixedOffset(int seconds) : m_seconds(seconds) {}

        int m_seconds;
    };
} // namespace zonelog

#endif // ZONE_LOG_UTC_OFFSET_HPP
