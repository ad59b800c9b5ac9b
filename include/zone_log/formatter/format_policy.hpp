#ifndef ZONE_LOG_FORMAT_POLICY_HPP
#define ZONE_LOG_FORMAT_POLICY_HPP

#include "../core/timestamp_format.hpp"
#include "../core/utc_offset.hpp"
#include <cstddef>
#include <string>

namespace zonelog {

    class FormatPolicyBuilder;

    /// Immutable line-format settings shared by every render call.
    ///
    /// The UTC offset is resolved once, at construction. An explicit offset
    /// outside (-24h, +24h) is NOT an error: it silently falls back to the
    /// machine's local offset at that instant, exactly as if no offset had
    /// been given. Callers that need to know must check FixedOffset::isValid
    /// themselves.
    ///
    /// Defaults: millisecond timestamps, local offset, timestamp + level +
    /// target shown, module path hidden, 4-space continuation indent, "\n"
    /// terminator.
    ///
    /// Thread safety: no member is mutated after construction, so a policy
    /// may be read from any number of threads without locking.
    class FormatPolicy {
    public:
        FormatPolicy()
            : FormatPolicy(false, 0, false, TimestampPrecision::Millis) {}

        explicit FormatPolicy(int offsetSeconds)
            : FormatPolicy(true, offsetSeconds, false, TimestampPrecision::Millis) {}

        explicit FormatPolicy(TimestampPrecision precision)
            : FormatPolicy(false, 0, true, precision) {}

        FormatPolicy(int offsetSeconds, TimestampPrecision precision)
            : FormatPolicy(true, offsetSeconds, true, precision) {}

        /// Fluent builder for the non-default toggles.
        static FormatPolicyBuilder configure();

        const char *timestampFormat() const { return m_timestampFormat; }
        const FixedOffset &utcOffset() const { return m_offset; }

        bool showTimestamp() const { return m_showTimestamp; }
        bool showLevel() const { return m_showLevel; }
        bool showModulePath() const { return m_showModulePath; }
        bool showTarget() const { return m_showTarget; }

        /// False when continuation lines are written verbatim.
        bool hasIndent() const { return m_hasIndent; }
        size_t indentWidth() const { return m_indentWidth; }

        const std::string &lineTerminator() const { return m_lineTerminator; }

    private:
        friend class FormatPolicyBuilder;

        FormatPolicy(bool hasOffset, int offsetSeconds,
                     bool hasPrecision, TimestampPrecision precision)
            : m_timestampFormat(hasPrecision ? timestampFormatFor(precision)
                                             : kTimestampFormatMillis)
            , m_offset(resolveOffset(hasOffset, offsetSeconds))
            , m_showTimestamp(true)
            , m_showLevel(true)
            , m_showModulePath(false)
            , m_showTarget(true)
            , m_hasIndent(true)
            , m_indentWidth(4)
            , m_lineTerminator("\n") {}

        static FixedOffset resolveOffset(bool hasOffset, int offsetSeconds) {
            if (hasOffset && FixedOffset::isValid(offsetSeconds)) {
                return FixedOffset::east(offsetSeconds);
            }
            return FixedOffset::local();
        }

        const char *m_timestampFormat;
        FixedOffset m_offset;
        bool m_showTimestamp;
        bool m_showLevel;
        bool m_showModulePath;
        bool m_showTarget;
        bool m_hasIndent;
        size_t m_indentWidth;
        std::string m_lineTerminator;
    };

    /// Usage:
    /// @code
    ///   auto policy = zonelog::FormatPolicy::configure()
    ///       .utcOffset(8 * 3600)
    ///       .precision(zonelog::TimestampPrecision::Micros)
    ///       .showModulePath(true)
    ///       .build();
    /// @endcode
    class FormatPolicyBuilder {
    public:
        FormatPolicyBuilder()
            : m_hasOffset(false)
            , m_offsetSeconds(0)
            , m_hasPrecision(false)
            , m_precision(TimestampPrecision::Millis)
            , m_showTimestamp(true)
            , m_showLevel(true)
            , m_showModulePath(false)
            , m_showTarget(true)
            , m_hasIndent(true)
            , m_indentWidth(4)
            , m_lineTerminator("\n") {}

        /// Invalid values are accepted here and fall back to the local
        /// offset in build().
        FormatPolicyBuilder &utcOffset(int seconds) {
            m_hasOffset = true;
            m_offsetSeconds = seconds;
            return *this;
        }

        FormatPolicyBuilder &localOffset() {
            m_hasOffset = false;
            return *this;
        }

        FormatPolicyBuilder &precision(TimestampPrecision p) {
            m_hasPrecision = true;
            m_precision = p;
            return *this;
        }

        FormatPolicyBuilder &showTimestamp(bool show) {
            m_showTimestamp = show;
            return *this;
        }

        FormatPolicyBuilder &showLevel(bool show) {
            m_showLevel = show;
            return *this;
        }

        FormatPolicyBuilder &showModulePath(bool show) {
            m_showModulePath = show;
            return *this;
        }

        FormatPolicyBuilder &showTarget(bool show) {
            m_showTarget = show;
            return *this;
        }

        FormatPolicyBuilder &indent(size_t width) {
            m_hasIndent = true;
            m_indentWidth = width;
            return *this;
        }

        FormatPolicyBuilder &noIndent() {
            m_hasIndent = false;
            return *this;
        }

        FormatPolicyBuilder &lineTerminator(const std::string &terminator) {
            m_lineTerminator = terminator;
            return *this;
        }

        FormatPolicy build() const {
            FormatPolicy policy(m_hasOffset, m_offsetSeconds, m_hasPrecision, m_precision);
            policy.m_showTimestamp = m_showTimestamp;
            policy.m_showLevel = m_showLevel;
            policy.m_showModulePath = m_showModulePath;
            policy.m_showTarget = m_showTarget;
            policy.m_hasIndent = m_hasIndent;
            policy.m_indentWidth = m_indentWidth;
            policy.m_lineTerminator = m_lineTerminator;
            return policy;
        }

    private:
        bool m_hasOffset;
        int m_offsetSeconds;
        bool m_hasPrecision;
        TimestampPrecision m_precision;
        bool m_showTimestamp;
        bool m_showLevel;
        bool m_showModulePath;
        bool m_showTarget;
        bool m_hasIndent;
        size_t m_indentWidth;
        std::string m_lineTerminator;
    };

    inline FormatPolicyBuilder FormatPolicy::configure() {
        return FormatPolicyBuilder();
    }

} // namespace zonelog

#endif // ZONE_LOG_FORMAT_POLICY_HPP
