#ifndef ZONE_LOG_LEVEL_STYLE_HPP
#define ZONE_LOG_LEVEL_STYLE_HPP

#include "../core/log_level.hpp"

namespace zonelog {
    /// Start/reset markers wrapped around a styled header field.
    ///
    /// Markers are emitted verbatim around the field; the field text itself
    /// is never altered. Implementations must be stateless or immutable,
    /// as one instance is shared by every render call.
    class ILevelStyle {
    public:
        virtual ~ILevelStyle() = default;

        virtual const char *start(LogLevel level) const = 0;
        virtual const char *reset(LogLevel level) const = 0;
    };

    /// No markers. Used for files, pipes and tests.
    class PlainStyle : public ILevelStyle {
    public:
        const char *start(LogLevel) const override { return ""; }
        const char *reset(LogLevel) const override { return ""; }
    };

    /// ANSI SGR colors per level.
    class AnsiStyle : public ILevelStyle {
    public:
        const char *start(LogLevel level) const override {
            return getColorCode(level);
        }

        const char *reset(LogLevel) const override {
            return "\033[0m";
        }

        /// Return the ANSI escape code for a log level.
        static const char *getColorCode(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE: return "\033[2m";      // dim
                case LogLevel::DEBUG: return "\033[36m";     // cyan
                case LogLevel::INFO:  return "\033[32m";     // green
                case LogLevel::WARN:  return "\033[33m";     // yellow
                case LogLevel::ERROR: return "\033[31m";     // red
                case LogLevel::FATAL: return "\033[1;31m";   // bold red
                default: return "";
            }
        }
    };
} // namespace zonelog

#endif // ZONE_LOG_LEVEL_STYLE_HPP
