#ifndef ZONE_LOG_LEVEL_HPP
#define ZONE_LOG_LEVEL_HPP

#include <cctype>
#include <cstdlib>
#include <string>

namespace zonelog {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    /// Parse a level name, case-insensitively. "warning" is accepted as
    /// an alias for WARN. Leading and trailing blanks are ignored.
    /// Returns false (leaving @p out untouched) for anything else.
    inline bool parseLevel(const std::string &text, LogLevel &out) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

        std::string name;
        name.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
        }

        if (name == "trace") { out = LogLevel::TRACE; return true; }
        if (name == "debug") { out = LogLevel::DEBUG; return true; }
        if (name == "info")  { out = LogLevel::INFO;  return true; }
        if (name == "warn" || name == "warning") { out = LogLevel::WARN; return true; }
        if (name == "error") { out = LogLevel::ERROR; return true; }
        if (name == "fatal") { out = LogLevel::FATAL; return true; }
        return false;
    }

    /// Read the minimum level from environment variable @p name.
    /// Unset, empty or unrecognised values yield @p fallback.
    inline LogLevel levelFromEnv(const char *name, LogLevel fallback) {
        const char *value = std::getenv(name);
        if (value == nullptr || value[0] == '\0') return fallback;

        LogLevel parsed = fallback;
        if (!parseLevel(value, parsed)) return fallback;
        return parsed;
    }
} // namespace zonelog

#endif // ZONE_LOG_LEVEL_HPP
