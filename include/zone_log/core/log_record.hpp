#ifndef ZONE_LOG_RECORD_HPP
#define ZONE_LOG_RECORD_HPP

#include "log_level.hpp"
#include <string>
#include <utility>

namespace zonelog {
    /// A single log event as handed to formatters.
    ///
    /// The module path is optional; hasModulePath distinguishes an absent
    /// path from an empty one. An empty target means "no target".
    struct LogRecord {
        LogLevel level;
        bool hasModulePath;
        std::string modulePath;
        std::string target;
        std::string message;

        LogRecord()
            : level(LogLevel::INFO), hasModulePath(false) {}

        LogRecord(LogLevel lvl, std::string tgt, std::string msg)
            : level(lvl)
            , hasModulePath(false)
            , target(std::move(tgt))
            , message(std::move(msg)) {}

        LogRecord(LogLevel lvl, std::string module, std::string tgt, std::string msg)
            : level(lvl)
            , hasModulePath(true)
            , modulePath(std::move(module))
            , target(std::move(tgt))
            , message(std::move(msg)) {}
    };
} // namespace zonelog

#endif // ZONE_LOG_RECORD_HPP
