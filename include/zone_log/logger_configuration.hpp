#ifndef ZONE_LOG_LOGGER_CONFIGURATION_HPP
#define ZONE_LOG_LOGGER_CONFIGURATION_HPP

// This header is included internally by logger.hpp AFTER the Logger
// class definition.  It must not be included directly — use zone_log.hpp.

#include "core/log_common.hpp"
#include "core/log_level.hpp"
#include "sink/sink_interface.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace zonelog {

    /// Environment variable consulted by minLevelFromEnv() by default.
    static const char *const kLevelEnvVar = "ZONE_LOG_LEVEL";

    /// Fluent builder for constructing a fully-configured Logger.
    ///
    /// Usage:
    /// @code
    ///   auto log = Logger::configure()
    ///       .minLevelFromEnv()                     // ZONE_LOG_LEVEL, default info
    ///       .target("net")
    ///       .writeTo<ConsoleSink>(ConsoleStream::StdErr, policy)
    ///       .build();
    /// @endcode
    class LoggerConfiguration {
    public:
        LoggerConfiguration()
            : m_minLevel(LogLevel::INFO)
            , m_built(false) {}

        LoggerConfiguration(const LoggerConfiguration&) = delete;
        LoggerConfiguration& operator=(const LoggerConfiguration&) = delete;
        LoggerConfiguration(LoggerConfiguration&&) = default;
        LoggerConfiguration& operator=(LoggerConfiguration&&) = default;

        LoggerConfiguration& minLevel(LogLevel level) {
            m_minLevel = level;
            return *this;
        }

        /// Take the minimum level from @p envVar; fall back to @p fallback
        /// when it is unset, empty or not a level name.
        LoggerConfiguration& minLevelFromEnv(const char* envVar = kLevelEnvVar,
                                             LogLevel fallback = LogLevel::INFO) {
            m_minLevel = levelFromEnv(envVar, fallback);
            return *this;
        }

        LoggerConfiguration& target(const std::string& name) {
            m_target = name;
            return *this;
        }

        /// Add a sink.  SFINAE: only viable when SinkType is an ISink
        /// constructible from Args.
        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            LoggerConfiguration&
        >::type
        writeTo(Args&&... args) {
            m_sinks.push_back(detail::make_unique<SinkType>(
                std::forward<Args>(args)...));
            return *this;
        }

        LoggerConfiguration& writeTo(std::unique_ptr<ISink> sink) {
            if (!sink) {
                throw std::invalid_argument("LoggerConfiguration::writeTo: null sink");
            }
            m_sinks.push_back(std::move(sink));
            return *this;
        }

        /// Create the Logger.  The configuration is consumed; calling
        /// build() a second time throws std::logic_error.
        Logger build() {
            if (m_built) {
                throw std::logic_error("LoggerConfiguration::build() called twice");
            }
            m_built = true;

            Logger logger(m_minLevel);
            logger.setTarget(m_target);
            for (auto& sink : m_sinks) {
                logger.addCustomSink(std::move(sink));
            }
            m_sinks.clear();
            return logger;
        }

    private:
        LogLevel m_minLevel;
        std::string m_target;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        bool m_built;
    };

} // namespace zonelog

#endif // ZONE_LOG_LOGGER_CONFIGURATION_HPP
