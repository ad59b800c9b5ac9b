#ifndef ZONE_LOG_LOGGER_HPP
#define ZONE_LOG_LOGGER_HPP

#include "core/log_common.hpp"
#include "core/log_level.hpp"
#include "core/log_record.hpp"
#include "log_manager.hpp"
#include "sink/sink_interface.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace zonelog {

    class LoggerConfiguration;

    /// Synchronous front end: filters by level and fans records out to
    /// every sink on the calling thread.
    ///
    /// Sinks must be added before the logger is shared between threads.
    /// log() may then be called concurrently; each sink serializes its own
    /// output. Write failures surface as IoError from log() and flush().
    class Logger {
    public:
        explicit Logger(LogLevel minLevel = LogLevel::INFO)
            : m_minLevel(minLevel) {}

        Logger(Logger &&other)
            : m_minLevel(other.m_minLevel.load(std::memory_order_relaxed))
            , m_target(std::move(other.m_target))
            , m_logManager(std::move(other.m_logManager)) {}

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;
        Logger &operator=(Logger &&) = delete;

        static LoggerConfiguration configure();

        void setMinLevel(LogLevel level) {
            m_minLevel.store(level, std::memory_order_relaxed);
        }

        LogLevel getMinLevel() const {
            return m_minLevel.load(std::memory_order_relaxed);
        }

        bool isEnabled(LogLevel level) const {
            return level >= getMinLevel();
        }

        /// Target attached by the level shortcuts (info(), warn(), ...).
        void setTarget(const std::string &target) { m_target = target; }
        const std::string &target() const { return m_target; }

        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args &&... args) {
            m_logManager.addSink(detail::make_unique<SinkType>(std::forward<Args>(args)...));
        }

        void addCustomSink(std::unique_ptr<ISink> sink) {
            m_logManager.addSink(std::move(sink));
        }

        size_t sinkCount() const { return m_logManager.sinkCount(); }

        void log(const LogRecord &record) {
            if (!isEnabled(record.level)) return;
            m_logManager.log(record);
        }

        void log(LogLevel level, const std::string &message) {
            if (!isEnabled(level)) return;
            m_logManager.log(LogRecord(level, m_target, message));
        }

        void log(LogLevel level, const std::string &target, const std::string &message) {
            if (!isEnabled(level)) return;
            m_logManager.log(LogRecord(level, target, message));
        }

        void trace(const std::string &message) { log(LogLevel::TRACE, message); }
        void debug(const std::string &message) { log(LogLevel::DEBUG, message); }
        void info(const std::string &message)  { log(LogLevel::INFO, message); }
        void warn(const std::string &message)  { log(LogLevel::WARN, message); }
        void error(const std::string &message) { log(LogLevel::ERROR, message); }
        void fatal(const std::string &message) { log(LogLevel::FATAL, message); }

        void flush() {
            m_logManager.flush();
        }

    private:
        std::atomic<LogLevel> m_minLevel;
        std::string m_target;
        LogManager m_logManager;
    };

} // namespace zonelog

#include "logger_configuration.hpp"

namespace zonelog {
    inline LoggerConfiguration Logger::configure() {
        return LoggerConfiguration();
    }
} // namespace zonelog

#endif // ZONE_LOG_LOGGER_HPP
