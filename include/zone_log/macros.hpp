#ifndef ZONE_LOG_MACROS_HPP
#define ZONE_LOG_MACROS_HPP

#ifndef ZONE_LOG_NO_MACROS

// Module path recorded with each record. Define before including to
// replace the source file name with something else (e.g. a component name).
#ifndef ZONE_LOG_MODULE_PATH
#define ZONE_LOG_MODULE_PATH __FILE__
#endif

// Generic macro --- level check avoids evaluating the message when disabled
#define ZONE_LOG(logger, level, target, message) \
    do { \
        auto& zone_log_ref_ = (logger); \
        auto  zone_log_lvl_ = (level); \
        if (zone_log_ref_.isEnabled(zone_log_lvl_)) { \
            zone_log_ref_.log(::zonelog::LogRecord( \
                zone_log_lvl_, ZONE_LOG_MODULE_PATH, \
                (target), (message))); \
        } \
    } while (0)

#define ZONE_TRACE(logger, target, message) ZONE_LOG((logger), ::zonelog::LogLevel::TRACE, (target), (message))
#define ZONE_DEBUG(logger, target, message) ZONE_LOG((logger), ::zonelog::LogLevel::DEBUG, (target), (message))
#define ZONE_INFO(logger, target, message)  ZONE_LOG((logger), ::zonelog::LogLevel::INFO,  (target), (message))
#define ZONE_WARN(logger, target, message)  ZONE_LOG((logger), ::zonelog::LogLevel::WARN,  (target), (message))
#define ZONE_ERROR(logger, target, message) ZONE_LOG((logger), ::zonelog::LogLevel::ERROR, (target), (message))
#define ZONE_FATAL(logger, target, message) ZONE_LOG((logger), ::zonelog::LogLevel::FATAL, (target), (message))

#endif // ZONE_LOG_NO_MACROS

#endif // ZONE_LOG_MACROS_HPP
