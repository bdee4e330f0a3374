#ifndef CASCADE_LOG_MACROS_HPP
#define CASCADE_LOG_MACROS_HPP

#ifndef CASCADE_LOG_NO_MACROS

// Level check first: the message expression is not evaluated when the
// logger's effective level filters the record out.
#define CASCADE_LOG(logger, level, message) \
    do { \
        const auto& cascade_log_ref_ = (logger); \
        auto cascade_log_lvl_ = (level); \
        if (cascade_log_ref_.isEnabled(cascade_log_lvl_)) { \
            (void)cascade_log_ref_.log(cascade_log_lvl_, (message)); \
        } \
    } while (0)

#define CASCADE_TRACE(logger, message) CASCADE_LOG((logger), ::cascade::LogLevel::TRACE, (message))
#define CASCADE_DEBUG(logger, message) CASCADE_LOG((logger), ::cascade::LogLevel::DEBUG, (message))
#define CASCADE_INFO(logger, message)  CASCADE_LOG((logger), ::cascade::LogLevel::INFO,  (message))
#define CASCADE_WARN(logger, message)  CASCADE_LOG((logger), ::cascade::LogLevel::WARN,  (message))
#define CASCADE_ERROR(logger, message) CASCADE_LOG((logger), ::cascade::LogLevel::ERROR, (message))
#define CASCADE_FATAL(logger, message) CASCADE_LOG((logger), ::cascade::LogLevel::FATAL, (message))

#endif // CASCADE_LOG_NO_MACROS

#endif // CASCADE_LOG_MACROS_HPP
