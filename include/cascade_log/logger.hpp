#ifndef CASCADE_LOG_LOGGER_HPP
#define CASCADE_LOG_LOGGER_HPP

#include "logging_context.hpp"
#include "core/message_value.hpp"
#include <string>

namespace cascade {

    /// Name used by a Logger constructed without one.
    static const char *const kDefaultLoggerName = "cascade";

    /// Lightweight named handle onto a LoggingContext. Holds no resources
    /// beyond its name; copy freely. The context must outlive the handle.
    class Logger {
    public:
        explicit Logger(const LoggingContext &context, const std::string &name = kDefaultLoggerName)
            : m_context(&context), m_name(name.empty() ? std::string(kDefaultLoggerName) : name) {}

        const std::string &name() const { return m_name; }

        bool isEnabled(LogLevel level) const {
            return m_context->isEnabled(m_name, level);
        }

        /// Log at an explicit level. The message is only converted to text
        /// once the level check has passed.
        Status log(LogLevel level, const MessageValue &message) const {
            if (!isEnabled(level)) {
                if (!m_context->isInitialized()) {
                    return Status(StatusCode::NotInitialized, "logging is not initialized");
                }
                return Status::success();
            }
            return m_context->log(m_name, level, message.toMessageString());
        }

        /// Plain log() uses DEBUG.
        Status log(const MessageValue &message) const { return log(LogLevel::DEBUG, message); }

        Status trace(const MessageValue &message) const { return log(LogLevel::TRACE, message); }
        Status debug(const MessageValue &message) const { return log(LogLevel::DEBUG, message); }
        Status info(const MessageValue &message) const { return log(LogLevel::INFO, message); }
        Status warn(const MessageValue &message) const { return log(LogLevel::WARN, message); }
        Status error(const MessageValue &message) const { return log(LogLevel::ERROR, message); }
        Status fatal(const MessageValue &message) const { return log(LogLevel::FATAL, message); }

    private:
        const LoggingContext *m_context;
        std::string m_name;
    };

} // namespace cascade

#endif // CASCADE_LOG_LOGGER_HPP
