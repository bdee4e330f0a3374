#ifndef CASCADE_LOG_LOGGING_CONTEXT_HPP
#define CASCADE_LOG_LOGGING_CONTEXT_HPP

#include "core/log_common.hpp"
#include "core/log_level.hpp"
#include "core/log_record.hpp"
#include "core/logger_registry.hpp"
#include "core/error_reporter.hpp"
#include "core/errors.hpp"
#include "appender/appender_set.hpp"
#include "appender/appender_factory.hpp"
#include "config/logging_config.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace cascade {

    /// Everything one initialize() call publishes. Never modified after
    /// publication except for the final close of its appenders.
    struct LoggingState {
        explicit LoggingState(std::shared_ptr<const ErrorReporter> reporter)
            : appenders(std::move(reporter)) {}

        LoggerRegistry registry;
        AppenderSet appenders;
    };

    /// Owner of one logging configuration: logger levels plus appenders.
    ///
    /// Usage:
    /// @code
    ///   cascade::LoggingContext ctx("/var/lib/myapp");
    ///   cascade::Status st = ctx.initialize(cascade::LoggingConfig()
    ///       .appender(cascade::AppenderConfig::makeDailyRollingFile("log/app.log"))
    ///       .logger("myapp", cascade::LogLevel::INFO));
    ///   ctx.log("myapp.db", cascade::LogLevel::INFO, "connected");
    ///   ctx.shutdown();
    /// @endcode
    ///
    /// Thread safety: log() loads the published state with one atomic
    /// shared_ptr read and never takes a context-wide lock, so concurrent
    /// callers do not serialize on level resolution. initialize() and
    /// shutdown() serialize with each other, swap the published state and
    /// then close the previous appenders; closing waits for the write each
    /// appender has in flight, and later writes to a closed appender are
    /// dropped.
    class LoggingContext {
    public:
        /// Relative file paths resolve against the executable's directory.
        LoggingContext()
            : m_baseDir(detail::executableDirectory())
            , m_reporter(std::make_shared<ErrorReporter>()) {}

        /// Relative file paths resolve against @p baseDir.
        explicit LoggingContext(const std::string &baseDir)
            : m_baseDir(baseDir)
            , m_reporter(std::make_shared<ErrorReporter>()) {}

        ~LoggingContext() {
            shutdown();
        }

        LoggingContext(const LoggingContext &) = delete;
        LoggingContext &operator=(const LoggingContext &) = delete;

        /// Replace the whole configuration. All-or-nothing: on a
        /// ConfigurationError the previous state stays active.
        Status initialize(const LoggingConfig &config) {
            std::shared_ptr<LoggingState> next;
            try {
                next = buildState(config);
            } catch (const ConfigurationError &e) {
                return Status::fromException(e);
            }

            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            std::shared_ptr<LoggingState> previous = std::atomic_exchange(&m_state, next);
            if (previous) previous->appenders.close();
            return Status::success();
        }

        /// Parse the JSON payload, then initialize().
        Status initialize(const nlohmann::json &config) {
            LoggingConfig parsed;
            try {
                parsed = LoggingConfig::fromJson(config);
            } catch (const ConfigurationError &e) {
                return Status::fromException(e);
            }
            return initialize(parsed);
        }

        /// Drain and close every appender. Safe to call repeatedly.
        Status shutdown() {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            std::shared_ptr<LoggingState> previous =
                std::atomic_exchange(&m_state, std::shared_ptr<LoggingState>());
            if (previous) previous->appenders.close();
            return Status::success();
        }

        bool isInitialized() const {
            return std::atomic_load(&m_state) != nullptr;
        }

        /// Effective level of @p loggerName; OFF while uninitialized.
        LogLevel resolveLevel(const std::string &loggerName) const {
            std::shared_ptr<LoggingState> state = std::atomic_load(&m_state);
            if (!state) return LogLevel::OFF;
            return state->registry.resolveLevel(loggerName);
        }

        bool isEnabled(const std::string &loggerName, LogLevel level) const {
            std::shared_ptr<LoggingState> state = std::atomic_load(&m_state);
            return state && state->registry.isEnabled(loggerName, level);
        }

        /// Filter by the logger's effective level, then hand a fresh record
        /// to every appender. Never throws; appender failures are reported
        /// through the error handler and the first one is returned.
        Status log(const std::string &loggerName, LogLevel level, const std::string &message) const {
            std::shared_ptr<LoggingState> state = std::atomic_load(&m_state);
            if (!state) return notInitialized();
            if (!state->registry.isEnabled(loggerName, level)) return Status::success();

            LogRecord record;
            record.timestamp = std::chrono::system_clock::now();
            record.level = level;
            record.loggerName = loggerName;
            record.threadId = detail::currentThreadId();
            record.message = message;
            return state->appenders.dispatch(record);
        }

        /// Dispatch a record built by the caller, e.g. one replayed from
        /// another source with its original timestamp.
        Status log(const LogRecord &record) const {
            std::shared_ptr<LoggingState> state = std::atomic_load(&m_state);
            if (!state) return notInitialized();
            if (!state->registry.isEnabled(record.loggerName, record.level)) return Status::success();
            return state->appenders.dispatch(record);
        }

        /// Receive appender and rotation errors instead of the stderr notice.
        void setErrorHandler(ErrorHandler handler) {
            m_reporter->setHandler(std::move(handler));
        }

        void clearErrorHandler() {
            m_reporter->clearHandler();
        }

        ErrorReporter &errorReporter() { return *m_reporter; }

        const std::string &baseDirectory() const { return m_baseDir; }

    private:
        std::shared_ptr<LoggingState> buildState(const LoggingConfig &config) const {
            config.validate();
            std::shared_ptr<LoggingState> state = std::make_shared<LoggingState>(m_reporter);
            for (size_t i = 0; i < config.loggers().size(); ++i) {
                const LoggerLevelConfig &entry = config.loggers()[i];
                state->registry.setLevel(entry.name, entry.level);
            }
            for (size_t i = 0; i < config.appenders().size(); ++i) {
                state->appenders.add(AppenderFactory::create(config.appenders()[i], m_baseDir, m_reporter));
            }
            return state;
        }

        static Status notInitialized() {
            return Status(StatusCode::NotInitialized, "logging is not initialized");
        }

        std::string m_baseDir;
        std::shared_ptr<ErrorReporter> m_reporter;
        std::shared_ptr<LoggingState> m_state;
        std::mutex m_lifecycleMutex;
    };

} // namespace cascade

#endif // CASCADE_LOG_LOGGING_CONTEXT_HPP
