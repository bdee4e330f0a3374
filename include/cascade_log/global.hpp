#ifndef CASCADE_LOG_GLOBAL_HPP
#define CASCADE_LOG_GLOBAL_HPP

#include "logging_context.hpp"
#include "logger.hpp"
#include <string>

namespace cascade {

    /// Process-wide logging facade.
    ///
    /// Owns one LoggingContext for the whole process. Before initialize()
    /// and after shutdown() every record is dropped. The context is a
    /// function-local static, so its destructor closes all appenders at
    /// normal process exit even without an explicit shutdown().
    ///
    /// Usage:
    /// @code
    ///   cascade::Log::initialize(cascade::LoggingConfig::fromFile("logging.json"));
    ///   cascade::Logger log = cascade::Log::logger("myapp.somemodule");
    ///   log.info("started");
    ///   cascade::Log::shutdown();
    /// @endcode
    class Log {
    public:
        Log() = delete;

        static LoggingContext &context() {
            static LoggingContext s_context;
            return s_context;
        }

        static Status initialize(const LoggingConfig &config) {
            return context().initialize(config);
        }

        static Status initialize(const nlohmann::json &config) {
            return context().initialize(config);
        }

        static Status shutdown() {
            return context().shutdown();
        }

        static bool isInitialized() {
            return context().isInitialized();
        }

        static Status log(const std::string &loggerName, LogLevel level, const std::string &message) {
            return context().log(loggerName, level, message);
        }

        static Logger logger(const std::string &name = kDefaultLoggerName) {
            return Logger(context(), name);
        }
    };

} // namespace cascade

#endif // CASCADE_LOG_GLOBAL_HPP
