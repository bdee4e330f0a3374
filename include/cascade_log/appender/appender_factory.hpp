#ifndef CASCADE_LOG_APPENDER_FACTORY_HPP
#define CASCADE_LOG_APPENDER_FACTORY_HPP

#include "appender_interface.hpp"
#include "null_appender.hpp"
#include "console_appender.hpp"
#include "file_appender.hpp"
#include "daily_rolling_file_appender.hpp"
#include "../config/logging_config.hpp"
#include "../core/error_reporter.hpp"
#include "../core/log_common.hpp"
#include <memory>
#include <string>

namespace cascade {

    class AppenderFactory {
    public:
        /// Build the appender described by @p cfg. File paths are resolved
        /// against @p baseDir here, once; nothing is opened yet.
        /// @throws ConfigurationError if @p cfg is invalid.
        static std::unique_ptr<IAppender> create(const AppenderConfig &cfg,
                                                 const std::string &baseDir,
                                                 std::shared_ptr<const ErrorReporter> reporter) {
            cfg.validate();
            PatternLayout layout(cfg.layoutPattern());
            switch (cfg.type()) {
                case AppenderType::Null:
                    return detail::make_unique<NullAppender>(cfg.thresholdLevel());
                case AppenderType::Console:
                    return detail::make_unique<ConsoleAppender>(cfg.thresholdLevel(), layout);
                case AppenderType::File:
                    return detail::make_unique<FileAppender>(
                        RollingPolicy::file(detail::resolvePath(cfg.filePath(), baseDir)),
                        cfg.thresholdLevel(), layout, std::move(reporter));
                case AppenderType::DailyRollingFile:
                    return detail::make_unique<DailyRollingFileAppender>(
                        detail::resolvePath(cfg.filePath(), baseDir),
                        cfg.thresholdLevel(), layout, cfg.maxBackupCount(),
                        cfg.lockFileEnabled(), std::move(reporter));
            }
            throw ConfigurationError("unsupported appender type");
        }
    };

} // namespace cascade

#endif // CASCADE_LOG_APPENDER_FACTORY_HPP
