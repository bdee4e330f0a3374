#ifndef CASCADE_LOG_DAILY_ROLLING_FILE_APPENDER_HPP
#define CASCADE_LOG_DAILY_ROLLING_FILE_APPENDER_HPP

#include "file_appender.hpp"

namespace cascade {
    /// File appender that rotates to "<path>.<YYYY-MM-DD>" when the local
    /// date changes and keeps at most maxBackupIndex rotated files.
    class DailyRollingFileAppender : public FileAppender {
    public:
        DailyRollingFileAppender(const std::string &path,
                                 LogLevel threshold = LogLevel::TRACE,
                                 const PatternLayout &layout = PatternLayout(),
                                 unsigned int maxBackupIndex = 16,
                                 bool useLockFile = false,
                                 std::shared_ptr<const ErrorReporter> reporter = std::shared_ptr<const ErrorReporter>())
            : FileAppender(RollingPolicy::daily(path).maxBackupIndex(maxBackupIndex).useLockFile(useLockFile),
                           threshold, layout, std::move(reporter)) {}

        const char *typeName() const override { return "DAILY_ROLLING_FILE"; }
    };
} // namespace cascade

#endif // CASCADE_LOG_DAILY_ROLLING_FILE_APPENDER_HPP
