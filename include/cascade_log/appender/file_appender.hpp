#ifndef CASCADE_LOG_FILE_APPENDER_HPP
#define CASCADE_LOG_FILE_APPENDER_HPP

#include "appender_interface.hpp"
#include "../core/rolling_file_manager.hpp"
#include "../core/error_reporter.hpp"
#include <memory>
#include <string>

namespace cascade {
    /// Appends to a single file through a RollingFileManager. The policy
    /// decides whether the file ever rotates.
    class FileAppender : public IAppender {
    public:
        FileAppender(const RollingPolicy &policy,
                     LogLevel threshold = LogLevel::TRACE,
                     const PatternLayout &layout = PatternLayout(),
                     std::shared_ptr<const ErrorReporter> reporter = std::shared_ptr<const ErrorReporter>())
            : IAppender(threshold, layout)
            , m_manager(policy, std::move(reporter)) {}

        void append(const LogRecord &record) override {
            m_manager.write(render(record), record.timestamp);
        }

        void close() override {
            m_manager.close();
        }

        const char *typeName() const override { return "FILE"; }

        const std::string &filePath() const { return m_manager.policy().basePath(); }

        const RollingFileManager &manager() const { return m_manager; }

    private:
        RollingFileManager m_manager;
    };
} // namespace cascade

#endif // CASCADE_LOG_FILE_APPENDER_HPP
