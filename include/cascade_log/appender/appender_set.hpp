#ifndef CASCADE_LOG_APPENDER_SET_HPP
#define CASCADE_LOG_APPENDER_SET_HPP

#include "appender_interface.hpp"
#include "../core/error_reporter.hpp"
#include "../core/errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cascade {
    /// Fan-out of one record to every configured appender.
    ///
    /// Each appender is tried independently: a failure is reported through
    /// the ErrorReporter and the remaining appenders still get the record.
    class AppenderSet {
    public:
        explicit AppenderSet(std::shared_ptr<const ErrorReporter> reporter = std::shared_ptr<const ErrorReporter>())
            : m_reporter(std::move(reporter)) {}

        AppenderSet(const AppenderSet &) = delete;
        AppenderSet &operator=(const AppenderSet &) = delete;

        ~AppenderSet() {
            close();
        }

        void add(std::unique_ptr<IAppender> appender) {
            m_appenders.push_back(std::move(appender));
        }

        /// @return Ok, or the first appender failure for this record.
        Status dispatch(const LogRecord &record) const {
            Status result;
            for (const auto &appender: m_appenders) {
                if (!appender->accepts(record.level)) continue;
                try {
                    appender->append(record);
                } catch (const std::exception &e) {
                    fail(*appender, e.what(), result);
                } catch (...) {
                    fail(*appender, "unknown exception", result);
                }
            }
            return result;
        }

        /// Close every appender; each close waits for that appender's
        /// in-flight write.
        void close() {
            for (const auto &appender: m_appenders) {
                appender->close();
            }
        }

        size_t size() const { return m_appenders.size(); }

        bool empty() const { return m_appenders.empty(); }

        const IAppender &at(size_t index) const { return *m_appenders.at(index); }

    private:
        void fail(const IAppender &appender, const char *what, Status &result) const {
            Status failure(StatusCode::AppenderIOError,
                           std::string(appender.typeName()) + " appender: " + what);
            if (m_reporter) m_reporter->report(failure);
            if (result.ok()) result = failure;
        }

        std::shared_ptr<const ErrorReporter> m_reporter;
        std::vector<std::unique_ptr<IAppender> > m_appenders;
    };
} // namespace cascade

#endif // CASCADE_LOG_APPENDER_SET_HPP
