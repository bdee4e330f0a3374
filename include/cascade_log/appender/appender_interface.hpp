#ifndef CASCADE_LOG_APPENDER_INTERFACE_HPP
#define CASCADE_LOG_APPENDER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include "../core/log_level.hpp"
#include "../layout/pattern_layout.hpp"
#include <string>

namespace cascade {
    class IAppender {
    public:
        IAppender(LogLevel threshold, const PatternLayout &layout)
            : m_threshold(threshold), m_layout(layout) {}

        virtual ~IAppender() = default;

        IAppender(const IAppender &) = delete;
        IAppender &operator=(const IAppender &) = delete;

        /// Threshold-inclusive: a record at exactly the threshold is accepted.
        bool accepts(LogLevel level) const {
            return level != LogLevel::OFF && level >= m_threshold;
        }

        /// Render and write one record.
        /// @throws AppenderIOError (or another std::exception) on failure.
        virtual void append(const LogRecord &record) = 0;

        /// Release every handle. Blocks until an in-flight append finishes;
        /// appends after close() are dropped.
        virtual void close() {}

        /// Config name of the appender type, used in error reports.
        virtual const char *typeName() const = 0;

        LogLevel threshold() const { return m_threshold; }

        const PatternLayout &layout() const { return m_layout; }

    protected:
        std::string render(const LogRecord &record) const {
            return m_layout.render(record);
        }

    private:
        LogLevel m_threshold;
        PatternLayout m_layout;
    };
} // namespace cascade

#endif // CASCADE_LOG_APPENDER_INTERFACE_HPP
