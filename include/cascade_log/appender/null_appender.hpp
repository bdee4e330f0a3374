#ifndef CASCADE_LOG_NULL_APPENDER_HPP
#define CASCADE_LOG_NULL_APPENDER_HPP

#include "appender_interface.hpp"

namespace cascade {
    /// Accepts every record and discards it.
    class NullAppender : public IAppender {
    public:
        explicit NullAppender(LogLevel threshold = LogLevel::TRACE)
            : IAppender(threshold, PatternLayout()) {}

        void append(const LogRecord &) override {}

        const char *typeName() const override { return "NULL"; }
    };
} // namespace cascade

#endif // CASCADE_LOG_NULL_APPENDER_HPP
