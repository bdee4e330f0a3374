#ifndef CASCADE_LOG_RECORD_HPP
#define CASCADE_LOG_RECORD_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>

namespace cascade {
    /// One emitted log event. Built once per accepted log() call and only
    /// read afterwards.
    struct LogRecord {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string loggerName;
        std::string threadId;
        std::string message;
    };
} // namespace cascade

#endif // CASCADE_LOG_RECORD_HPP
