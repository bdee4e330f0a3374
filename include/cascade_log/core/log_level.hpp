#ifndef CASCADE_LOG_LEVEL_HPP
#define CASCADE_LOG_LEVEL_HPP

#include <string>
#include <cctype>

namespace cascade {
    /// Severity levels in ascending order. OFF is only meaningful as a
    /// threshold: nothing is ever logged at OFF.
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL,
        OFF
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::OFF: return "OFF";
            default: return "UNKNOWN";
        }
    }

    /// Case-insensitive level name lookup. Returns false for unknown names
    /// and leaves @p out untouched.
    inline bool parseLevel(const std::string &name, LogLevel &out) {
        std::string upper;
        upper.reserve(name.size());
        for (size_t i = 0; i < name.size(); ++i) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));
        }
        if (upper == "TRACE") { out = LogLevel::TRACE; return true; }
        if (upper == "DEBUG") { out = LogLevel::DEBUG; return true; }
        if (upper == "INFO")  { out = LogLevel::INFO;  return true; }
        if (upper == "WARN")  { out = LogLevel::WARN;  return true; }
        if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
        if (upper == "FATAL") { out = LogLevel::FATAL; return true; }
        if (upper == "OFF")   { out = LogLevel::OFF;   return true; }
        return false;
    }
} // namespace cascade

#endif // CASCADE_LOG_LEVEL_HPP
