#ifndef CASCADE_LOG_ERRORS_HPP
#define CASCADE_LOG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cascade {

    class LoggingError : public std::runtime_error {
    public:
        explicit LoggingError(const std::string &what) : std::runtime_error(what) {}
    };

    /// Malformed appender or logger specification.
    class ConfigurationError : public LoggingError {
    public:
        explicit ConfigurationError(const std::string &what) : LoggingError(what) {}
    };

    /// File open, write or rotation failure inside one appender.
    class AppenderIOError : public LoggingError {
    public:
        explicit AppenderIOError(const std::string &what) : LoggingError(what) {}
    };

    /// The rotation lock file could not be acquired in time.
    class LockAcquisitionError : public LoggingError {
    public:
        explicit LockAcquisitionError(const std::string &what) : LoggingError(what) {}
    };

    enum class StatusCode {
        Ok,
        ConfigurationError,
        AppenderIOError,
        LockAcquisitionError,
        NotInitialized
    };

    inline const char *getStatusCodeString(StatusCode code) {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::ConfigurationError: return "ConfigurationError";
            case StatusCode::AppenderIOError: return "AppenderIOError";
            case StatusCode::LockAcquisitionError: return "LockAcquisitionError";
            case StatusCode::NotInitialized: return "NotInitialized";
            default: return "Unknown";
        }
    }

    /// Outcome of a public entry point. Entry points never throw; callers
    /// inspect the status or ignore it explicitly.
    class Status {
    public:
        Status() : m_code(StatusCode::Ok) {}

        Status(StatusCode code, const std::string &message)
            : m_code(code), m_message(message) {}

        static Status success() { return Status(); }

        static Status fromException(const ConfigurationError &e) {
            return Status(StatusCode::ConfigurationError, e.what());
        }

        static Status fromException(const LockAcquisitionError &e) {
            return Status(StatusCode::LockAcquisitionError, e.what());
        }

        static Status fromException(const AppenderIOError &e) {
            return Status(StatusCode::AppenderIOError, e.what());
        }

        bool ok() const { return m_code == StatusCode::Ok; }
        explicit operator bool() const { return ok(); }

        StatusCode code() const { return m_code; }
        const std::string &message() const { return m_message; }

        std::string toString() const {
            if (ok()) return "Ok";
            return std::string(getStatusCodeString(m_code)) + ": " + m_message;
        }

    private:
        StatusCode m_code;
        std::string m_message;
    };

} // namespace cascade

#endif // CASCADE_LOG_ERRORS_HPP
