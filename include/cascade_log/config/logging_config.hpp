#ifndef CASCADE_LOG_LOGGING_CONFIG_HPP
#define CASCADE_LOG_LOGGING_CONFIG_HPP

#include "../core/log_level.hpp"
#include "../core/errors.hpp"
#include "../layout/pattern_layout.hpp"
#include <nlohmann/json.hpp>
#include <climits>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace cascade {

    enum class AppenderType {
        Null,
        Console,
        File,
        DailyRollingFile
    };

    inline const char *getAppenderTypeString(AppenderType type) {
        switch (type) {
            case AppenderType::Null: return "NULL";
            case AppenderType::Console: return "CONSOLE";
            case AppenderType::File: return "FILE";
            case AppenderType::DailyRollingFile: return "DAILY_ROLLING_FILE";
            default: return "UNKNOWN";
        }
    }

    inline bool parseAppenderType(const std::string &name, AppenderType &out) {
        if (name == "NULL") { out = AppenderType::Null; return true; }
        if (name == "CONSOLE") { out = AppenderType::Console; return true; }
        if (name == "FILE") { out = AppenderType::File; return true; }
        if (name == "DAILY_ROLLING_FILE") { out = AppenderType::DailyRollingFile; return true; }
        return false;
    }

namespace detail {

    inline const nlohmann::json *findField(const nlohmann::json &obj, const char *key) {
        nlohmann::json::const_iterator it = obj.find(key);
        if (it == obj.end() || it->is_null()) return nullptr;
        return &*it;
    }

    inline std::string stringField(const nlohmann::json &obj, const char *key, const std::string &where) {
        const nlohmann::json *v = findField(obj, key);
        if (!v) return std::string();
        if (!v->is_string()) {
            throw ConfigurationError(where + ": '" + key + "' must be a string");
        }
        return v->get<std::string>();
    }

    inline LogLevel levelField(const nlohmann::json &obj, const char *key, const std::string &where,
                               bool required, LogLevel fallback) {
        const nlohmann::json *v = findField(obj, key);
        if (!v) {
            if (required) throw ConfigurationError(where + ": missing '" + key + "'");
            return fallback;
        }
        if (!v->is_string()) {
            throw ConfigurationError(where + ": '" + key + "' must be a string");
        }
        LogLevel level;
        if (!parseLevel(v->get<std::string>(), level)) {
            throw ConfigurationError(where + ": unknown level '" + v->get<std::string>() + "'");
        }
        return level;
    }

} // namespace detail

    /// One appender declaration. Factories pick the type; chained setters
    /// override the defaults (threshold TRACE, default layout, no lock file,
    /// 16 backups).
    class AppenderConfig {
    public:
        static AppenderConfig makeNull() {
            return AppenderConfig(AppenderType::Null, std::string());
        }

        static AppenderConfig makeConsole() {
            return AppenderConfig(AppenderType::Console, std::string());
        }

        static AppenderConfig makeFile(const std::string &path) {
            return AppenderConfig(AppenderType::File, path);
        }

        static AppenderConfig makeDailyRollingFile(const std::string &path) {
            return AppenderConfig(AppenderType::DailyRollingFile, path);
        }

        AppenderConfig &threshold(LogLevel level) {
            m_threshold = level;
            return *this;
        }

        AppenderConfig &layout(const std::string &pattern) {
            m_layout = pattern;
            return *this;
        }

        AppenderConfig &useLockFile(bool enable) {
            m_useLockFile = enable;
            return *this;
        }

        AppenderConfig &maxBackupIndex(unsigned int n) {
            m_maxBackupIndex = n;
            return *this;
        }

        // --- Accessors ---
        AppenderType       type()            const { return m_type; }
        LogLevel           thresholdLevel()  const { return m_threshold; }
        const std::string &layoutPattern()   const { return m_layout; }
        const std::string &filePath()        const { return m_filePath; }
        bool               lockFileEnabled() const { return m_useLockFile; }
        unsigned int       maxBackupCount()  const { return m_maxBackupIndex; }

        bool requiresFile() const {
            return m_type == AppenderType::File || m_type == AppenderType::DailyRollingFile;
        }

        /// @throws ConfigurationError when a file appender has no path.
        void validate() const {
            if (requiresFile() && m_filePath.empty()) {
                throw ConfigurationError(std::string(getAppenderTypeString(m_type)) +
                                         " appender requires a non-empty 'filePath'");
            }
        }

        /// Parse one element of the "appenders" array.
        /// @throws ConfigurationError on unknown type, bad field types or a
        ///         missing file path.
        static AppenderConfig fromJson(const nlohmann::json &j, size_t index = 0) {
            std::string where = "appenders[" + std::to_string(index) + "]";
            if (!j.is_object()) {
                throw ConfigurationError(where + ": appender must be an object");
            }

            std::string typeName = detail::stringField(j, "appenderType", where);
            if (typeName.empty()) {
                throw ConfigurationError(where + ": missing 'appenderType'");
            }
            AppenderType type;
            if (!parseAppenderType(typeName, type)) {
                throw ConfigurationError(where + ": unknown appenderType '" + typeName + "'");
            }

            AppenderConfig cfg(type, detail::stringField(j, "filePath", where));
            cfg.m_threshold = detail::levelField(j, "thresholdLevel", where, false, LogLevel::TRACE);

            std::string layout = detail::stringField(j, "layout", where);
            if (!layout.empty()) cfg.m_layout = layout;

            if (const nlohmann::json *v = detail::findField(j, "useLockFile")) {
                if (!v->is_boolean()) {
                    throw ConfigurationError(where + ": 'useLockFile' must be a boolean");
                }
                cfg.m_useLockFile = v->get<bool>();
            }

            if (const nlohmann::json *v = detail::findField(j, "maxBackupIndex")) {
                if (!v->is_number_integer()) {
                    throw ConfigurationError(where + ": 'maxBackupIndex' must be an integer");
                }
                if (v->is_number_unsigned()) {
                    unsigned long long n = v->get<unsigned long long>();
                    if (n > UINT_MAX) {
                        throw ConfigurationError(where + ": 'maxBackupIndex' is too large");
                    }
                    cfg.m_maxBackupIndex = static_cast<unsigned int>(n);
                } else {
                    long long n = v->get<long long>();
                    if (n < 0) {
                        throw ConfigurationError(where + ": 'maxBackupIndex' must not be negative");
                    }
                    if (n > static_cast<long long>(UINT_MAX)) {
                        throw ConfigurationError(where + ": 'maxBackupIndex' is too large");
                    }
                    cfg.m_maxBackupIndex = static_cast<unsigned int>(n);
                }
            }

            try {
                cfg.validate();
            } catch (const ConfigurationError &e) {
                throw ConfigurationError(where + ": " + e.what());
            }
            return cfg;
        }

    private:
        AppenderConfig(AppenderType type, const std::string &path)
            : m_type(type)
            , m_threshold(LogLevel::TRACE)
            , m_layout(kDefaultLayoutPattern)
            , m_filePath(path)
            , m_useLockFile(false)
            , m_maxBackupIndex(16) {}

        AppenderType m_type;
        LogLevel m_threshold;
        std::string m_layout;
        std::string m_filePath;
        bool m_useLockFile;
        unsigned int m_maxBackupIndex;
    };

    struct LoggerLevelConfig {
        std::string name;
        LogLevel level;
    };

    /// Complete initialization payload: appenders plus per-logger levels.
    ///
    /// Usage:
    /// @code
    ///   auto config = cascade::LoggingConfig()
    ///       .appender(cascade::AppenderConfig::makeDailyRollingFile("log/app.log")
    ///                     .threshold(cascade::LogLevel::DEBUG))
    ///       .appender(cascade::AppenderConfig::makeConsole().threshold(cascade::LogLevel::WARN))
    ///       .logger("myapp", cascade::LogLevel::INFO);
    /// @endcode
    class LoggingConfig {
    public:
        LoggingConfig &appender(const AppenderConfig &cfg) {
            m_appenders.push_back(cfg);
            return *this;
        }

        /// The empty name configures the root logger.
        LoggingConfig &logger(const std::string &name, LogLevel level) {
            LoggerLevelConfig entry;
            entry.name = name;
            entry.level = level;
            m_loggers.push_back(entry);
            return *this;
        }

        const std::vector<AppenderConfig> &appenders() const { return m_appenders; }

        const std::vector<LoggerLevelConfig> &loggers() const { return m_loggers; }

        void validate() const {
            for (size_t i = 0; i < m_appenders.size(); ++i) {
                m_appenders[i].validate();
            }
        }

        /// @throws ConfigurationError on any malformed entry.
        static LoggingConfig fromJson(const nlohmann::json &j) {
            if (!j.is_object()) {
                throw ConfigurationError("logging configuration must be a JSON object");
            }

            LoggingConfig cfg;
            if (const nlohmann::json *appenders = detail::findField(j, "appenders")) {
                if (!appenders->is_array()) {
                    throw ConfigurationError("'appenders' must be an array");
                }
                for (size_t i = 0; i < appenders->size(); ++i) {
                    cfg.appender(AppenderConfig::fromJson((*appenders)[i], i));
                }
            }

            if (const nlohmann::json *loggers = detail::findField(j, "loggers")) {
                if (!loggers->is_array()) {
                    throw ConfigurationError("'loggers' must be an array");
                }
                for (size_t i = 0; i < loggers->size(); ++i) {
                    const nlohmann::json &entry = (*loggers)[i];
                    std::string where = "loggers[" + std::to_string(i) + "]";
                    if (!entry.is_object()) {
                        throw ConfigurationError(where + ": logger must be an object");
                    }
                    const nlohmann::json *name = detail::findField(entry, "name");
                    if (!name) {
                        throw ConfigurationError(where + ": missing 'name'");
                    }
                    if (!name->is_string()) {
                        throw ConfigurationError(where + ": 'name' must be a string");
                    }
                    cfg.logger(name->get<std::string>(),
                               detail::levelField(entry, "level", where, true, LogLevel::TRACE));
                }
            }
            return cfg;
        }

        static LoggingConfig fromJsonString(const std::string &text) {
            nlohmann::json j;
            try {
                j = nlohmann::json::parse(text);
            } catch (const nlohmann::json::exception &e) {
                throw ConfigurationError(std::string("invalid logging configuration JSON: ") + e.what());
            }
            return fromJson(j);
        }

        static LoggingConfig fromFile(const std::string &path) {
            std::ifstream in(path);
            if (!in.is_open()) {
                throw ConfigurationError("cannot read logging configuration file: " + path);
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            return fromJsonString(buffer.str());
        }

    private:
        std::vector<AppenderConfig> m_appenders;
        std::vector<LoggerLevelConfig> m_loggers;
    };

} // namespace cascade

#endif // CASCADE_LOG_LOGGING_CONFIG_HPP
