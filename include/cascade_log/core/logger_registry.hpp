#ifndef CASCADE_LOG_LOGGER_REGISTRY_HPP
#define CASCADE_LOG_LOGGER_REGISTRY_HPP

#include "log_level.hpp"
#include <map>
#include <string>

namespace cascade {

    /// Level used for the root logger when the configuration leaves it out.
    static const LogLevel kDefaultRootLevel = LogLevel::WARN;

    /// Dot-separated logger namespace mapped to minimum levels.
    ///
    /// Only explicitly configured names are stored, in a sorted map keyed by
    /// the full name; the empty name is the root and is always present.
    /// resolveLevel() walks from the full name towards the root by trimming
    /// the last ".segment" and returns the first configured prefix, so
    /// "a.bc" never inherits from "a.b".
    ///
    /// A registry is filled once and then only read; LoggingContext replaces
    /// whole registries instead of editing a published one.
    class LoggerRegistry {
    public:
        explicit LoggerRegistry(LogLevel rootLevel = kDefaultRootLevel) {
            m_levels[std::string()] = rootLevel;
        }

        /// Configure @p name; the empty name sets the root level.
        void setLevel(const std::string& name, LogLevel level) {
            m_levels[name] = level;
        }

        LogLevel resolveLevel(const std::string& name) const {
            if (m_levels.size() == 1) return rootLevel();

            std::string prefix(name);
            for (;;) {
                std::map<std::string, LogLevel>::const_iterator it = m_levels.find(prefix);
                if (it != m_levels.end()) return it->second;
                if (prefix.empty()) break;
                size_t dot = prefix.rfind('.');
                if (dot == std::string::npos) {
                    prefix.clear();
                } else {
                    prefix.resize(dot);
                }
            }
            return kDefaultRootLevel;
        }

        bool isEnabled(const std::string& name, LogLevel level) const {
            return level != LogLevel::OFF && level >= resolveLevel(name);
        }

        bool isConfigured(const std::string& name) const {
            return m_levels.find(name) != m_levels.end();
        }

        LogLevel rootLevel() const {
            return m_levels.find(std::string())->second;
        }

        /// Number of configured entries, root included.
        size_t size() const { return m_levels.size(); }

    private:
        std::map<std::string, LogLevel> m_levels;
    };

} // namespace cascade

#endif // CASCADE_LOG_LOGGER_REGISTRY_HPP
