#ifndef CASCADE_LOG_ROLLING_POLICY_HPP
#define CASCADE_LOG_ROLLING_POLICY_HPP

#include <string>

namespace cascade {

    enum class RollInterval {
        None,
        Daily
    };

    class RollingPolicy {
    public:
        /// Plain append-only file, never rotated.
        static RollingPolicy file(const std::string& path) {
            RollingPolicy p;
            p.m_basePath = path;
            p.m_rollInterval = RollInterval::None;
            return p;
        }

        /// Rotate when a record falls on a later local calendar date than
        /// the open file.
        static RollingPolicy daily(const std::string& path) {
            RollingPolicy p;
            p.m_basePath = path;
            p.m_rollInterval = RollInterval::Daily;
            return p;
        }

        /// Number of rotated-out files to keep; 0 keeps none.
        RollingPolicy& maxBackupIndex(unsigned int n) {
            m_maxBackupIndex = n;
            return *this;
        }

        /// Serialize rotation with other processes through "<path>.lock".
        RollingPolicy& useLockFile(bool enable) {
            m_useLockFile = enable;
            return *this;
        }

        // --- Accessors ---
        const std::string& basePath()       const { return m_basePath; }
        RollInterval       rollInterval()   const { return m_rollInterval; }
        unsigned int       maxBackupCount() const { return m_maxBackupIndex; }
        bool               lockFileEnabled() const { return m_useLockFile; }
        std::string        lockFilePath()   const { return m_basePath + ".lock"; }

    private:
        RollingPolicy() : m_rollInterval(RollInterval::None), m_maxBackupIndex(16), m_useLockFile(false) {}

        std::string  m_basePath;
        RollInterval m_rollInterval;
        unsigned int m_maxBackupIndex;
        bool         m_useLockFile;
    };

} // namespace cascade

#endif // CASCADE_LOG_ROLLING_POLICY_HPP
