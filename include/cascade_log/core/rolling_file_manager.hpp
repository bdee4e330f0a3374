#ifndef CASCADE_LOG_ROLLING_FILE_MANAGER_HPP
#define CASCADE_LOG_ROLLING_FILE_MANAGER_HPP

#include "rolling_policy.hpp"
#include "file_lock.hpp"
#include "error_reporter.hpp"
#include "log_common.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#ifdef _MSC_VER
#include <direct.h>
#include <io.h>
#include <share.h>
#else
#include <unistd.h>
#include <dirent.h>
#endif

namespace cascade {
namespace detail {

    inline bool pathExists(const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    inline bool mkdirRecursive(const std::string& path) {
        if (path.empty()) return true;
        struct stat st;
        if (stat(path.c_str(), &st) == 0) return true;

        size_t slashPos = path.find_last_of("/\\");
        if (slashPos != std::string::npos && slashPos > 0) {
            if (!mkdirRecursive(path.substr(0, slashPos))) return false;
        }
#ifdef _MSC_VER
        return _mkdir(path.c_str()) == 0 || errno == EEXIST;
#else
        return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
#endif
    }

    inline std::vector<std::string> listDirectory(const std::string& dirPath) {
        std::vector<std::string> entries;
#ifdef _MSC_VER
        struct _finddata_t fileinfo;
        std::string pattern = dirPath + "/*";
        intptr_t handle = _findfirst(pattern.c_str(), &fileinfo);
        if (handle == -1) return entries;
        do {
            std::string name = fileinfo.name;
            if (name != "." && name != "..") {
                entries.push_back(name);
            }
        } while (_findnext(handle, &fileinfo) == 0);
        _findclose(handle);
#else
        DIR* dir = opendir(dirPath.c_str());
        if (!dir) return entries;
        struct dirent* ent;
        while ((ent = readdir(dir)) != nullptr) {
            std::string name = ent->d_name;
            if (name != "." && name != "..") {
                entries.push_back(name);
            }
        }
        closedir(dir);
#endif
        return entries;
    }

    inline bool allDigits(const char* s, size_t n) {
        if (n == 0) return false;
        for (size_t i = 0; i < n; ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
        }
        return true;
    }

    /// Check if string matches YYYY-MM-DD pattern.
    /// @pre strlen(s) >= 10
    inline bool isDatePattern(const char* s) {
        return allDigits(s, 4) && s[4] == '-' && allDigits(s + 5, 2) &&
               s[7] == '-' && allDigits(s + 8, 2);
    }

    /// A rotated-out file: "<name>.<YYYY-MM-DD>" or "<name>.<YYYY-MM-DD>.<N>".
    struct BackupEntry {
        std::string path;
        std::string date;
        unsigned long sequence;
    };

    inline bool backupOlder(const BackupEntry& a, const BackupEntry& b) {
        if (a.date != b.date) return a.date < b.date;
        return a.sequence < b.sequence;
    }

    inline int openAppend(const std::string& path) {
#ifdef _MSC_VER
        int fd = -1;
        if (_sopen_s(&fd, path.c_str(), _O_WRONLY | _O_APPEND | _O_CREAT | _O_BINARY,
                     _SH_DENYNO, _S_IREAD | _S_IWRITE) != 0) {
            return -1;
        }
        return fd;
#else
        return ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
#endif
    }

    inline void closeDescriptor(int fd) {
#ifdef _MSC_VER
        _close(fd);
#else
        ::close(fd);
#endif
    }

} // namespace detail

    /// Owns the descriptor behind a FILE or DAILY_ROLLING_FILE appender.
    ///
    /// CLOSED -> OPEN happens lazily on the first write. close() is terminal:
    /// later writes are dropped instead of touching a closed descriptor.
    /// Every public member that touches the descriptor holds m_mutex, so
    /// rotation checks and writes on one file are strictly ordered.
    class RollingFileManager {
    public:
        RollingFileManager(const RollingPolicy& policy, std::shared_ptr<const ErrorReporter> reporter)
            : m_policy(policy)
            , m_reporter(std::move(reporter))
            , m_fd(-1)
            , m_closed(false)
        {
            splitBasePath();
        }

        ~RollingFileManager() {
            close();
        }

        RollingFileManager(const RollingFileManager&) = delete;
        RollingFileManager& operator=(const RollingFileManager&) = delete;

        /// Append one rendered record. @p timestamp selects the rotation
        /// period for daily files.
        /// @throws AppenderIOError if the file cannot be opened or written.
        void write(const std::string& rendered, std::chrono::system_clock::time_point timestamp) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) return;

            std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
            if (m_fd < 0) {
                openFile(seconds);
            }
            if (m_policy.rollInterval() == RollInterval::Daily) {
                std::string period = detail::localDateString(seconds);
                // Records stamped just before midnight can reach the lock after
                // a newer record already rotated; they go to the current file.
                if (period > m_period) {
                    rollOver(period);
                }
            }
            writeAll(rendered);
        }

        /// Wait for an in-flight write, then close the descriptor for good.
        void close() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_fd >= 0) {
                detail::closeDescriptor(m_fd);
                m_fd = -1;
            }
            m_closed = true;
        }

        bool isOpen() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_fd >= 0;
        }

        const RollingPolicy& policy() const { return m_policy; }

        /// Rotated-out files of this log, oldest first.
        std::vector<std::string> listBackups() const {
            std::vector<detail::BackupEntry> found = scanBackups();
            std::vector<std::string> paths;
            paths.reserve(found.size());
            for (size_t i = 0; i < found.size(); ++i) {
                paths.push_back(found[i].path);
            }
            return paths;
        }

    private:
        void splitBasePath() {
            const std::string& path = m_policy.basePath();
            size_t slashPos = path.find_last_of("/\\");
            if (slashPos != std::string::npos) {
                m_dirPrefix = path.substr(0, slashPos + 1);
                m_dir = slashPos == 0 ? m_dirPrefix : path.substr(0, slashPos);
                m_fileName = path.substr(slashPos + 1);
            } else {
                m_dir = ".";
                m_fileName = path;
            }
        }

        void openFile(std::time_t recordTime) {
            const std::string& path = m_policy.basePath();
            size_t slashPos = path.find_last_of("/\\");
            if (slashPos != std::string::npos && slashPos > 0) {
                detail::mkdirRecursive(path.substr(0, slashPos));
            }

            int fd = detail::openAppend(path);
            if (fd < 0) {
                throw AppenderIOError("cannot open log file " + path + ": " + std::strerror(errno));
            }
            m_fd = fd;

            // A non-empty file left by an earlier run belongs to the day it
            // was last written, so a restart after midnight still rotates it.
            struct stat st;
            if (fstat(m_fd, &st) == 0 && st.st_size > 0) {
                m_period = detail::localDateString(st.st_mtime);
            } else {
                m_period = detail::localDateString(recordTime);
            }
        }

        /// Rename the current file to its backup name and reopen the base
        /// path. Failures are reported and leave the old descriptor in place,
        /// so the pending record is still written and the next write retries.
        void rollOver(const std::string& newPeriod) {
            try {
                std::unique_ptr<ScopedFileLock> guard;
                if (m_policy.lockFileEnabled()) {
                    guard = detail::make_unique<ScopedFileLock>(m_policy.lockFilePath());
                }

                const std::string& path = m_policy.basePath();
                if (stillAtBasePath()) {
                    std::string backup = uniqueBackupName(m_period);
                    if (std::rename(path.c_str(), backup.c_str()) != 0) {
                        throw AppenderIOError("cannot rename " + path + " to " + backup + ": " +
                                              std::strerror(errno));
                    }
                }

                int fresh = detail::openAppend(path);
                if (fresh < 0) {
                    throw AppenderIOError("cannot reopen log file " + path + ": " + std::strerror(errno));
                }
                detail::closeDescriptor(m_fd);
                m_fd = fresh;
                m_period = newPeriod;

                evictBackups();
            } catch (const LockAcquisitionError& e) {
                report(Status::fromException(e));
            } catch (const AppenderIOError& e) {
                report(Status::fromException(e));
            } catch (const std::exception& e) {
                report(Status(StatusCode::AppenderIOError,
                              "rotation of " + m_policy.basePath() + " failed: " + e.what()));
            } catch (...) {
                report(Status(StatusCode::AppenderIOError,
                              "rotation of " + m_policy.basePath() + " failed: unknown exception"));
            }
        }

        /// False when another process already moved the file we hold open.
        bool stillAtBasePath() const {
            struct stat onDisk;
            if (stat(m_policy.basePath().c_str(), &onDisk) != 0) return false;
#ifdef _MSC_VER
            return true;
#else
            struct stat held;
            if (fstat(m_fd, &held) != 0) return true;
            return onDisk.st_dev == held.st_dev && onDisk.st_ino == held.st_ino;
#endif
        }

        std::string uniqueBackupName(const std::string& period) const {
            std::string base = m_policy.basePath() + "." + period;
            if (!detail::pathExists(base)) return base;
            for (unsigned long n = 1; ; ++n) {
                std::string candidate = base + "." + std::to_string(n);
                if (!detail::pathExists(candidate)) return candidate;
            }
        }

        std::vector<detail::BackupEntry> scanBackups() const {
            std::vector<detail::BackupEntry> found;
            std::string prefix = m_fileName + ".";
            std::vector<std::string> entries = detail::listDirectory(m_dir);

            for (size_t i = 0; i < entries.size(); ++i) {
                const std::string& name = entries[i];
                if (name.size() < prefix.size() + 10 ||
                    name.compare(0, prefix.size(), prefix) != 0) {
                    continue;
                }
                const char* rest = name.c_str() + prefix.size();
                size_t restLen = name.size() - prefix.size();
                if (!detail::isDatePattern(rest)) continue;

                detail::BackupEntry entry;
                entry.date.assign(rest, 10);
                entry.sequence = 0;
                if (restLen > 10) {
                    if (rest[10] != '.' || !detail::allDigits(rest + 11, restLen - 11)) continue;
                    entry.sequence = std::strtoul(rest + 11, nullptr, 10);
                }
                entry.path = m_dirPrefix + name;
                found.push_back(entry);
            }

            std::sort(found.begin(), found.end(), detail::backupOlder);
            return found;
        }

        void evictBackups() {
            std::vector<detail::BackupEntry> backups = scanBackups();
            size_t keep = m_policy.maxBackupCount();
            for (size_t i = 0; i + keep < backups.size(); ++i) {
                if (std::remove(backups[i].path.c_str()) != 0 && detail::pathExists(backups[i].path)) {
                    report(Status(StatusCode::AppenderIOError,
                                  "cannot remove old backup " + backups[i].path + ": " + std::strerror(errno)));
                    return;
                }
            }
        }

        void writeAll(const std::string& data) {
            const char* p = data.data();
            size_t left = data.size();
            while (left > 0) {
#ifdef _MSC_VER
                int n = _write(m_fd, p, static_cast<unsigned int>(left));
#else
                ssize_t n = ::write(m_fd, p, left);
#endif
                if (n < 0) {
                    if (errno == EINTR) continue;
                    throw AppenderIOError("write to " + m_policy.basePath() + " failed: " +
                                          std::strerror(errno));
                }
                p += n;
                left -= static_cast<size_t>(n);
            }
        }

        void report(const Status& status) const {
            if (m_reporter) m_reporter->report(status);
        }

        RollingPolicy m_policy;
        std::shared_ptr<const ErrorReporter> m_reporter;
        std::string m_dir;
        std::string m_dirPrefix;
        std::string m_fileName;
        mutable std::mutex m_mutex;
        int m_fd;
        bool m_closed;
        std::string m_period;
    };

} // namespace cascade

#endif // CASCADE_LOG_ROLLING_FILE_MANAGER_HPP
