#ifndef CASCADE_LOG_FILE_LOCK_HPP
#define CASCADE_LOG_FILE_LOCK_HPP

#include "errors.hpp"
#include <string>
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#ifdef _MSC_VER
#include <io.h>
#include <sys/locking.h>
#include <share.h>
#else
#include <unistd.h>
#include <sys/file.h>
#endif

namespace cascade {

    /// Exclusive advisory lock on a sibling lock file, held for the lifetime
    /// of the object.
    ///
    /// The constructor either returns holding the lock or throws
    /// LockAcquisitionError; the destructor always releases it. Attempts are
    /// non-blocking and retried until @p timeout elapses, so a stuck peer
    /// delays a rotation but never hangs the writer.
    ///
    /// @note flock() locks belong to the open file description: two
    ///       ScopedFileLock objects on the same path exclude each other even
    ///       inside one process.
    class ScopedFileLock {
    public:
        explicit ScopedFileLock(const std::string& lockPath,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(200))
            : m_path(lockPath), m_fd(-1) {
#ifdef _MSC_VER
            if (_sopen_s(&m_fd, lockPath.c_str(), _O_RDWR | _O_CREAT, _SH_DENYNO,
                         _S_IREAD | _S_IWRITE) != 0) {
                m_fd = -1;
            }
#else
            m_fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
#endif
            if (m_fd < 0) {
                throw LockAcquisitionError("cannot open lock file " + lockPath + ": " +
                                           std::strerror(errno));
            }

            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!tryLock()) {
                int err = errno;
                bool retryable = err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == EACCES;
                if (!retryable || std::chrono::steady_clock::now() >= deadline) {
                    closeFd();
                    throw LockAcquisitionError("cannot lock " + lockPath + ": " +
                                               std::strerror(err));
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }

        ~ScopedFileLock() {
            if (m_fd < 0) return;
#ifdef _MSC_VER
            _lseek(m_fd, 0, SEEK_SET);
            _locking(m_fd, _LK_UNLCK, 1);
#else
            ::flock(m_fd, LOCK_UN);
#endif
            closeFd();
        }

        ScopedFileLock(const ScopedFileLock&) = delete;
        ScopedFileLock& operator=(const ScopedFileLock&) = delete;

        const std::string& path() const { return m_path; }

    private:
        bool tryLock() {
#ifdef _MSC_VER
            _lseek(m_fd, 0, SEEK_SET);
            return _locking(m_fd, _LK_NBLCK, 1) == 0;
#else
            return ::flock(m_fd, LOCK_EX | LOCK_NB) == 0;
#endif
        }

        void closeFd() {
#ifdef _MSC_VER
            _close(m_fd);
#else
            ::close(m_fd);
#endif
            m_fd = -1;
        }

        std::string m_path;
        int m_fd;
    };

} // namespace cascade

#endif // CASCADE_LOG_FILE_LOCK_HPP
