#ifndef CASCADE_LOG_COMMON_HPP
#define CASCADE_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <memory>
#include <thread>
#include <functional>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
// windows.h defines ERROR as 0, which conflicts with LogLevel::ERROR.
#ifdef ERROR
#undef ERROR
#endif
#include <process.h>
#else
#include <unistd.h>
#include <sys/types.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif
#endif

namespace cascade {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

#ifdef _WIN32
    static const char *const kLineSeparator = "\r\n";
#else
    static const char *const kLineSeparator = "\n";
#endif

    inline std::tm toLocalTm(std::time_t t) {
        std::tm tmBuf;
#ifdef _MSC_VER
        localtime_s(&tmBuf, &t);
#else
        localtime_r(&t, &tmBuf);
#endif
        return tmBuf;
    }

    inline std::tm toUtcTm(std::time_t t) {
        std::tm tmBuf;
#ifdef _MSC_VER
        gmtime_s(&tmBuf, &t);
#else
        gmtime_r(&t, &tmBuf);
#endif
        return tmBuf;
    }

    /// Local calendar date "YYYY-MM-DD" of @p t.
    inline std::string localDateString(std::time_t t) {
        std::tm tmBuf = toLocalTm(t);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tmBuf);
        return std::string(buf);
    }

    /// Short numeric id of the calling thread: the kernel thread id where the
    /// platform exposes one, a hash of std::thread::id otherwise.
    inline std::string currentThreadId() {
#if defined(_WIN32)
        return std::to_string(static_cast<unsigned long>(GetCurrentThreadId()));
#elif defined(__linux__)
        return std::to_string(static_cast<long>(syscall(SYS_gettid)));
#else
        return std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id()));
#endif
    }

    inline long currentProcessId() {
#ifdef _WIN32
        return static_cast<long>(_getpid());
#else
        return static_cast<long>(getpid());
#endif
    }

    inline std::string hostName() {
        char buf[256];
#ifdef _WIN32
        DWORD size = sizeof(buf);
        if (!GetComputerNameA(buf, &size)) return std::string();
        return std::string(buf, size);
#else
        if (gethostname(buf, sizeof(buf)) != 0) return std::string();
        buf[sizeof(buf) - 1] = '\0';
        return std::string(buf);
#endif
    }

    inline bool isAbsolutePath(const std::string& path) {
        if (path.empty()) return false;
        if (path[0] == '/' || path[0] == '\\') return true;
#ifdef _WIN32
        if (path.size() > 1 && path[1] == ':') return true;
#endif
        return false;
    }

    /// Resolve @p path against @p baseDir unless it is already absolute.
    inline std::string resolvePath(const std::string& path, const std::string& baseDir) {
        if (baseDir.empty() || isAbsolutePath(path)) return path;
        char last = baseDir[baseDir.size() - 1];
        if (last == '/' || last == '\\') return baseDir + path;
        return baseDir + "/" + path;
    }

    /// Directory holding the running executable, or the working directory
    /// when the platform cannot tell.
    inline std::string executableDirectory() {
        std::string exe;
#if defined(_WIN32)
        char buf[MAX_PATH];
        DWORD len = GetModuleFileNameA(nullptr, buf, MAX_PATH);
        if (len > 0 && len < MAX_PATH) exe.assign(buf, len);
#elif defined(__linux__)
        char buf[4096];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len > 0) exe.assign(buf, static_cast<size_t>(len));
#endif
        size_t slash = exe.find_last_of("/\\");
        if (slash != std::string::npos) {
            return slash == 0 ? exe.substr(0, 1) : exe.substr(0, slash);
        }
#ifdef _WIN32
        return std::string(".");
#else
        char cwd[4096];
        if (getcwd(cwd, sizeof(cwd)) != nullptr) return std::string(cwd);
        return std::string(".");
#endif
    }
} // namespace detail
} // namespace cascade

#endif // CASCADE_LOG_COMMON_HPP
