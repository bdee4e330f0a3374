#ifndef CASCADE_LOG_EXCEPTION_INFO_HPP
#define CASCADE_LOG_EXCEPTION_INFO_HPP

#include <string>
#include <exception>
#include <typeinfo>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace cascade {
namespace detail {

    inline std::string demangleTypeName(const char* mangledName) {
        if (!mangledName) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
        if (status == 0 && demangled) {
            std::string result(demangled);
            std::free(demangled);
            return result;
        }
        std::free(demangled);
        return std::string(mangledName);
#else
        return std::string(mangledName);
#endif
    }

    // Cap nested exception unwinding against pathological chains.
    static const int kMaxNestedExceptionDepth = 20;

    /// Type, message and cause chain of a failure. For C++ exceptions the
    /// chain is the std::nested_exception list, one "type: what" per line;
    /// embedding hosts may put a script stack trace there instead.
    struct ExceptionInfo {
        std::string type;
        std::string message;
        std::string chain;
    };

    inline const char* safeWhat(const std::exception& ex) {
        const char* msg = ex.what();
        return msg ? msg : "(no message)";
    }

    inline void unwindNestedExceptions(const std::exception& ex, std::string& chain, int depth) {
        if (depth >= kMaxNestedExceptionDepth) return;

        try {
            std::rethrow_if_nested(ex);
        } catch (const std::exception& nested) {
            if (!chain.empty()) chain += '\n';
            chain += demangleTypeName(typeid(nested).name());
            chain += ": ";
            chain += safeWhat(nested);
            unwindNestedExceptions(nested, chain, depth + 1);
        } catch (...) {
            // A nested non-std exception carries nothing printable; record
            // that the chain continues and stop unwinding.
            if (!chain.empty()) chain += '\n';
            chain += "unknown exception";
        }
    }

    inline ExceptionInfo extractExceptionInfo(const std::exception& ex) {
        ExceptionInfo info;
        info.type = demangleTypeName(typeid(ex).name());
        info.message = safeWhat(ex);
        unwindNestedExceptions(ex, info.chain, 0);
        return info;
    }

    /// "type: message" followed by one indented "--- " line per chain entry.
    inline std::string formatExceptionInfo(const ExceptionInfo& info) {
        std::string result;
        result += info.type;
        result += ": ";
        result += info.message;
        size_t pos = 0;
        const std::string& chain = info.chain;
        while (pos < chain.size()) {
            size_t nl = chain.find('\n', pos);
            result += "\n  --- ";
            if (nl == std::string::npos) {
                result.append(chain, pos, chain.size() - pos);
                break;
            }
            result.append(chain, pos, nl - pos);
            pos = nl + 1;
        }
        return result;
    }

} // namespace detail
} // namespace cascade

#endif // CASCADE_LOG_EXCEPTION_INFO_HPP
