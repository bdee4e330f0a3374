#ifndef CASCADE_LOG_ERROR_REPORTER_HPP
#define CASCADE_LOG_ERROR_REPORTER_HPP

#include "errors.hpp"
#include "../transport/console_transport.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>

namespace cascade {

    using ErrorHandler = std::function<void(const Status&)>;

    /// Side channel for errors that must not reach the code being logged
    /// from: appender I/O failures, failed rotations, lock timeouts.
    ///
    /// With a handler installed every error goes to it. Without one (or when
    /// the handler itself throws) a delimited notice is printed to the
    /// fallback stream, stderr by default.
    class ErrorReporter {
    public:
        ErrorReporter() : m_fallback(&std::cerr) {}

        ErrorReporter(const ErrorReporter&) = delete;
        ErrorReporter& operator=(const ErrorReporter&) = delete;

        void setHandler(ErrorHandler handler) {
            std::shared_ptr<const ErrorHandler> ptr;
            if (handler) {
                ptr = std::make_shared<const ErrorHandler>(std::move(handler));
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_handler = std::move(ptr);
        }

        void clearHandler() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_handler.reset();
        }

        /// Redirect the delimited notices. The stream must outlive the reporter.
        void setFallbackStream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_fallback = &out;
        }

        void report(const Status& status) const {
            std::shared_ptr<const ErrorHandler> handler;
            std::ostream* fallback;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                handler = m_handler;
                fallback = m_fallback;
            }
            if (handler) {
                try {
                    (*handler)(status);
                    return;
                } catch (const std::exception& e) {
                    printNotice(*fallback, status.toString() +
                                "\nerror handler failed: " + e.what());
                    return;
                } catch (...) {
                    printNotice(*fallback, status.toString() +
                                "\nerror handler failed: unknown exception");
                    return;
                }
            }
            printNotice(*fallback, status.toString());
        }

    private:
        static void printNotice(std::ostream& out, const std::string& text) {
            std::lock_guard<std::mutex> lock(detail::consoleMutex());
            out << "===LOGGER ERROR:\n" << text << "\n===LOGGER ERROR END:\n" << std::flush;
        }

        mutable std::mutex m_mutex;
        std::shared_ptr<const ErrorHandler> m_handler;
        std::ostream* m_fallback;
    };

} // namespace cascade

#endif // CASCADE_LOG_ERROR_REPORTER_HPP
