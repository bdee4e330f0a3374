#ifndef CASCADE_LOG_CONSOLE_TRANSPORT_HPP
#define CASCADE_LOG_CONSOLE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "../core/errors.hpp"
#include <iostream>
#include <mutex>

namespace cascade {
namespace detail {
    /// Serializes every console write in the process, including the
    /// delimited notices printed by ErrorReporter.
    inline std::mutex& consoleMutex() {
        static std::mutex s_mutex;
        return s_mutex;
    }
} // namespace detail

    /// @note All StreamTransport instances share one mutex, so a record is
    ///       inserted and flushed as a unit and lines from concurrent
    ///       writers never interleave, whatever stream each one targets.
    class StreamTransport : public ITransport {
    public:
        explicit StreamTransport(std::ostream& out) : m_out(out) {}

        void write(const std::string& rendered) override {
            std::lock_guard<std::mutex> lock(detail::consoleMutex());
            m_out << rendered << std::flush;
            if (!m_out) {
                m_out.clear();
                throw AppenderIOError("console write failed");
            }
        }

    private:
        std::ostream& m_out;
    };

    /// Standard diagnostic stream, flushed after every record.
    class StderrTransport : public StreamTransport {
    public:
        StderrTransport() : StreamTransport(std::cerr) {}
    };

} // namespace cascade

#endif // CASCADE_LOG_CONSOLE_TRANSPORT_HPP
