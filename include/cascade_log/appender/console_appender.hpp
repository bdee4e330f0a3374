#ifndef CASCADE_LOG_CONSOLE_APPENDER_HPP
#define CASCADE_LOG_CONSOLE_APPENDER_HPP

#include "appender_interface.hpp"
#include "../core/log_common.hpp"
#include "../transport/console_transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace cascade {
    /// Writes to stderr unless another stream is supplied. The record is
    /// rendered before the console lock is taken, so the lock only covers
    /// one insertion and flush.
    class ConsoleAppender : public IAppender {
    public:
        explicit ConsoleAppender(LogLevel threshold = LogLevel::TRACE,
                                 const PatternLayout &layout = PatternLayout())
            : IAppender(threshold, layout)
            , m_transport(detail::make_unique<StderrTransport>())
            , m_closed(false) {}

        ConsoleAppender(LogLevel threshold, const PatternLayout &layout, std::ostream &out)
            : IAppender(threshold, layout)
            , m_transport(detail::make_unique<StreamTransport>(out))
            , m_closed(false) {}

        void append(const LogRecord &record) override {
            if (m_closed.load(std::memory_order_acquire)) return;
            std::string rendered = render(record);
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed.load(std::memory_order_relaxed)) return;
            m_transport->write(rendered);
        }

        /// Waits for an in-flight append; nothing reaches the stream afterwards.
        void close() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed.store(true, std::memory_order_release);
        }

        const char *typeName() const override { return "CONSOLE"; }

    private:
        std::unique_ptr<ITransport> m_transport;
        std::mutex m_mutex;
        std::atomic<bool> m_closed;
    };
} // namespace cascade

#endif // CASCADE_LOG_CONSOLE_APPENDER_HPP
