#ifndef CASCADE_LOG_MESSAGE_VALUE_HPP
#define CASCADE_LOG_MESSAGE_VALUE_HPP

#include "exception_info.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <exception>
#include <string>

namespace cascade {

    /// A message before it is turned into the plain text a LogRecord carries.
    ///
    /// Text is logged as-is, Structured values as compact JSON, Failures as
    /// "type: message" plus their cause chain, and the two absent values as
    /// the words "null" and "undefined". Conversion never throws: a value
    /// that cannot be serialized turns into the description of that error.
    class MessageValue {
    public:
        enum class Kind {
            Text,
            Structured,
            Failure,
            Null,
            Undefined
        };

        MessageValue() : m_kind(Kind::Undefined) {}

        MessageValue(const char *text)
            : m_kind(text ? Kind::Text : Kind::Null), m_text(text ? text : "") {}

        MessageValue(const std::string &text) : m_kind(Kind::Text), m_text(text) {}

        MessageValue(std::nullptr_t) : m_kind(Kind::Null) {}

        MessageValue(const nlohmann::json &value) : m_kind(Kind::Structured), m_json(value) {}

        MessageValue(const std::exception &ex)
            : m_kind(Kind::Failure), m_failure(detail::extractExceptionInfo(ex)) {}

        static MessageValue null() { return MessageValue(nullptr); }

        static MessageValue undefined() { return MessageValue(); }

        /// Failure reported by a host that has its own stack trace text.
        static MessageValue failure(const std::string &type, const std::string &message,
                                    const std::string &stackTrace = std::string()) {
            MessageValue v;
            v.m_kind = Kind::Failure;
            v.m_failure.type = type;
            v.m_failure.message = message;
            v.m_failure.chain = stackTrace;
            return v;
        }

        Kind kind() const { return m_kind; }

        std::string toMessageString() const {
            switch (m_kind) {
                case Kind::Text:
                    return m_text;
                case Kind::Structured:
                    try {
                        return m_json.dump();
                    } catch (const nlohmann::json::exception &e) {
                        return detail::formatExceptionInfo(detail::extractExceptionInfo(e));
                    }
                case Kind::Failure:
                    return detail::formatExceptionInfo(m_failure);
                case Kind::Null:
                    return "null";
                case Kind::Undefined:
                    return "undefined";
            }
            return "undefined";
        }

    private:
        Kind m_kind;
        std::string m_text;
        nlohmann::json m_json;
        detail::ExceptionInfo m_failure;
    };

} // namespace cascade

#endif // CASCADE_LOG_MESSAGE_VALUE_HPP
