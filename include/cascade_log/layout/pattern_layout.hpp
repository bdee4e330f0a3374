#ifndef CASCADE_LOG_PATTERN_LAYOUT_HPP
#define CASCADE_LOG_PATTERN_LAYOUT_HPP

#include "../core/log_record.hpp"
#include "../core/log_common.hpp"
#include "../core/log_level.hpp"
#include <algorithm>
#include <string>
#include <vector>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace cascade {

    /// Layout used when an appender does not configure one.
    static const char *const kDefaultLayoutPattern =
        "%d{%Y-%m-%d %H:%M:%S,%q} [%-5p %-5.5t %-20.20c] %m%n";

namespace detail {

    /// Upper bound for min and max field widths; larger values are clamped.
    static const size_t kMaxFieldWidth = 4096;

    /// Date sub-format used by %d and %D without an option.
    static const char *const kDefaultDateFormat = "%Y-%m-%d %H:%M:%S,%q";

    enum class PatternTokenType {
        Literal,
        UtcDate,        // %d{fmt}
        LocalDate,      // %D{fmt}
        Level,          // %p
        ThreadId,       // %t
        LoggerName,     // %c, %c{N}
        Message,        // %m
        Newline,        // %n
        RelativeTime,   // %r
        ProcessId,      // %i
        HostName        // %h
    };

    /// One piece of a compiled date sub-format. strftime text is rendered
    /// as-is; the two millisecond forms are filled from the time point.
    struct DatePart {
        enum Kind { Strftime, Millis, FractionalMillis };
        Kind kind;
        std::string text;
    };

    struct PatternSegment {
        PatternTokenType type;
        std::string literal;            // Literal only
        std::vector<DatePart> dateParts; // UtcDate / LocalDate only
        int components;                 // LoggerName: trailing components, 0 = all
        bool leftAlign;
        size_t minWidth;                // 0 = no padding
        size_t maxWidth;                // 0 = no truncation

        PatternSegment()
            : type(PatternTokenType::Literal), components(0),
              leftAlign(false), minWidth(0), maxWidth(0) {}

        static PatternSegment makeLiteral(const std::string& text) {
            PatternSegment seg;
            seg.type = PatternTokenType::Literal;
            seg.literal = text;
            return seg;
        }
    };

    /// Split a strftime-like date format at the %q / %Q markers.
    /// "%%" stays in the strftime text so a literal percent is never
    /// mistaken for a marker.
    inline std::vector<DatePart> compileDateFormat(const std::string& fmt) {
        std::vector<DatePart> parts;
        std::string current;
        size_t i = 0;
        while (i < fmt.size()) {
            if (fmt[i] == '%' && i + 1 < fmt.size()) {
                char next = fmt[i + 1];
                if (next == 'q' || next == 'Q') {
                    if (!current.empty()) {
                        DatePart p;
                        p.kind = DatePart::Strftime;
                        p.text = current;
                        parts.push_back(p);
                        current.clear();
                    }
                    DatePart p;
                    p.kind = next == 'q' ? DatePart::Millis : DatePart::FractionalMillis;
                    parts.push_back(p);
                    i += 2;
                    continue;
                }
                current += fmt[i];
                current += next;
                i += 2;
                continue;
            }
            current += fmt[i];
            ++i;
        }
        if (!current.empty()) {
            DatePart p;
            p.kind = DatePart::Strftime;
            p.text = current;
            parts.push_back(p);
        }
        return parts;
    }

    inline std::string formatDate(const std::chrono::system_clock::time_point& tp,
                                  const std::vector<DatePart>& parts, bool utc) {
        std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
        std::tm tmBuf = utc ? toUtcTm(seconds) : toLocalTm(seconds);
        long long micros = std::chrono::duration_cast<std::chrono::microseconds>(
            tp.time_since_epoch()).count() % 1000000;
        if (micros < 0) micros += 1000000;

        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            const DatePart& part = parts[i];
            if (part.kind == DatePart::Strftime) {
                // strftime returns 0 both for overflow and for an empty
                // expansion; either way nothing is appended.
                char buf[256];
                size_t written = std::strftime(buf, sizeof(buf), part.text.c_str(), &tmBuf);
                result.append(buf, written);
            } else if (part.kind == DatePart::Millis) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "%03d", static_cast<int>(micros / 1000));
                result += buf;
            } else {
                char buf[16];
                std::snprintf(buf, sizeof(buf), "%03d.%03d",
                              static_cast<int>(micros / 1000), static_cast<int>(micros % 1000));
                result += buf;
            }
        }
        return result;
    }

    /// Keep only the last @p components dot-separated parts of @p name.
    inline std::string trailingComponents(const std::string& name, int components) {
        if (components <= 0) return name;
        size_t pos = name.size();
        for (int i = 0; i < components; ++i) {
            if (pos == 0) return name;
            size_t dot = name.rfind('.', pos - 1);
            if (dot == std::string::npos) return name;
            pos = dot;
        }
        return name.substr(pos + 1);
    }

    inline void applyWidth(std::string& value, const PatternSegment& seg) {
        if (seg.maxWidth > 0 && value.size() > seg.maxWidth) {
            value.resize(seg.maxWidth);
        }
        if (seg.minWidth > 0 && value.size() < seg.minWidth) {
            std::string padding(seg.minWidth - value.size(), ' ');
            if (seg.leftAlign) {
                value += padding;
            } else {
                value.insert(0, padding);
            }
        }
    }

    inline bool resolveConversion(char c, PatternTokenType& out) {
        switch (c) {
            case 'd': out = PatternTokenType::UtcDate;      return true;
            case 'D': out = PatternTokenType::LocalDate;    return true;
            case 'p': out = PatternTokenType::Level;        return true;
            case 't': out = PatternTokenType::ThreadId;     return true;
            case 'c': out = PatternTokenType::LoggerName;   return true;
            case 'm': out = PatternTokenType::Message;      return true;
            case 'n': out = PatternTokenType::Newline;      return true;
            case 'r': out = PatternTokenType::RelativeTime; return true;
            case 'i': out = PatternTokenType::ProcessId;    return true;
            case 'h': out = PatternTokenType::HostName;     return true;
            default: return false;
        }
    }

    /// Compile a pattern into segments.
    ///
    /// Syntax: %[-][min][.max]X[{option}]
    ///   -     left-justify inside min
    ///   min   pad with spaces up to this width
    ///   max   truncate to this width, keeping the prefix
    ///   %%    literal percent
    /// Unknown conversions are kept verbatim, modifiers included.
    inline std::vector<PatternSegment> parsePattern(const std::string& pattern) {
        std::vector<PatternSegment> segments;
        std::string literal;
        size_t i = 0;

        while (i < pattern.size()) {
            if (pattern[i] != '%') {
                literal += pattern[i];
                ++i;
                continue;
            }

            size_t start = i;
            ++i;
            if (i < pattern.size() && pattern[i] == '%') {
                literal += '%';
                ++i;
                continue;
            }

            PatternSegment seg;
            if (i < pattern.size() && pattern[i] == '-') {
                seg.leftAlign = true;
                ++i;
            }
            while (i < pattern.size() && pattern[i] >= '0' && pattern[i] <= '9') {
                seg.minWidth = std::min(seg.minWidth * 10 + static_cast<size_t>(pattern[i] - '0'), kMaxFieldWidth);
                ++i;
            }
            if (i < pattern.size() && pattern[i] == '.') {
                ++i;
                while (i < pattern.size() && pattern[i] >= '0' && pattern[i] <= '9') {
                    seg.maxWidth = std::min(seg.maxWidth * 10 + static_cast<size_t>(pattern[i] - '0'), kMaxFieldWidth);
                    ++i;
                }
            }

            if (i >= pattern.size() || !resolveConversion(pattern[i], seg.type)) {
                // Dangling or unknown conversion: pass it through untouched.
                size_t end = i < pattern.size() ? i + 1 : i;
                literal.append(pattern, start, end - start);
                i = end;
                continue;
            }
            ++i;

            std::string option;
            bool takesOption = seg.type == PatternTokenType::UtcDate ||
                               seg.type == PatternTokenType::LocalDate ||
                               seg.type == PatternTokenType::LoggerName;
            if (takesOption && i < pattern.size() && pattern[i] == '{') {
                size_t close = pattern.find('}', i + 1);
                if (close != std::string::npos) {
                    option = pattern.substr(i + 1, close - i - 1);
                    i = close + 1;
                }
            }

            if (seg.type == PatternTokenType::UtcDate || seg.type == PatternTokenType::LocalDate) {
                seg.dateParts = compileDateFormat(option.empty() ? std::string(kDefaultDateFormat) : option);
            } else if (seg.type == PatternTokenType::LoggerName && !option.empty()) {
                seg.components = std::atoi(option.c_str());
            }

            if (!literal.empty()) {
                segments.push_back(PatternSegment::makeLiteral(literal));
                literal.clear();
            }
            segments.push_back(seg);
        }

        if (!literal.empty()) {
            segments.push_back(PatternSegment::makeLiteral(literal));
        }
        return segments;
    }

} // namespace detail

    /// A compiled pattern layout: parse once, render many times.
    /// Thread-safe: nothing is mutated after construction.
    class PatternLayout {
    public:
        PatternLayout()
            : PatternLayout(kDefaultLayoutPattern) {}

        explicit PatternLayout(const std::string& pattern)
            : m_pattern(pattern)
            , m_segments(detail::parsePattern(pattern))
            , m_startTime(std::chrono::system_clock::now())
            , m_processId(std::to_string(detail::currentProcessId()))
            , m_hostName(detail::hostName()) {}

        const std::string& pattern() const { return m_pattern; }

        std::string render(const LogRecord& record) const {
            std::string result;
            result.reserve(128 + record.message.size());

            for (size_t i = 0; i < m_segments.size(); ++i) {
                const detail::PatternSegment& seg = m_segments[i];
                if (seg.type == detail::PatternTokenType::Literal) {
                    result += seg.literal;
                    continue;
                }

                std::string value;
                switch (seg.type) {
                    case detail::PatternTokenType::UtcDate:
                        value = detail::formatDate(record.timestamp, seg.dateParts, true);
                        break;
                    case detail::PatternTokenType::LocalDate:
                        value = detail::formatDate(record.timestamp, seg.dateParts, false);
                        break;
                    case detail::PatternTokenType::Level:
                        value = getLevelString(record.level);
                        break;
                    case detail::PatternTokenType::ThreadId:
                        value = record.threadId;
                        break;
                    case detail::PatternTokenType::LoggerName:
                        value = detail::trailingComponents(record.loggerName, seg.components);
                        break;
                    case detail::PatternTokenType::Message:
                        value = record.message;
                        break;
                    case detail::PatternTokenType::Newline:
                        value = detail::kLineSeparator;
                        break;
                    case detail::PatternTokenType::RelativeTime:
                        value = std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                            record.timestamp - m_startTime).count());
                        break;
                    case detail::PatternTokenType::ProcessId:
                        value = m_processId;
                        break;
                    case detail::PatternTokenType::HostName:
                        value = m_hostName;
                        break;
                    case detail::PatternTokenType::Literal:
                        break;
                }

                detail::applyWidth(value, seg);
                result += value;
            }
            return result;
        }

    private:
        std::string m_pattern;
        std::vector<detail::PatternSegment> m_segments;
        std::chrono::system_clock::time_point m_startTime;
        std::string m_processId;
        std::string m_hostName;
    };

    /// One-shot render of @p record with @p pattern.
    inline std::string renderPattern(const LogRecord& record, const std::string& pattern) {
        return PatternLayout(pattern).render(record);
    }

} // namespace cascade

#endif // CASCADE_LOG_PATTERN_LAYOUT_HPP
