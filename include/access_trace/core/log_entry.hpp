#ifndef ACCESS_TRACE_LOG_ENTRY_HPP
#define ACCESS_TRACE_LOG_ENTRY_HPP

#include "log_level.hpp"
#include "span.hpp"
#include <string>
#include <chrono>

namespace atrace {
    struct LogEntry {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        Span span;   // span active on the logging thread, or none

        LogEntry() : level(LogLevel::INFO) {}

        LogEntry(LogLevel lvl, std::string msg,
                 std::chrono::system_clock::time_point ts, Span sp)
            : level(lvl), message(std::move(msg)), timestamp(ts), span(std::move(sp)) {}

        bool hasSpan() const { return !span.isNone(); }
    };
} // namespace atrace

#endif // ACCESS_TRACE_LOG_ENTRY_HPP
