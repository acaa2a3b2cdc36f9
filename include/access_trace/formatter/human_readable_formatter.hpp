#ifndef ACCESS_TRACE_HUMAN_READABLE_FORMATTER_HPP
#define ACCESS_TRACE_HUMAN_READABLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <sstream>

namespace atrace {
    /// 2026-10-17 09:30:00.123 [INFO] message {span=R id=42, user=alice}
    class HumanReadableFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            oss << formatTimestamp(entry.timestamp) << " "
                << "[" << getLevelString(entry.level) << "] "
                << entry.message;

            if (entry.hasSpan()) {
                const Span &span = entry.span;
                oss << " {span=" << span.name();
                if (!span.id().empty()) {
                    oss << " id=" << span.id();
                }
                for (const auto &prop : span.properties()) {
                    oss << ", " << prop.first << "=" << prop.second;
                }
                oss << "}";
            }

            return oss.str();
        }
    };

    /// Just the message: the rendered access line with no prefix.
    class MessageOnlyFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            return entry.message;
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_HUMAN_READABLE_FORMATTER_HPP
