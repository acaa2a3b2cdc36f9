#ifndef ACCESS_TRACE_JSON_FORMATTER_HPP
#define ACCESS_TRACE_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace atrace {
    /// {"level":"INFO","timestamp":"...","message":"...","span":{"name":"R","id":"42",...}}
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["level"] = getLevelString(entry.level);
            j["timestamp"] = formatTimestamp(entry.timestamp);
            j["message"] = entry.message;
            if (entry.hasSpan()) {
                nlohmann::ordered_json span;
                span["name"] = entry.span.name();
                span["id"] = entry.span.id();
                for (const auto &prop: entry.span.properties()) {
                    span[prop.first] = prop.second;
                }
                j["span"] = std::move(span);
            }
            return j.dump();
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_JSON_FORMATTER_HPP
