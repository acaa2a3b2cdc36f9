#ifndef ACCESS_TRACE_BUILTIN_DIRECTIVES_HPP
#define ACCESS_TRACE_BUILTIN_DIRECTIVES_HPP

#include "exchange.hpp"
#include "log_common.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace atrace {
namespace detail {

    inline std::string orDash(const std::string& s) {
        return s.empty() ? std::string("-") : s;
    }

    /// METHOD PATH?QUERY VERSION; "?QUERY" only when there is a query,
    /// "?" in place of an unknown version.
    inline std::string renderRequestLine(const RequestView& req) {
        std::string result;
        result.reserve(req.method.size() + req.path.size() + req.query.size() + 16);
        result += req.method;
        result += ' ';
        result += req.path;
        if (!req.query.empty()) {
            result += '?';
            result += req.query;
        }
        result += ' ';
        result += req.version.empty() ? std::string("?") : req.version;
        return result;
    }

    inline std::string trimSpaces(const std::string& s) {
        size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return std::string();
        size_t e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    /// Client address behind proxies: first X-Forwarded-For hop, then the
    /// for= parameter of the first Forwarded element, then the peer.
    inline std::string renderRealRemoteAddr(const RequestView& req) {
        std::string xff = req.headers.first("X-Forwarded-For");
        if (!xff.empty()) {
            std::string hop = trimSpaces(xff.substr(0, xff.find(',')));
            if (!hop.empty()) return hop;
        }

        std::string forwarded = req.headers.first("Forwarded");
        if (!forwarded.empty()) {
            std::string element = forwarded.substr(0, forwarded.find(','));
            size_t pos = 0;
            while (pos <= element.size()) {
                size_t semi = element.find(';', pos);
                std::string pair = trimSpaces(element.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos));
                if (pair.size() > 4 && asciiToLower(pair.substr(0, 4)) == "for=") {
                    std::string value = pair.substr(4);
                    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                        value = value.substr(1, value.size() - 2);
                    }
                    if (!value.empty()) return value;
                }
                if (semi == std::string::npos) break;
                pos = semi + 1;
            }
        }

        return orDash(req.remoteAddr);
    }

    /// One value as is, several as a JSON array literal, "-" when absent.
    /// Bytes that are not valid UTF-8 (obs-text) become U+FFFD in the array.
    inline std::string renderHeaderValues(const std::vector<std::string>* values) {
        if (!values || values->empty()) return "-";
        if (values->size() == 1) return values->front();
        nlohmann::json arr = *values;
        return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    /// Evaluate a built-in directive. parameter is only used by %{r}a.
    inline std::string evaluateBuiltin(char key, const std::string& parameter, const RenderContext& ctx) {
        const RequestView& req = ctx.request;
        switch (key) {
            case 't': return formatIsoTimestamp(ctx.startTime);
            case 'a': return parameter == "r" ? renderRealRemoteAddr(req) : orDash(req.remoteAddr);
            case 'r': return renderRequestLine(req);
            case 'M': return req.method;
            case 'U': return req.path;
            case 'Q': return orDash(req.query);
            case 'V': return req.version.empty() ? std::string("?") : req.version;
            case 's': return std::to_string(ctx.response.status);
            case 'b': return std::to_string(ctx.response.bodySize);
            case 'T': return formatFixed6(static_cast<double>(ctx.elapsed.count()) / 1e9);
            case 'D': return formatFixed6(static_cast<double>(ctx.elapsed.count()) / 1e6);
            default: return "-";
        }
    }

} // namespace detail
} // namespace atrace

#endif // ACCESS_TRACE_BUILTIN_DIRECTIVES_HPP
