#ifndef ACCESS_TRACE_EXCHANGE_HPP
#define ACCESS_TRACE_EXCHANGE_HPP

#include "header_map.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace atrace {

    /// Read-only view of an incoming request, filled in by the server.
    struct RequestView {
        std::string method;
        std::string path;
        std::string query;        // raw, without '?'; empty when absent
        std::string version;      // e.g. "HTTP/1.1"
        std::string remoteAddr;   // connection peer
        HeaderMap headers;
    };

    /// Read-only view of the response produced for a request.
    struct ResponseView {
        int status;
        std::uint64_t bodySize;
        HeaderMap headers;

        ResponseView() : status(200), bodySize(0) {}
        ResponseView(int statusCode, std::uint64_t size)
            : status(statusCode), bodySize(size) {}
    };

    /// Everything one access line is rendered from.
    /// Holds references: it must not outlive the request and response it
    /// was built from.
    struct RenderContext {
        const RequestView& request;
        const ResponseView& response;
        std::chrono::system_clock::time_point startTime;
        std::chrono::nanoseconds elapsed;

        RenderContext(const RequestView& req,
                      const ResponseView& resp,
                      std::chrono::system_clock::time_point start,
                      std::chrono::nanoseconds took)
            : request(req), response(resp), startTime(start), elapsed(took) {}
    };

} // namespace atrace

#endif // ACCESS_TRACE_EXCHANGE_HPP
