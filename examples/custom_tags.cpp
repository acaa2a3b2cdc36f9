#include "access_trace.hpp"
#include <string>

// Custom request and response tags, sub-formats, and the real client
// address behind a proxy.
int main() {
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .format("%t  %{r}a  %r(%M %U %Q %V) %s %b(bytes) %T(seconds) %D(milliseconds) "
                "%{ALL_REQ_HEADERS}xi %{CACHE}xo")
        .requestTag("ALL_REQ_HEADERS", [](const atrace::RequestView& r) {
            std::string out = "{";
            for (atrace::HeaderMap::const_iterator it = r.headers.begin(); it != r.headers.end(); ++it) {
                if (out.size() > 1) out += ", ";
                out += it->name + "=" + it->values.front();
            }
            return out + "}";
        })
        .responseTag("CACHE", [](const atrace::ResponseView& r) {
            return r.headers.first("X-Cache", "MISS");
        })
        .writeTo<atrace::ConsoleSink>()
        .build();

    atrace::RequestView request;
    request.method = "GET";
    request.path = "/images/logo.png";
    request.query = "v=3";
    request.version = "HTTP/2.0";
    request.remoteAddr = "10.0.0.2:443";
    request.headers.add("X-Forwarded-For", "203.0.113.50, 10.0.0.2");
    request.headers.add("Accept", "image/png");

    access.handle(request, [](const atrace::RequestView&) {
        atrace::ResponseView response(200, 5120);
        response.headers.add("X-Cache", "HIT");
        return response;
    });

    access.logger()->flush();
    return 0;
}
