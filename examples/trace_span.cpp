#include "access_trace.hpp"
#include <atomic>
#include <string>

// Every request gets a span; application logs written while the handler
// runs carry the same span as the access line.
int main() {
    std::shared_ptr<atrace::Logger> logger =
        std::make_shared<atrace::Logger>(atrace::LogLevel::DEBUG, false);
    logger->addSink<atrace::ConsoleSink>();

    std::atomic<unsigned> nextId(1);
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .format("%M %U %s %D(ms)")
        .spanFactory([&nextId](const atrace::RequestView& r) {
            atrace::Span span("R", std::to_string(nextId++));
            span.with("path", r.path);
            return span;
        })
        .logger(logger)
        .build();

    atrace::RequestView request;
    request.method = "GET";
    request.version = "HTTP/1.1";
    request.remoteAddr = "127.0.0.1:40000";

    for (int i = 0; i < 3; ++i) {
        request.path = "/users/" + std::to_string(i);
        access.handle(request, [&logger](const atrace::RequestView& r) {
            logger->debug("loading user record for " + r.path);
            return atrace::ResponseView(200, 87);
        });
    }

    logger->info("outside any request");
    logger->flush();
    return 0;
}
