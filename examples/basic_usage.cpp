#include "access_trace.hpp"
#include <iostream>

// Logs a few simulated exchanges with the default Apache-style format,
// once to the console and once as JSON lines to a file.
int main() {
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .writeTo<atrace::ConsoleSink>()
        .writeTo<atrace::FileSink, atrace::JsonFormatter>("access.json.log")
        .exclude("/health")
        .serverErrorLevel(atrace::LogLevel::ERROR)
        .build();

    atrace::RequestView request;
    request.method = "GET";
    request.path = "/index.html";
    request.version = "HTTP/1.1";
    request.remoteAddr = "198.51.100.23:50412";
    request.headers.add("User-Agent", "curl/8.5.0");
    request.headers.add("Referer", "https://example.com/");

    access.handle(request, [](const atrace::RequestView&) {
        atrace::ResponseView response(200, 1024);
        response.headers.add("Content-Type", "text/html");
        return response;
    });

    request.path = "/health";
    access.handle(request, [](const atrace::RequestView&) { return atrace::ResponseView(200, 2); });

    request.method = "POST";
    request.path = "/api/orders";
    request.query = "dry_run=1";
    access.handle(request, [](const atrace::RequestView&) { return atrace::ResponseView(503, 0); });

    access.logger()->flush();
    std::cout << "Access lines written to console and access.json.log" << std::endl;
    return 0;
}
