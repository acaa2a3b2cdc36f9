#include <benchmark/benchmark.h>
#include <cstdio>
#include <string>
#include "access_trace.hpp"
#include "null_sink.hpp"

#include <unistd.h>

static std::string benchPath(const std::string& suffix) {
    return "/tmp/access_trace_bench_" + std::to_string(getpid()) + "_" + suffix;
}

static atrace::ResponseView okHandler(const atrace::RequestView&) {
    atrace::ResponseView response(200, 128);
    response.headers.add("Content-Type", "application/json");
    return response;
}

static atrace::RequestView benchRequest() {
    atrace::RequestView req;
    req.method = "GET";
    req.path = "/api/v1/items";
    req.version = "HTTP/1.1";
    req.remoteAddr = "192.0.2.10:55000";
    req.headers.add("User-Agent", "bench/1.0");
    return req;
}

// ---------------------------------------------------------------------------
// BM_E2E_HandleNullSink
// handle() through to a sink that discards entries. Measures span setup,
// timing, render and enqueue; flush() is not called per iteration.
// ---------------------------------------------------------------------------
static void BM_E2E_HandleNullSink(benchmark::State& state) {
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .writeTo(atrace::detail::make_unique<atrace::NullSink>())
        .spanFactory([](const atrace::RequestView&) { return atrace::Span("R", "bench"); })
        .build();
    atrace::RequestView request = benchRequest();
    for (auto _ : state) {
        atrace::ResponseView response = access.handle(request, &okHandler);
        benchmark::DoNotOptimize(response);
    }
    access.logger()->flush();
}
BENCHMARK(BM_E2E_HandleNullSink);

// ---------------------------------------------------------------------------
// BM_E2E_HandleJsonFile
// handle() into a JSON file sink, flushing every iteration so the cost of
// the worker thread and the file write is included.
// ---------------------------------------------------------------------------
static void BM_E2E_HandleJsonFile(benchmark::State& state) {
    std::string path = benchPath("e2e.json.log");
    {
        atrace::AccessLogger access = atrace::AccessLogger::configure()
            .format("%t %a \"%r\" %s %b %T")
            .writeTo<atrace::FileSink, atrace::JsonFormatter>(path)
            .build();
        atrace::RequestView request = benchRequest();
        for (auto _ : state) {
            access.handle(request, &okHandler);
            access.logger()->flush();
        }
    }
    std::remove(path.c_str());
}
BENCHMARK(BM_E2E_HandleJsonFile);

// ---------------------------------------------------------------------------
// BM_E2E_Excluded
// Cost of the exclude filter on a path that is never logged.
// ---------------------------------------------------------------------------
static void BM_E2E_Excluded(benchmark::State& state) {
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .exclude("/health")
        .excludeRegex("^/static/")
        .writeTo(atrace::detail::make_unique<atrace::NullSink>())
        .build();
    atrace::RequestView request = benchRequest();
    request.path = "/static/app.js";
    for (auto _ : state) {
        atrace::ResponseView response = access.handle(request, &okHandler);
        benchmark::DoNotOptimize(response);
    }
}
BENCHMARK(BM_E2E_Excluded);
