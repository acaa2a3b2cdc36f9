#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include "access_trace.hpp"

static atrace::RequestView benchRequest() {
    atrace::RequestView req;
    req.method = "POST";
    req.path = "/api/v1/orders";
    req.query = "expand=items";
    req.version = "HTTP/1.1";
    req.remoteAddr = "10.0.0.7:40112";
    req.headers.add("User-Agent", "Mozilla/5.0 (X11; Linux x86_64)");
    req.headers.add("Referer", "https://shop.example.com/cart");
    req.headers.add("X-Forwarded-For", "203.0.113.9, 10.0.0.1");
    return req;
}

// ---------------------------------------------------------------------------
// BM_Compile
// Parse cost of the default format and of a format using every directive.
// ---------------------------------------------------------------------------
static void BM_Compile_Default(benchmark::State& state) {
    for (auto _ : state) {
        atrace::AccessFormat format;
        benchmark::DoNotOptimize(format);
    }
}
BENCHMARK(BM_Compile_Default);

static void BM_Compile_AllDirectives(benchmark::State& state) {
    const std::string fmt =
        "%t %a %{r}a \"%r\" %M %U %Q %V %s %b(bytes) %T(seconds) %D(ms) "
        "%{User-Agent}i %{Content-Type}o %{USER}xi %{CACHE}xo %{HOME}e %%";
    for (auto _ : state) {
        atrace::AccessFormat format(fmt);
        benchmark::DoNotOptimize(format);
    }
}
BENCHMARK(BM_Compile_AllDirectives);

// ---------------------------------------------------------------------------
// BM_Render
// One render per iteration against a fixed exchange.
// ---------------------------------------------------------------------------
static void BM_Render_Default(benchmark::State& state) {
    atrace::AccessFormat format;
    atrace::RequestView request = benchRequest();
    atrace::ResponseView response(201, 512);
    atrace::RenderContext ctx(request, response, std::chrono::system_clock::now(),
                              std::chrono::microseconds(842));
    for (auto _ : state) {
        std::string line = format.render(ctx);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_Render_Default);

static void BM_Render_WithTimestamp(benchmark::State& state) {
    atrace::AccessFormat format("%t %a \"%r\" %s %b");
    atrace::RequestView request = benchRequest();
    atrace::ResponseView response(200, 64);
    atrace::RenderContext ctx(request, response, std::chrono::system_clock::now(),
                              std::chrono::microseconds(90));
    for (auto _ : state) {
        std::string line = format.render(ctx);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_Render_WithTimestamp);

static void BM_Render_CustomTags(benchmark::State& state) {
    atrace::TagRegistry registry;
    registry.registerRequestTag("USER", [](const atrace::RequestView& r) {
        return r.headers.first("User-Agent", "-");
    });
    registry.registerResponseTag("CACHE", [](const atrace::ResponseView& r) {
        return r.status == 304 ? std::string("HIT") : std::string("MISS");
    });
    atrace::AccessFormat format("%{r}a %s %{USER}xi %{CACHE}xo %{Referer}i");
    atrace::RequestView request = benchRequest();
    atrace::ResponseView response(304, 0);
    atrace::RenderContext ctx(request, response, std::chrono::system_clock::now(),
                              std::chrono::microseconds(12));
    for (auto _ : state) {
        std::string line = format.render(ctx, registry);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_Render_CustomTags);
