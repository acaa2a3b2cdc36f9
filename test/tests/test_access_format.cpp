#include <gtest/gtest.h>
#include "access_trace.hpp"
#include "utils/test_utils.hpp"
#include <cstdlib>

using atrace::AccessFormat;
using atrace::CompileError;
using atrace::RenderContext;
using atrace::TagRegistry;

class AccessFormatTest : public ::testing::Test {
protected:
    atrace::RequestView request;
    atrace::ResponseView response;
    TagRegistry registry;

    void SetUp() override {
        request = TestUtils::sampleRequest();
        response = atrace::ResponseView(200, 12);
        response.headers.add("Content-Type", "text/plain");
    }

    std::string render(const std::string& fmt,
                       std::chrono::nanoseconds elapsed = std::chrono::microseconds(278)) {
        AccessFormat format(fmt);
        RenderContext ctx(request, response, TestUtils::sampleStartTime(), elapsed);
        return format.render(ctx, registry);
    }
};

TEST_F(AccessFormatTest, LiteralOnlyRendersUnchanged) {
    EXPECT_EQ(render("plain text, no directives"), "plain text, no directives");
    response = atrace::ResponseView(500, 99999);
    request.method = "DELETE";
    EXPECT_EQ(render("plain text, no directives"), "plain text, no directives");
}

TEST_F(AccessFormatTest, EmptyFormatRendersEmpty) {
    EXPECT_EQ(render(""), "");
}

TEST_F(AccessFormatTest, DoublePercentRendersSinglePercent) {
    EXPECT_EQ(render("%%"), "%");
    EXPECT_EQ(render("%%s %s"), "%s 200");
}

TEST_F(AccessFormatTest, StatusAndBytes) {
    EXPECT_EQ(render("%s %b"), "200 12");
}

TEST_F(AccessFormatTest, SubFormatIsAppendedVerbatim) {
    EXPECT_EQ(render("%b(bytes)"), "12(bytes)");
}

TEST_F(AccessFormatTest, SubFormatIsNotEvaluated) {
    EXPECT_EQ(render("%s(%T)"), "200(%T)");
    EXPECT_EQ(render("%a(%{r}a)"), "127.0.0.1:51234(%{r}a)");
}

TEST_F(AccessFormatTest, TimingDirectives) {
    EXPECT_EQ(render("%T"), "0.000278");
    EXPECT_EQ(render("%D"), "0.278000");
    EXPECT_EQ(render("%T(seconds) %D(milliseconds)"), "0.000278(seconds) 0.278000(milliseconds)");
}

TEST_F(AccessFormatTest, HeaderLookupIsCaseInsensitive) {
    EXPECT_EQ(render("%{user-agent}i"), "curl/8.5.0");
    EXPECT_EQ(render("%{CONTENT-TYPE}o"), "text/plain");
}

TEST_F(AccessFormatTest, MissingHeaderRendersDash) {
    EXPECT_EQ(render("\"%{Referer}i\" %{Location}o"), "\"-\" -");
}

TEST_F(AccessFormatTest, MultiValuedHeaderRendersList) {
    request.headers.add("X-Trace", "v1");
    request.headers.add("x-trace", "v2");
    EXPECT_EQ(render("%{X-Trace}i"), "[\"v1\",\"v2\"]");
}

TEST_F(AccessFormatTest, MultiValuedHeaderWithObsTextStillRenders) {
    request.headers.add("X-Name", "caf\xe9");
    request.headers.add("X-Name", "ok");
    EXPECT_EQ(render("%s %b %{X-Name}i"), "200 12 [\"caf\xEF\xBF\xBD\",\"ok\"]");
}

TEST_F(AccessFormatTest, SingleHeaderWithObsTextIsVerbatim) {
    request.headers.add("X-Name", "caf\xe9");
    EXPECT_EQ(render("%{X-Name}i"), "caf\xe9");
}

TEST_F(AccessFormatTest, HeaderDirectionMatters) {
    EXPECT_EQ(render("%{Content-Type}i"), "-");
    EXPECT_EQ(render("%{User-Agent}o"), "-");
}

TEST_F(AccessFormatTest, RegisteredRequestTag) {
    registry.registerRequestTag("X", [](const atrace::RequestView&) { return std::string("hi"); });
    EXPECT_EQ(render("%{X}xi"), "hi");
}

TEST_F(AccessFormatTest, UnregisteredTagRendersDash) {
    EXPECT_EQ(render("%{X}xi"), "-");
    EXPECT_EQ(render("[%{X}xo]"), "[-]");
}

TEST_F(AccessFormatTest, TagDirectionMatters) {
    registry.registerRequestTag("X", [](const atrace::RequestView&) { return std::string("req"); });
    EXPECT_EQ(render("%{X}xi %{X}xo"), "req -");
}

TEST_F(AccessFormatTest, ResponseTagSeesResponse) {
    registry.registerResponseTag("ALL_RES_HEADERS", [](const atrace::ResponseView& r) {
        std::string out = "{";
        bool first = true;
        for (const auto& h : r.headers) {
            if (!first) out += ",";
            out += h.name + ":" + h.values.front();
            first = false;
        }
        return out + "}";
    });
    EXPECT_EQ(render("RES:%{ALL_RES_HEADERS}xo"), "RES:{Content-Type:text/plain}");
}

TEST_F(AccessFormatTest, ReRegisteringTagLastWriteWins) {
    AccessFormat format("%{X}xi");
    RenderContext ctx(request, response, TestUtils::sampleStartTime(), std::chrono::nanoseconds(0));

    registry.registerRequestTag("X", [](const atrace::RequestView&) { return std::string("one"); });
    EXPECT_EQ(format.render(ctx, registry), "one");

    registry.registerRequestTag("X", [](const atrace::RequestView&) { return std::string("two"); });
    EXPECT_EQ(format.render(ctx, registry), "two");
}

TEST_F(AccessFormatTest, RenderIsDeterministic) {
    registry.registerRequestTag("MP", [](const atrace::RequestView& r) { return r.method + r.path; });
    AccessFormat format("%t %a \"%r\" %s %b %{User-Agent}i %{MP}xi %T %D");
    RenderContext ctx(request, response, TestUtils::sampleStartTime(), std::chrono::microseconds(1500));
    std::string first = format.render(ctx, registry);
    std::string second = format.render(ctx, registry);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, "2026-10-17T09:30:00 127.0.0.1:51234 \"GET /index?lang=en HTTP/1.1\" 200 12 "
                     "curl/8.5.0 GET/index 0.001500 1.500000");
}

TEST_F(AccessFormatTest, DefaultFormat) {
    AccessFormat format;
    EXPECT_EQ(format.formatString(), atrace::kDefaultAccessFormat);
    RenderContext ctx(request, response, TestUtils::sampleStartTime(), std::chrono::microseconds(278));
    EXPECT_EQ(format.render(ctx),
              "127.0.0.1:51234 \"GET /index?lang=en HTTP/1.1\" 200 12 \"-\" \"curl/8.5.0\" 0.000278");
}

TEST_F(AccessFormatTest, ExampleFormatFromDocs) {
    registry.registerRequestTag("ALL_REQ_HEADERS", [](const atrace::RequestView& r) {
        std::string out = "{";
        bool first = true;
        for (const auto& h : r.headers) {
            if (!first) out += ",";
            out += h.name + ":" + h.values.front();
            first = false;
        }
        return out + "}";
    });
    std::string line = render("%t  %a  %r(%M %U %Q %V) %s %b(bytes) %T(seconds) %D(milliseconds) %{ALL_REQ_HEADERS}xi");
    EXPECT_EQ(line, "2026-10-17T09:30:00  127.0.0.1:51234  GET /index?lang=en HTTP/1.1(%M %U %Q %V) 200 "
                    "12(bytes) 0.000278(seconds) 0.278000(milliseconds) {User-Agent:curl/8.5.0,Accept:*/*}");
}

TEST_F(AccessFormatTest, EnvironmentDirective) {
    ::setenv("ACCESS_TRACE_FORMAT_ENV", "eu-west", 1);
    AccessFormat format("%{ACCESS_TRACE_FORMAT_ENV}e %{ACCESS_TRACE_FORMAT_UNSET_ENV}e");
    ::setenv("ACCESS_TRACE_FORMAT_ENV", "changed", 1);
    RenderContext ctx(request, response, TestUtils::sampleStartTime(), std::chrono::nanoseconds(0));
    EXPECT_EQ(format.render(ctx), "eu-west -");
    ::unsetenv("ACCESS_TRACE_FORMAT_ENV");
}

TEST_F(AccessFormatTest, EvaluatorExceptionPropagates) {
    registry.registerRequestTag("BOOM", [](const atrace::RequestView&) -> std::string {
        throw std::runtime_error("evaluator failed");
    });
    EXPECT_THROW(render("%s %{BOOM}xi"), std::runtime_error);
}

TEST_F(AccessFormatTest, CompileFailsAtomically) {
    EXPECT_THROW(AccessFormat::compile("%{FOO"), CompileError);
    EXPECT_THROW(AccessFormat::compile("%Z"), CompileError);
    EXPECT_THROW(AccessFormat::compile("%s %b %Z"), CompileError);
}

TEST_F(AccessFormatTest, CustomTagsAndUnresolved) {
    AccessFormat format("%{A}xi %{B}xo %{A}xi %{C}xi");
    std::vector<std::string> req = format.customTags(atrace::Direction::Request);
    ASSERT_EQ(req.size(), 2u);
    EXPECT_EQ(req[0], "A");
    EXPECT_EQ(req[1], "C");
    ASSERT_EQ(format.customTags(atrace::Direction::Response).size(), 1u);

    registry.registerRequestTag("A", [](const atrace::RequestView&) { return std::string("a"); });
    std::vector<std::string> unresolved = format.unresolvedTags(registry);
    ASSERT_EQ(unresolved.size(), 2u);
    EXPECT_EQ(unresolved[0], "%{C}xi");
    EXPECT_EQ(unresolved[1], "%{B}xo");
}
