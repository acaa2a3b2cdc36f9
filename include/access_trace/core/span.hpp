#ifndef ACCESS_TRACE_SPAN_HPP
#define ACCESS_TRACE_SPAN_HPP

#include "exchange.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace atrace {

    /// Opaque correlation handle for the log lines of one request.
    /// The format engine never looks inside; sinks print it.
    class Span {
    public:
        typedef std::vector<std::pair<std::string, std::string> > Properties;

        /// The empty span: nothing to correlate.
        Span() {}

        Span(const std::string& name, const std::string& id, Properties properties = Properties())
            : m_name(name), m_id(id), m_properties(std::move(properties)) {}

        static Span none() { return Span(); }

        bool isNone() const { return m_name.empty() && m_id.empty() && m_properties.empty(); }

        const std::string& name() const { return m_name; }
        const std::string& id() const { return m_id; }
        const Properties& properties() const { return m_properties; }

        Span& with(const std::string& key, const std::string& value) {
            m_properties.push_back(std::make_pair(key, value));
            return *this;
        }

    private:
        std::string m_name;
        std::string m_id;
        Properties m_properties;
    };

    /// Derives a span from the request before the handler runs.
    using SpanFactory = std::function<Span(const RequestView&)>;

namespace detail {
    inline std::vector<Span>& activeSpans() {
        static thread_local std::vector<Span> s_spans;
        return s_spans;
    }
} // namespace detail

    /// The innermost span activated on this thread, or nullptr.
    inline const Span* currentSpan() {
        std::vector<Span>& spans = detail::activeSpans();
        return spans.empty() ? nullptr : &spans.back();
    }

    /// RAII activation of a span on the current thread. Scopes nest; the
    /// innermost one wins until it is destroyed. An empty span activates
    /// nothing.
    class SpanScope {
    public:
        explicit SpanScope(const Span& span) : m_active(!span.isNone()) {
            if (m_active) detail::activeSpans().push_back(span);
        }

        ~SpanScope() {
            if (m_active) detail::activeSpans().pop_back();
        }

        SpanScope(const SpanScope&) = delete;
        SpanScope& operator=(const SpanScope&) = delete;

    private:
        bool m_active;
    };

} // namespace atrace

#endif // ACCESS_TRACE_SPAN_HPP
