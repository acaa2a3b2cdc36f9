#ifndef ACCESS_TRACE_ACCESS_LOGGER_HPP
#define ACCESS_TRACE_ACCESS_LOGGER_HPP

#include "core/access_format.hpp"
#include "core/exchange.hpp"
#include "core/path_filter.hpp"
#include "core/span.hpp"
#include "core/tag_registry.hpp"
#include "logger.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace atrace {

    class AccessLoggerConfiguration;

    /// Renders one access line per exchange and hands it to a Logger.
    ///
    /// Built by AccessLoggerConfiguration. Copies share the same immutable
    /// format, registry and filter, so one instance can serve every
    /// request thread without locking.
    class AccessLogger {
    public:
        static AccessLoggerConfiguration configure();   // defined in access_logger_configuration.hpp

        const AccessFormat& format() const { return m_inner->format; }

        const TagRegistry& registry() const { return m_inner->registry; }

        const std::shared_ptr<Logger>& logger() const { return m_logger; }

        LogLevel level() const { return m_inner->level; }

        LogLevel serverErrorLevel() const { return m_inner->serverErrorLevel; }

        bool isExcluded(const RequestView& request) const {
            return m_inner->filter.matches(request.path);
        }

        Span makeSpan(const RequestView& request) const {
            if (!m_inner->spanFactory) return Span::none();
            return m_inner->spanFactory(request);
        }

        std::string render(const RenderContext& ctx) const {
            return m_inner->format.render(ctx, m_inner->registry);
        }

        /// Render and log at level(), or serverErrorLevel() for 5xx.
        /// A render failure (a throwing tag evaluator) is reported at ERROR in
        /// place of the line.
        void emit(const RenderContext& ctx) const {
            std::string line;
            try {
                line = render(ctx);
            } catch (const std::exception& e) {
                m_logger->error(std::string("access log line dropped: render failed: ") + e.what());
                return;
            }
            m_logger->log(levelForStatus(ctx.response.status, m_inner->level, m_inner->serverErrorLevel), line);
        }

        /// Emit with span active on the calling thread.
        void emit(const RenderContext& ctx, const Span& span) const {
            SpanScope scope(span);
            emit(ctx);
        }

        /// Run next(request) and log the exchange.
        ///
        /// Handler must be callable as ResponseView(const RequestView&).
        /// The span from the factory stays active while the handler runs and
        /// while the line is emitted. Excluded paths go straight to next().
        /// If the handler throws, nothing is logged and the exception
        /// propagates.
        template<typename Handler>
        ResponseView handle(const RequestView& request, Handler&& next) const {
            if (isExcluded(request)) {
                return next(request);
            }

            const std::chrono::system_clock::time_point start = std::chrono::system_clock::now();
            const std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();

            SpanScope scope(makeSpan(request));
            ResponseView response = next(request);

            std::chrono::nanoseconds elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - t0);
            RenderContext ctx(request, response, start, elapsed);
            emit(ctx);
            return response;
        }

    private:
        friend class AccessLoggerConfiguration;

        struct Inner {
            AccessFormat format;
            TagRegistry registry;
            PathFilter filter;
            SpanFactory spanFactory;
            LogLevel level;
            LogLevel serverErrorLevel;

            Inner() : level(LogLevel::INFO), serverErrorLevel(LogLevel::INFO) {}
        };

        AccessLogger(std::shared_ptr<const Inner> inner, std::shared_ptr<Logger> logger)
            : m_inner(std::move(inner)), m_logger(std::move(logger)) {}

        std::shared_ptr<const Inner> m_inner;
        std::shared_ptr<Logger> m_logger;
    };

} // namespace atrace

#endif // ACCESS_TRACE_ACCESS_LOGGER_HPP
