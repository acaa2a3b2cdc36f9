#ifndef ACCESS_TRACE_ACCESS_LOGGER_CONFIGURATION_HPP
#define ACCESS_TRACE_ACCESS_LOGGER_CONFIGURATION_HPP

#include "access_logger.hpp"
#include "core/access_format.hpp"
#include "core/log_common.hpp"
#include "core/log_level.hpp"
#include "core/path_filter.hpp"
#include "core/span.hpp"
#include "core/tag_registry.hpp"
#include "formatter/formatter_interface.hpp"
#include "logger.hpp"
#include "sink/sink_interface.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace atrace {

    /// Fluent builder for an AccessLogger.
    ///
    /// Usage:
    /// @code
    ///   auto access = AccessLogger::configure()
    ///       .format("%a \"%r\" %s %b(bytes) %T(seconds) %{ALL}xi")
    ///       .requestTag("ALL", [](const RequestView& r) { return r.method; })
    ///       .exclude("/health")
    ///       .spanFactory([](const RequestView&) { return Span("R", nextId()); })
    ///       .writeTo<FileSink>("access.log")
    ///       .build();
    /// @endcode
    ///
    /// Settings are stored as they are given; tag names and exclude patterns
    /// are validated immediately. build() compiles the format, freezes the
    /// registry and wires the Logger.
    class AccessLoggerConfiguration {
    public:
        AccessLoggerConfiguration()
            : m_formatStr(kDefaultAccessFormat)
            , m_level(LogLevel::INFO)
            , m_serverErrorLevel(LogLevel::INFO)
            , m_built(false) {}

        AccessLoggerConfiguration(const AccessLoggerConfiguration&) = delete;
        AccessLoggerConfiguration& operator=(const AccessLoggerConfiguration&) = delete;
        AccessLoggerConfiguration(AccessLoggerConfiguration&&) = default;
        AccessLoggerConfiguration& operator=(AccessLoggerConfiguration&&) = default;

        AccessLoggerConfiguration& format(const std::string& formatStr) {
            m_formatStr = formatStr;
            return *this;
        }

        /// @throws RegistryError (see TagRegistry::registerRequestTag).
        AccessLoggerConfiguration& requestTag(const std::string& name, RequestTagFn fn) {
            m_registry.registerRequestTag(name, std::move(fn));
            return *this;
        }

        AccessLoggerConfiguration& responseTag(const std::string& name, ResponseTagFn fn) {
            m_registry.registerResponseTag(name, std::move(fn));
            return *this;
        }

        AccessLoggerConfiguration& exclude(const std::string& path) {
            m_filter.exclude(path);
            return *this;
        }

        /// @throws std::invalid_argument for an invalid pattern.
        AccessLoggerConfiguration& excludeRegex(const std::string& pattern) {
            m_filter.excludeRegex(pattern);
            return *this;
        }

        AccessLoggerConfiguration& spanFactory(SpanFactory factory) {
            m_spanFactory = std::move(factory);
            return *this;
        }

        /// Level of ordinary access lines.
        AccessLoggerConfiguration& level(LogLevel lvl) {
            m_level = lvl;
            return *this;
        }

        /// Level of lines whose status is 500 or above.
        AccessLoggerConfiguration& serverErrorLevel(LogLevel lvl) {
            m_serverErrorLevel = lvl;
            return *this;
        }

        /// Log through an existing Logger instead of a private one.
        /// writeTo() sinks are added to it at build().
        AccessLoggerConfiguration& logger(std::shared_ptr<Logger> shared) {
            m_logger = std::move(shared);
            return *this;
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            AccessLoggerConfiguration&
        >::type
        writeTo(Args&&... args) {
            m_sinks.push_back(detail::make_unique<SinkType>(std::forward<Args>(args)...));
            return *this;
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_base_of<IFormatter, FormatterType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            AccessLoggerConfiguration&
        >::type
        writeTo(Args&&... args) {
            std::unique_ptr<ISink> sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<FormatterType>());
            m_sinks.push_back(std::move(sink));
            return *this;
        }

        AccessLoggerConfiguration& writeTo(std::unique_ptr<ISink> sink) {
            if (sink) m_sinks.push_back(std::move(sink));
            return *this;
        }

        /// @throws CompileError if the format is malformed.
        /// @throws std::logic_error if called more than once.
        AccessLogger build() {
            if (m_built) {
                throw std::logic_error("AccessLoggerConfiguration::build() called more than once");
            }

            std::shared_ptr<AccessLogger::Inner> inner = std::make_shared<AccessLogger::Inner>();
            inner->format = AccessFormat::compile(m_formatStr);
            m_built = true;

            inner->registry = std::move(m_registry);
            inner->filter = std::move(m_filter);
            inner->spanFactory = std::move(m_spanFactory);
            inner->level = m_level;
            inner->serverErrorLevel = m_serverErrorLevel;

            if (!m_logger) {
                m_logger = std::make_shared<Logger>(LogLevel::TRACE, m_sinks.empty());
            }
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                m_logger->addCustomSink(std::move(m_sinks[i]));
            }
            m_sinks.clear();

            warnAboutTags(*inner);

            return AccessLogger(std::shared_ptr<const AccessLogger::Inner>(inner), m_logger);
        }

    private:
        std::string m_formatStr;
        TagRegistry m_registry;
        PathFilter m_filter;
        SpanFactory m_spanFactory;
        LogLevel m_level;
        LogLevel m_serverErrorLevel;
        std::shared_ptr<Logger> m_logger;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        bool m_built;

        void warnAboutTags(const AccessLogger::Inner& inner) {
            std::vector<std::string> unresolved = inner.format.unresolvedTags(inner.registry);
            for (size_t i = 0; i < unresolved.size(); ++i) {
                m_logger->warn("Access format references " + unresolved[i] +
                               " but no evaluator is registered; it will render as '-'");
            }
            warnUnused(inner, Direction::Request, "request");
            warnUnused(inner, Direction::Response, "response");
        }

        void warnUnused(const AccessLogger::Inner& inner, Direction direction, const char* what) {
            std::vector<std::string> used = inner.format.customTags(direction);
            std::vector<std::string> registered = inner.registry.tagNames(direction);
            for (size_t i = 0; i < registered.size(); ++i) {
                if (std::find(used.begin(), used.end(), registered[i]) == used.end()) {
                    m_logger->warn(std::string("Custom ") + what + " tag '" + registered[i] +
                                   "' is registered but not used by the access format");
                }
            }
        }
    };

    inline AccessLoggerConfiguration AccessLogger::configure() {
        return AccessLoggerConfiguration();
    }

} // namespace atrace

#endif // ACCESS_TRACE_ACCESS_LOGGER_CONFIGURATION_HPP
