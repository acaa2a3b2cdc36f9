#ifndef ACCESS_TRACE_ACCESS_FORMAT_HPP
#define ACCESS_TRACE_ACCESS_FORMAT_HPP

#include "directive.hpp"
#include "directive_parser.hpp"
#include "builtin_directives.hpp"
#include "tag_registry.hpp"
#include "exchange.hpp"
#include <set>
#include <string>
#include <vector>

namespace atrace {

    /// A compiled access format: parse once, render many times.
    /// Thread-safe: the segments vector is immutable after construction.
    class AccessFormat {
    public:
        /// Compiles kDefaultAccessFormat.
        AccessFormat()
            : m_segments(parseAccessFormat(kDefaultAccessFormat))
            , m_formatStr(kDefaultAccessFormat) {}

        /// @throws CompileError when formatStr is malformed.
        explicit AccessFormat(const std::string& formatStr)
            : m_segments(parseAccessFormat(formatStr))
            , m_formatStr(formatStr) {}

        static AccessFormat compile(const std::string& formatStr) {
            return AccessFormat(formatStr);
        }

        const std::string& formatString() const { return m_formatStr; }

        const std::vector<Segment>& segments() const { return m_segments; }

        bool empty() const { return m_segments.empty(); }

        /// Custom tag names referenced with the given direction, sorted.
        std::vector<std::string> customTags(Direction direction) const {
            std::set<std::string> names;
            for (size_t i = 0; i < m_segments.size(); ++i) {
                const Segment& seg = m_segments[i];
                if (!seg.isLiteral && seg.directive.kind == DirectiveKind::CustomTag &&
                    seg.directive.direction == direction) {
                    names.insert(seg.directive.parameter);
                }
            }
            return std::vector<std::string>(names.begin(), names.end());
        }

        /// Referenced custom tags the registry has no evaluator for, as
        /// "%{NAME}xi" / "%{NAME}xo". These render as "-".
        std::vector<std::string> unresolvedTags(const TagRegistry& registry) const {
            std::vector<std::string> result;
            std::vector<std::string> req = customTags(Direction::Request);
            for (size_t i = 0; i < req.size(); ++i) {
                if (!registry.hasRequestTag(req[i])) result.push_back("%{" + req[i] + "}xi");
            }
            std::vector<std::string> resp = customTags(Direction::Response);
            for (size_t i = 0; i < resp.size(); ++i) {
                if (!registry.hasResponseTag(resp[i])) result.push_back("%{" + resp[i] + "}xo");
            }
            return result;
        }

        /// Render one access line.
        /// Exceptions thrown by custom tag evaluators propagate; no partial
        /// line is returned.
        std::string render(const RenderContext& ctx, const TagRegistry& registry) const {
            std::string result;
            result.reserve(128);

            for (size_t i = 0; i < m_segments.size(); ++i) {
                const Segment& seg = m_segments[i];
                if (seg.isLiteral) {
                    result += seg.literal;
                    continue;
                }

                result += resolve(seg.directive, ctx, registry);

                if (seg.directive.hasSubFormat) {
                    result += '(';
                    result += seg.directive.subFormat;
                    result += ')';
                }
            }

            return result;
        }

        /// Render with no custom tags registered.
        std::string render(const RenderContext& ctx) const {
            static const TagRegistry kEmpty{};
            return render(ctx, kEmpty);
        }

    private:
        std::vector<Segment> m_segments;
        std::string m_formatStr;

        static std::string resolve(const DirectiveSpec& spec, const RenderContext& ctx,
                                   const TagRegistry& registry) {
            switch (spec.kind) {
                case DirectiveKind::BuiltIn:
                    return detail::evaluateBuiltin(spec.key, spec.parameter, ctx);
                case DirectiveKind::Header: {
                    const HeaderMap& headers = spec.direction == Direction::Request
                        ? ctx.request.headers : ctx.response.headers;
                    return detail::renderHeaderValues(headers.find(spec.parameter));
                }
                case DirectiveKind::CustomTag:
                    if (spec.direction == Direction::Request) {
                        return registry.evaluateRequestTag(spec.parameter, ctx.request);
                    }
                    return registry.evaluateResponseTag(spec.parameter, ctx.response);
                case DirectiveKind::Environment:
                    return spec.hasValue ? spec.value : std::string("-");
            }
            return "-";
        }
    };

} // namespace atrace

#endif // ACCESS_TRACE_ACCESS_FORMAT_HPP
