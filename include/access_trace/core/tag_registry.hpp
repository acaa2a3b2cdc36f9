#ifndef ACCESS_TRACE_TAG_REGISTRY_HPP
#define ACCESS_TRACE_TAG_REGISTRY_HPP

#include "exchange.hpp"
#include "directive.hpp"
#include "directive_parser.hpp"
#include "format_error.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace atrace {

    /// Evaluator for %{NAME}xi. By convention returns "-" for "no value".
    using RequestTagFn = std::function<std::string(const RequestView&)>;

    /// Evaluator for %{NAME}xo.
    using ResponseTagFn = std::function<std::string(const ResponseView&)>;

    /// Custom tag evaluators keyed by (direction, name).
    ///
    /// Registration happens before any rendering; rendering only reads.
    /// Evaluators may be called from several threads at once.
    class TagRegistry {
    public:
        /// Register or replace the evaluator for %{name}xi.
        /// @throws RegistryError for an empty name, a name with characters a
        ///         format cannot reference, or a built-in directive key.
        TagRegistry& registerRequestTag(const std::string& name, RequestTagFn fn) {
            validateName(name);
            if (!fn) throw RegistryError("Empty evaluator for request tag: " + name);
            m_requestTags[name] = std::move(fn);
            return *this;
        }

        /// Register or replace the evaluator for %{name}xo.
        TagRegistry& registerResponseTag(const std::string& name, ResponseTagFn fn) {
            validateName(name);
            if (!fn) throw RegistryError("Empty evaluator for response tag: " + name);
            m_responseTags[name] = std::move(fn);
            return *this;
        }

        bool hasRequestTag(const std::string& name) const {
            return m_requestTags.find(name) != m_requestTags.end();
        }

        bool hasResponseTag(const std::string& name) const {
            return m_responseTags.find(name) != m_responseTags.end();
        }

        bool hasTag(Direction direction, const std::string& name) const {
            return direction == Direction::Request ? hasRequestTag(name) : hasResponseTag(name);
        }

        /// Evaluate a tag, or "-" when nothing is registered under name.
        std::string evaluateRequestTag(const std::string& name, const RequestView& request) const {
            std::map<std::string, RequestTagFn>::const_iterator it = m_requestTags.find(name);
            if (it == m_requestTags.end()) return "-";
            return it->second(request);
        }

        std::string evaluateResponseTag(const std::string& name, const ResponseView& response) const {
            std::map<std::string, ResponseTagFn>::const_iterator it = m_responseTags.find(name);
            if (it == m_responseTags.end()) return "-";
            return it->second(response);
        }

        std::vector<std::string> requestTagNames() const { return keys(m_requestTags); }
        std::vector<std::string> responseTagNames() const { return keys(m_responseTags); }

        std::vector<std::string> tagNames(Direction direction) const {
            return direction == Direction::Request ? requestTagNames() : responseTagNames();
        }

        bool empty() const { return m_requestTags.empty() && m_responseTags.empty(); }

    private:
        std::map<std::string, RequestTagFn> m_requestTags;
        std::map<std::string, ResponseTagFn> m_responseTags;

        static void validateName(const std::string& name) {
            if (!detail::isValidDirectiveName(name)) {
                throw RegistryError("Invalid custom tag name: '" + name +
                                    "' (allowed: letters, digits, '-', '_')");
            }
            if (name.size() == 1 && detail::isBuiltinKey(name[0])) {
                throw RegistryError("Custom tag name '" + name + "' is reserved for the built-in %" + name);
            }
        }

        template<typename Map>
        static std::vector<std::string> keys(const Map& m) {
            std::vector<std::string> result;
            result.reserve(m.size());
            for (typename Map::const_iterator it = m.begin(); it != m.end(); ++it) {
                result.push_back(it->first);
            }
            return result;
        }
    };

} // namespace atrace

#endif // ACCESS_TRACE_TAG_REGISTRY_HPP
