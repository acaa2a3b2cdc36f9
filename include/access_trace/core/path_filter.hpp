#ifndef ACCESS_TRACE_PATH_FILTER_HPP
#define ACCESS_TRACE_PATH_FILTER_HPP

#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace atrace {

    /// Paths whose requests are not access-logged: exact matches and
    /// ECMAScript patterns searched anywhere in the path.
    class PathFilter {
    public:
        void exclude(const std::string& path) {
            m_exact.insert(path);
        }

        /// @throws std::invalid_argument if the pattern does not compile.
        void excludeRegex(const std::string& pattern) {
            try {
                m_patterns.push_back(std::regex(pattern, std::regex::ECMAScript | std::regex::optimize));
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("Invalid exclude pattern '" + pattern + "': " + e.what());
            }
            m_patternSources.push_back(pattern);
        }

        bool matches(const std::string& path) const {
            if (m_exact.find(path) != m_exact.end()) return true;
            for (size_t i = 0; i < m_patterns.size(); ++i) {
                if (std::regex_search(path, m_patterns[i])) return true;
            }
            return false;
        }

        bool empty() const { return m_exact.empty() && m_patterns.empty(); }

        const std::vector<std::string>& patterns() const { return m_patternSources; }

    private:
        std::set<std::string> m_exact;
        std::vector<std::regex> m_patterns;
        std::vector<std::string> m_patternSources;
    };

} // namespace atrace

#endif // ACCESS_TRACE_PATH_FILTER_HPP
