#ifndef ACCESS_TRACE_HEADER_MAP_HPP
#define ACCESS_TRACE_HEADER_MAP_HPP

#include <string>
#include <vector>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace atrace {
namespace detail {

    inline std::string asciiToLower(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        }
        return result;
    }

} // namespace detail

    /// Ordered multimap of HTTP header name -> values.
    ///
    /// Names compare case-insensitively (ASCII folding). Distinct names keep
    /// their first-insertion order, values under one name keep theirs, and
    /// the spelling used by the first add() is kept for display.
    class HeaderMap {
    public:
        struct Entry {
            std::string name;
            std::string key;                  // lowercase
            std::vector<std::string> values;
        };

        typedef std::vector<Entry>::const_iterator const_iterator;

        HeaderMap() {}

        HeaderMap(std::initializer_list<std::pair<std::string, std::string> > headers) {
            for (const auto& h : headers) {
                add(h.first, h.second);
            }
        }

        /// Append a value, creating the header if needed.
        void add(const std::string& name, const std::string& value) {
            std::string key = detail::asciiToLower(name);
            Entry* entry = findEntry(key);
            if (entry) {
                entry->values.push_back(value);
                return;
            }
            Entry e;
            e.name = name;
            e.key = std::move(key);
            e.values.push_back(value);
            m_entries.push_back(std::move(e));
        }

        /// Replace every value of a header with a single one.
        void set(const std::string& name, const std::string& value) {
            std::string key = detail::asciiToLower(name);
            Entry* entry = findEntry(key);
            if (entry) {
                entry->values.assign(1, value);
                return;
            }
            add(name, value);
        }

        bool remove(const std::string& name) {
            std::string key = detail::asciiToLower(name);
            for (std::vector<Entry>::iterator it = m_entries.begin(); it != m_entries.end(); ++it) {
                if (it->key == key) {
                    m_entries.erase(it);
                    return true;
                }
            }
            return false;
        }

        /// Values stored under name, or nullptr when the header is absent.
        const std::vector<std::string>* find(const std::string& name) const {
            std::string key = detail::asciiToLower(name);
            for (size_t i = 0; i < m_entries.size(); ++i) {
                if (m_entries[i].key == key) return &m_entries[i].values;
            }
            return nullptr;
        }

        bool contains(const std::string& name) const { return find(name) != nullptr; }

        /// First value, or fallback when absent.
        std::string first(const std::string& name, const std::string& fallback = std::string()) const {
            const std::vector<std::string>* values = find(name);
            if (!values || values->empty()) return fallback;
            return values->front();
        }

        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }
        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }

    private:
        std::vector<Entry> m_entries;

        Entry* findEntry(const std::string& key) {
            for (size_t i = 0; i < m_entries.size(); ++i) {
                if (m_entries[i].key == key) return &m_entries[i];
            }
            return nullptr;
        }
    };

} // namespace atrace

#endif // ACCESS_TRACE_HEADER_MAP_HPP
