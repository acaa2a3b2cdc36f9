#ifndef ACCESS_TRACE_FORMAT_ERROR_HPP
#define ACCESS_TRACE_FORMAT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace atrace {

    /// Thrown when an access format string cannot be compiled.
    /// offset() is the byte position of the offending character.
    class CompileError : public std::invalid_argument {
    public:
        CompileError(const std::string& what, size_t offset)
            : std::invalid_argument(what + " at offset " + std::to_string(offset))
            , m_offset(offset) {}

        size_t offset() const { return m_offset; }

    private:
        size_t m_offset;
    };

    /// Thrown when a custom tag is registered under a name no template can
    /// reference, or under a built-in directive key.
    class RegistryError : public std::invalid_argument {
    public:
        explicit RegistryError(const std::string& what)
            : std::invalid_argument(what) {}
    };

} // namespace atrace

#endif // ACCESS_TRACE_FORMAT_ERROR_HPP
