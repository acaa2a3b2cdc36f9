#ifndef ACCESS_TRACE_DIRECTIVE_PARSER_HPP
#define ACCESS_TRACE_DIRECTIVE_PARSER_HPP

#include "directive.hpp"
#include "format_error.hpp"
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>

namespace atrace {

    /// Apache-style combined format used when none is configured.
    static const char* const kDefaultAccessFormat =
        "%a \"%r\" %s %b \"%{Referer}i\" \"%{User-Agent}i\" %T";

namespace detail {

    /// Single-character directive keys: %t %a %r %M %U %Q %V %s %b %T %D
    inline bool isBuiltinKey(char c) {
        return c != '\0' && std::strchr("tarMUQVsbTD", c) != nullptr;
    }

    /// Characters allowed inside %{...}.
    inline bool isDirectiveNameChar(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    }

    inline bool isValidDirectiveName(const std::string& name) {
        if (name.empty()) return false;
        for (size_t i = 0; i < name.size(); ++i) {
            if (!isDirectiveNameChar(name[i])) return false;
        }
        return true;
    }

    /// Parse the part after %{NAME}: i, o, xi, xo, e, or a (NAME == "r").
    /// pos points just past '}' and is advanced past the suffix.
    inline void parseBracedSuffix(const std::string& fmt, size_t& pos,
                                  const std::string& name, size_t nameOffset,
                                  DirectiveSpec& spec) {
        if (pos >= fmt.size()) {
            throw CompileError("Missing directive type after %{" + name + "}", pos);
        }
        char c = fmt[pos];
        if (c == 'x' && pos + 1 < fmt.size() && (fmt[pos + 1] == 'i' || fmt[pos + 1] == 'o')) {
            // Names reserved by TagRegistry::validateName.
            if (name.size() == 1 && isBuiltinKey(name[0])) {
                throw CompileError("Custom tag name '" + name + "' is reserved for the built-in %" + name,
                                   nameOffset);
            }
            spec.kind = DirectiveKind::CustomTag;
            spec.direction = fmt[pos + 1] == 'i' ? Direction::Request : Direction::Response;
            pos += 2;
            return;
        }
        switch (c) {
            case 'i':
            case 'o':
                spec.kind = DirectiveKind::Header;
                spec.direction = c == 'i' ? Direction::Request : Direction::Response;
                break;
            case 'e': {
                spec.kind = DirectiveKind::Environment;
                const char* val = std::getenv(name.c_str());
                spec.hasValue = val != nullptr;
                if (val) spec.value = val;
                break;
            }
            case 'a':
                if (name != "r") {
                    throw CompileError("Unsupported address directive %{" + name + "}a", nameOffset);
                }
                spec.kind = DirectiveKind::BuiltIn;
                spec.key = 'a';
                break;
            default:
                throw CompileError(std::string("Unknown directive type '") + c + "' after %{" + name + "}", pos);
        }
        ++pos;
    }

} // namespace detail

    /// Parse an access format string into compiled segments.
    ///
    /// Syntax:
    ///   %%            literal %
    ///   %X            built-in directive (see detail::isBuiltinKey)
    ///   %{NAME}i      request header        %{NAME}o   response header
    ///   %{NAME}xi     custom request tag    %{NAME}xo  custom response tag
    ///   %{NAME}e      environment variable  %{r}a      real client address
    ///   %X(text)      directive followed by literal "(text)"; text is not parsed
    ///
    /// Throws CompileError on the first malformed directive. Nothing is
    /// returned on failure.
    inline std::vector<Segment> parseAccessFormat(const std::string& fmt) {
        std::vector<Segment> segments;
        std::string literal;
        size_t i = 0;

        while (i < fmt.size()) {
            if (fmt[i] != '%') {
                literal += fmt[i];
                ++i;
                continue;
            }

            const size_t start = i;
            if (i + 1 >= fmt.size()) {
                throw CompileError("Dangling '%' at end of format", start);
            }

            const char next = fmt[i + 1];
            if (next == '%') {
                literal += '%';
                i += 2;
                continue;
            }

            DirectiveSpec spec;
            if (next == '{') {
                const size_t nameOffset = i + 2;
                size_t close = fmt.find('}', nameOffset);
                if (close == std::string::npos) {
                    throw CompileError("Unterminated '{' in directive", i + 1);
                }
                std::string name = fmt.substr(nameOffset, close - nameOffset);
                if (!detail::isValidDirectiveName(name)) {
                    throw CompileError("Invalid directive name '" + name + "'", nameOffset);
                }
                i = close + 1;
                detail::parseBracedSuffix(fmt, i, name, nameOffset, spec);
                spec.parameter = name;
            } else if (detail::isBuiltinKey(next)) {
                spec.kind = DirectiveKind::BuiltIn;
                spec.key = next;
                i += 2;
            } else {
                throw CompileError(std::string("Unknown directive '%") + next + "'", start);
            }

            if (i < fmt.size() && fmt[i] == '(') {
                size_t close = fmt.find(')', i + 1);
                if (close == std::string::npos) {
                    throw CompileError("Unterminated '(' after directive", i);
                }
                spec.hasSubFormat = true;
                spec.subFormat = fmt.substr(i + 1, close - i - 1);
                i = close + 1;
            }

            if (!literal.empty()) {
                segments.push_back(Segment::makeLiteral(literal));
                literal.clear();
            }
            segments.push_back(Segment::makeDirective(spec));
        }

        if (!literal.empty()) {
            segments.push_back(Segment::makeLiteral(literal));
        }

        return segments;
    }

} // namespace atrace

#endif // ACCESS_TRACE_DIRECTIVE_PARSER_HPP
