#ifndef ACCESS_TRACE_DIRECTIVE_HPP
#define ACCESS_TRACE_DIRECTIVE_HPP

#include <string>

namespace atrace {

    /// Which side of the exchange a header or custom tag reads from.
    enum class Direction {
        Request,   // %{NAME}i, %{NAME}xi
        Response   // %{NAME}o, %{NAME}xo
    };

    enum class DirectiveKind {
        BuiltIn,      // %X, and %{r}a (key 'a', parameter "r")
        Header,       // %{NAME}i / %{NAME}o
        CustomTag,    // %{NAME}xi / %{NAME}xo
        Environment   // %{NAME}e, value captured at compile time
    };

    struct DirectiveSpec {
        DirectiveKind kind;
        char key;                 // only for BuiltIn
        std::string parameter;    // header, tag or variable name
        Direction direction;
        bool hasSubFormat;
        std::string subFormat;    // text between the parentheses
        bool hasValue;            // Environment: variable was set
        std::string value;        // Environment: captured value

        DirectiveSpec()
            : kind(DirectiveKind::BuiltIn)
            , key('\0')
            , direction(Direction::Request)
            , hasSubFormat(false)
            , hasValue(false) {}
    };

    /// A compiled segment: either literal text or a directive.
    struct Segment {
        bool isLiteral;
        std::string literal;       // only when isLiteral == true
        DirectiveSpec directive;   // only when isLiteral == false

        Segment() : isLiteral(true) {}

        static Segment makeLiteral(const std::string& text) {
            Segment seg;
            seg.isLiteral = true;
            seg.literal = text;
            return seg;
        }

        static Segment makeDirective(const DirectiveSpec& spec) {
            Segment seg;
            seg.isLiteral = false;
            seg.directive = spec;
            return seg;
        }
    };

} // namespace atrace

#endif // ACCESS_TRACE_DIRECTIVE_HPP
