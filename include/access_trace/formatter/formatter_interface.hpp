#ifndef ACCESS_TRACE_FORMATTER_INTERFACE_HPP
#define ACCESS_TRACE_FORMATTER_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include <string>

namespace atrace {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogEntry &entry) const = 0;
    };
} // namespace atrace

#endif // ACCESS_TRACE_FORMATTER_INTERFACE_HPP
