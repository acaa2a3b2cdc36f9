#ifndef ACCESS_TRACE_TRANSPORT_INTERFACE_HPP
#define ACCESS_TRACE_TRANSPORT_INTERFACE_HPP

#include <string>

namespace atrace {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace atrace

#endif // ACCESS_TRACE_TRANSPORT_INTERFACE_HPP
