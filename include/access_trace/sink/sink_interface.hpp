#ifndef ACCESS_TRACE_SINK_INTERFACE_HPP
#define ACCESS_TRACE_SINK_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace atrace {
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogEntry &entry) = 0;

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        IFormatter *formatter() const { return m_formatter.get(); }

    protected:
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;

        /// Format with the configured formatter and hand to the transport.
        void formatAndSend(const LogEntry &entry) {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(entry));
            }
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_SINK_INTERFACE_HPP
