#ifndef ACCESS_TRACE_CONSOLE_SINK_HPP
#define ACCESS_TRACE_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/stdout_transport.hpp"

namespace atrace {
    enum class ConsoleStream { StdOut, StdErr };

    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(ConsoleStream stream = ConsoleStream::StdOut) {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            if (stream == ConsoleStream::StdErr) {
                setTransport(detail::make_unique<StderrTransport>());
            } else {
                setTransport(detail::make_unique<StdoutTransport>());
            }
        }

        void write(const LogEntry &entry) override {
            formatAndSend(entry);
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_CONSOLE_SINK_HPP
