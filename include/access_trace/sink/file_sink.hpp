#ifndef ACCESS_TRACE_FILE_SINK_HPP
#define ACCESS_TRACE_FILE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/file_transport.hpp"

namespace atrace {
    class FileSink : public ISink {
    public:
        explicit FileSink(const std::string &filename) {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<FileTransport>(filename));
        }

        void write(const LogEntry &entry) override {
            formatAndSend(entry);
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_FILE_SINK_HPP
