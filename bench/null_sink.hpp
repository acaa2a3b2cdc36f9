#pragma once
#include "access_trace/sink/sink_interface.hpp"

namespace atrace {

class NullSink : public ISink {
public:
    void write(const LogEntry&) override {}
};

} // namespace atrace
