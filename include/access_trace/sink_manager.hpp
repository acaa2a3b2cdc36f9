#ifndef ACCESS_TRACE_SINK_MANAGER_HPP
#define ACCESS_TRACE_SINK_MANAGER_HPP

#include "sink/sink_interface.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

namespace atrace {
    /// Fans each entry out to every sink. A sink that throws does not keep
    /// the entry from the others; the failure is reported on stderr.
    /// Sinks may be added while the worker thread is writing.
    class SinkManager {
    public:
        void addSink(std::unique_ptr<ISink> sink) {
            std::lock_guard<std::mutex> lock(m_sinksMutex);
            m_sinks.push_back(std::move(sink));
        }

        void log(const LogEntry &entry) {
            std::lock_guard<std::mutex> lock(m_sinksMutex);
            for (const auto &sink: m_sinks) {
                try {
                    sink->write(entry);
                } catch (const std::exception &e) {
                    std::cerr << "[access_trace] sink write failed: " << e.what() << '\n';
                }
            }
        }

        size_t sinkCount() const {
            std::lock_guard<std::mutex> lock(m_sinksMutex);
            return m_sinks.size();
        }

    private:
        mutable std::mutex m_sinksMutex;
        std::vector<std::unique_ptr<ISink> > m_sinks;
    };
} // namespace atrace

#endif // ACCESS_TRACE_SINK_MANAGER_HPP
