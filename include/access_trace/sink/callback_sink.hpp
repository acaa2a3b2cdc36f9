#ifndef ACCESS_TRACE_CALLBACK_SINK_HPP
#define ACCESS_TRACE_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include <functional>
#include <string>
#include <memory>

namespace atrace {

    /// Sink that invokes a user-provided callback for each log entry.
    ///
    /// Two variants:
    ///   1. EntryCallback: receives the raw LogEntry, span included.
    ///   2. StringCallback: receives the formatted string
    ///      (MessageOnlyFormatter by default, or a user-supplied formatter).
    ///
    /// @note The callback runs on the logger's worker thread without a
    ///       lock. Shared state touched by the callback needs its own
    ///       synchronization.
    class CallbackSink : public ISink {
    public:
        using EntryCallback  = std::function<void(const LogEntry&)>;
        using StringCallback = std::function<void(const std::string&)>;

        /// In C++11, wrap lambdas in the typedef to avoid overload ambiguity:
        /// @code
        ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
        /// @endcode
        explicit CallbackSink(EntryCallback cb)
            : m_entryCallback(std::move(cb))
            , m_mode(Mode::Entry) {}

        explicit CallbackSink(StringCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::String) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(detail::make_unique<MessageOnlyFormatter>());
            }
        }

        void write(const LogEntry& entry) override {
            if (m_mode == Mode::Entry) {
                if (m_entryCallback) {
                    m_entryCallback(entry);
                }
            } else if (m_stringCallback && m_formatter) {
                m_stringCallback(m_formatter->format(entry));
            }
        }

    private:
        enum class Mode { Entry, String };

        EntryCallback  m_entryCallback;
        StringCallback m_stringCallback;
        Mode           m_mode;
    };

} // namespace atrace

#endif // ACCESS_TRACE_CALLBACK_SINK_HPP
