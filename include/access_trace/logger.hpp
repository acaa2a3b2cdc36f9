#ifndef ACCESS_TRACE_LOGGER_HPP
#define ACCESS_TRACE_LOGGER_HPP

#include "core/log_common.hpp"
#include "core/log_entry.hpp"
#include "core/span.hpp"
#include "sink_manager.hpp"
#include "sink/console_sink.hpp"
#include "formatter/formatter_interface.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

namespace atrace {

    /// Asynchronous sink pipeline.
    ///
    /// log() stamps the entry with the wall clock and with the span active on
    /// the calling thread, then queues it; one worker thread hands queued
    /// entries to every sink in order. flush() blocks until everything queued
    /// so far has been written.
    class Logger {
    public:
        explicit Logger(LogLevel minLevel = LogLevel::INFO, bool addDefaultConsoleSink = true)
            : m_minLevel(minLevel)
            , m_isRunning(true)
            , m_inFlight(0) {
            if (addDefaultConsoleSink) {
                addSink<ConsoleSink>();
            }
            m_logThread = std::thread(&Logger::processLogQueue, this);
        }

        ~Logger() {
            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                m_isRunning = false;
            }
            m_logCV.notify_one();
            if (m_logThread.joinable()) {
                m_logThread.join();
            }
        }

        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        Logger(Logger &&) = delete;

        Logger &operator=(Logger &&) = delete;

        void setMinLevel(LogLevel level) {
            m_minLevel = level;
        }

        LogLevel getMinLevel() const {
            return m_minLevel;
        }

        bool isEnabled(LogLevel level) const {
            return level >= m_minLevel.load();
        }

        /// Safe while logging; a new sink sees entries not yet written.
        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args &&... args) {
            m_sinkManager.addSink(detail::make_unique<SinkType>(std::forward<Args>(args)...));
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value && std::is_base_of<IFormatter,
                                    FormatterType>::value>::type
        addSink(Args &&... args) {
            auto sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<FormatterType>());
            m_sinkManager.addSink(std::move(sink));
        }

        void addCustomSink(std::unique_ptr<ISink> sink) {
            m_sinkManager.addSink(std::move(sink));
        }

        size_t sinkCount() const { return m_sinkManager.sinkCount(); }

        void log(LogLevel level, const std::string &message) {
            if (!isEnabled(level)) return;

            const Span *span = currentSpan();
            LogEntry entry(level, message, std::chrono::system_clock::now(),
                           span ? *span : Span::none());

            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                m_logQueue.push(std::move(entry));
            }
            m_logCV.notify_one();
        }

        void trace(const std::string &message) { log(LogLevel::TRACE, message); }

        void debug(const std::string &message) { log(LogLevel::DEBUG, message); }

        void info(const std::string &message) { log(LogLevel::INFO, message); }

        void warn(const std::string &message) { log(LogLevel::WARN, message); }

        void error(const std::string &message) { log(LogLevel::ERROR, message); }

        void fatal(const std::string &message) { log(LogLevel::FATAL, message); }

        /// Wait until every entry queued before this call reached the sinks.
        void flush() {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_flushCV.wait(lock, [this] { return m_logQueue.empty() && m_inFlight == 0; });
        }

    private:
        std::atomic<LogLevel> m_minLevel;
        bool m_isRunning;
        size_t m_inFlight;
        std::mutex m_queueMutex;
        std::condition_variable m_logCV;
        std::condition_variable m_flushCV;
        std::queue<LogEntry> m_logQueue;
        std::thread m_logThread;
        SinkManager m_sinkManager;

        void processLogQueue() {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            for (;;) {
                m_logCV.wait(lock, [this] { return !m_logQueue.empty() || !m_isRunning; });

                // Drain before honoring shutdown so nothing queued is lost.
                while (!m_logQueue.empty()) {
                    LogEntry entry = std::move(m_logQueue.front());
                    m_logQueue.pop();
                    ++m_inFlight;
                    lock.unlock();

                    m_sinkManager.log(entry);

                    lock.lock();
                    --m_inFlight;
                }
                m_flushCV.notify_all();

                if (!m_isRunning) break;
            }
        }
    };
} // namespace atrace

#endif // ACCESS_TRACE_LOGGER_HPP
