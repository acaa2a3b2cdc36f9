#ifndef ACCESS_TRACE_LOG_LEVEL_HPP
#define ACCESS_TRACE_LOG_LEVEL_HPP

namespace atrace {
    /// Severity of a log entry. Access lines use one configurable level for
    /// ordinary responses and another for server errors (see levelForStatus).
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    /// Level an access line is logged at: serverError for 5xx responses and
    /// anything above, normal otherwise.
    inline LogLevel levelForStatus(int status, LogLevel normal, LogLevel serverError) {
        return status >= 500 ? serverError : normal;
    }
} // namespace atrace

#endif // ACCESS_TRACE_LOG_LEVEL_HPP
