#ifndef ACCESS_TRACE_LOG_COMMON_HPP
#define ACCESS_TRACE_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <memory>
#include <utility>

namespace atrace {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::tm toLocalTm(std::time_t t) {
        std::tm tmBuf;
#if defined(_MSC_VER)
        localtime_s(&tmBuf, &t);
#else
        localtime_r(&t, &tmBuf);
#endif
        return tmBuf;
    }

    inline std::tm toUtcTm(std::time_t t) {
        std::tm tmBuf;
#if defined(_MSC_VER)
        gmtime_s(&tmBuf, &t);
#else
        gmtime_r(&t, &tmBuf);
#endif
        return tmBuf;
    }
} // namespace detail

    /// Local wall-clock time with milliseconds, used as the line prefix by
    /// the human-readable and JSON formatters.
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto nowTime = std::chrono::system_clock::to_time_t(time);
        auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;
        std::tm tmBuf = detail::toLocalTm(nowTime);

        char buf[64];
        size_t written = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf);
        std::string result(buf, written);

        char msBuf[8];
        // Pre-epoch time points give a negative remainder.
        std::snprintf(msBuf, sizeof(msBuf), ".%03d", static_cast<int>((nowMs.count() + 1000) % 1000));
        result += msBuf;
        return result;
    }

    /// UTC, second precision: 2026-10-17T09:30:00
    inline std::string formatIsoTimestamp(const std::chrono::system_clock::time_point &time) {
        std::tm tmBuf = detail::toUtcTm(std::chrono::system_clock::to_time_t(time));
        char buf[32];
        size_t written = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmBuf);
        return std::string(buf, written);
    }

    /// Fixed six fractional digits, independent of stream state.
    inline std::string formatFixed6(double value) {
        char buf[64];
        int written = std::snprintf(buf, sizeof(buf), "%.6f", value);
        if (written < 0) return std::string();
        return std::string(buf, static_cast<size_t>(written) < sizeof(buf) ? static_cast<size_t>(written) : sizeof(buf) - 1);
    }
} // namespace atrace

#endif // ACCESS_TRACE_LOG_COMMON_HPP
