#include "lanpaste/core/clock.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace lanpaste::core {
    namespace {
        std::tm to_utc_tm(TimestampMs ts) noexcept {
            std::time_t secs = static_cast<std::time_t>(ts / 1000);
            if (ts < 0 && ts % 1000 != 0) {
                --secs;
            }
            std::tm tm{};
            gmtime_r(&secs, &tm);
            return tm;
        }
    } // namespace

    TimestampMs now_ms() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    }

    i64 now_unix_seconds() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::seconds>(now).count();
    }

    std::string format_rfc3339_ms(TimestampMs ts) {
        const std::tm tm = to_utc_tm(ts);
        i64 millis = ts % 1000;
        if (millis < 0) {
            millis += 1000;
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return buf;
    }

    std::string utc_date_path(TimestampMs ts) {
        const std::tm tm = to_utc_tm(ts);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d/%02d/%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
        return buf;
    }

} // namespace lanpaste::core
