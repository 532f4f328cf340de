#include "lanpaste/core/log.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lanpaste::core {
    namespace {
        constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

        std::string resolve_level(std::string_view level) {
            if (const char* env = std::getenv("LANPASTE_LOG_LEVEL")) {
                return env;
            }
            if (!level.empty()) {
                return std::string(level);
            }
            return "info";
        }

        std::string resolve_pattern(std::string_view pattern) {
            if (const char* env = std::getenv("LANPASTE_LOG_PATTERN")) {
                return env;
            }
            if (!pattern.empty()) {
                return std::string(pattern);
            }
            return kDefaultPattern;
        }

        std::string serialize_fields(std::initializer_list<LogField> fields) {
            std::ostringstream out;
            bool first = true;
            for (const auto& field : fields) {
                if (!first) {
                    out << ' ';
                }
                first = false;
                out << field.key << '=' << field.value;
            }
            return out.str();
        }
    } // namespace

    LogField str_field(std::string_view key, std::string_view value) {
        return {std::string(key), std::string(value)};
    }

    LogField int_field(std::string_view key, std::int64_t value) {
        return {std::string(key), std::to_string(value)};
    }

    LogField bool_field(std::string_view key, bool value) {
        return {std::string(key), value ? "true" : "false"};
    }

    LogField status_field(Status s) {
        std::string v = status_domain_name(s.domain);
        v += '/';
        v += status_code_name(s.code);
        if (s.aux != 0) {
            v += '/';
            v += std::to_string(s.aux);
        }
        return {"status", std::move(v)};
    }

    void init_logging(std::string_view level, std::string_view pattern) {
        auto logger = spdlog::get("lanpaste");
        if (!logger) {
            logger = spdlog::stderr_color_mt("lanpaste");
        }
        logger->set_pattern(resolve_pattern(pattern));
        logger->set_level(spdlog::level::from_str(resolve_level(level)));
        spdlog::set_default_logger(std::move(logger));
        spdlog::flush_on(spdlog::level::warn);
    }

    void shutdown_logging() {
        spdlog::shutdown();
    }

    void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
        if (!spdlog::should_log(level)) {
            return;
        }
        const std::string serialized = serialize_fields(fields);
        if (serialized.empty()) {
            spdlog::log(level, "{}", message);
            return;
        }
        spdlog::log(level, "{} {}", message, serialized);
    }

} // namespace lanpaste::core
