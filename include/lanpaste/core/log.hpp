#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "lanpaste/core/errors.hpp"

namespace lanpaste::core {

    struct LogField {
        std::string key;
        std::string value;
    };

    LogField str_field(std::string_view key, std::string_view value);
    LogField int_field(std::string_view key, std::int64_t value);
    LogField bool_field(std::string_view key, bool value);
    LogField status_field(Status s);

    // LANPASTE_LOG_LEVEL / LANPASTE_LOG_PATTERN override the arguments when set.
    void init_logging(std::string_view level, std::string_view pattern = {});
    void shutdown_logging();

    void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace lanpaste::core

#define LANPASTE_LOG_DEBUG(message, ...) ::lanpaste::core::log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define LANPASTE_LOG_INFO(message, ...) ::lanpaste::core::log(spdlog::level::info, (message), ##__VA_ARGS__)
#define LANPASTE_LOG_WARN(message, ...) ::lanpaste::core::log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define LANPASTE_LOG_ERROR(message, ...) ::lanpaste::core::log(spdlog::level::err, (message), ##__VA_ARGS__)
