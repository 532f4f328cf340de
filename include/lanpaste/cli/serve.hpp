#pragma once

#include "lanpaste/cli/options.hpp"
#include "lanpaste/core/errors.hpp"
#include "lanpaste/service/config.hpp"

namespace lanpaste::cli {

    inline constexpr OptionSpec kServeOptions[] = {
        {OptionId::Help, OptionType::Flag, "help", 'h'},
        {OptionId::Dir, OptionType::String, "dir", 'd'},
        {OptionId::Bind, OptionType::String, "bind", 'b'},
        {OptionId::Token, OptionType::String, "token", '\0'},
        {OptionId::ApiKeysFile, OptionType::String, "api-keys-file", '\0'},
        {OptionId::MaxBytes, OptionType::I64, "max-bytes", '\0'},
        {OptionId::Push, OptionType::String, "push", '\0'},
        {OptionId::Remote, OptionType::String, "remote", '\0'},
        {OptionId::AllowCidr, OptionType::String, "allow-cidr", '\0'},
        {OptionId::GitAuthorName, OptionType::String, "git-author-name", '\0'},
        {OptionId::GitAuthorEmail, OptionType::String, "git-author-email", '\0'},
        {OptionId::TrustForwardedFor, OptionType::Flag, "trust-forwarded-for", '\0'},
        {OptionId::LogLevel, OptionType::String, "log-level", '\0'},
    };
    inline constexpr u32 kServeOptionCount = sizeof(kServeOptions) / sizeof(kServeOptions[0]);

    // Folds parsed serve options over the defaults in *out. Later occurrences
    // win except --allow-cidr, which accumulates. Does not run validate_config.
    lanpaste::core::Status build_serve_config(const ParsedOptions& opts,
        lanpaste::service::ServeConfig* out,
        bool* help) noexcept;

    // parse_options + build_serve_config; positional arguments are Invalid.
    lanpaste::core::Status parse_serve_args(const CliArgs& args,
        lanpaste::service::ServeConfig* out,
        bool* help) noexcept;

} // namespace lanpaste::cli
