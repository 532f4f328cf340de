#pragma once

#include <type_traits>

#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/types.hpp"

namespace lanpaste::cli {
    using u8 = lanpaste::core::u8;
    using u32 = lanpaste::core::u32;
    using i64 = lanpaste::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Help = 1,
        Dir = 2,
        Bind = 3,
        Token = 4,
        ApiKeysFile = 5,
        MaxBytes = 6,
        Push = 7,
        Remote = 8,
        AllowCidr = 9,
        GitAuthorName = 10,
        GitAuthorEmail = 11,
        TrustForwardedFor = 12,
        LogLevel = 13,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails with Invalid once cap is reached.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Accepts --name value, --name=value, -x value and -xvalue. Stops at the
    // first positional argument or after "--"; *consumed counts the tokens used.
    lanpaste::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace lanpaste::cli
