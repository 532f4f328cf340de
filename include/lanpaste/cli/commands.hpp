#pragma once

#include <type_traits>

#include "lanpaste/cli/options.hpp"
#include "lanpaste/core/errors.hpp"

namespace lanpaste::cli {
    using u32 = lanpaste::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Serve = 2,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    inline constexpr CommandSpec kCommands[] = {
        {CommandId::Help, "help"},
        {CommandId::Serve, "serve"},
    };
    inline constexpr u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

    lanpaste::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace lanpaste::cli
