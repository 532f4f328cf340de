#include "lanpaste/cli/commands.hpp"

#include <cstring>

namespace lanpaste::cli {
    lanpaste::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        using lanpaste::core::make_status;
        using lanpaste::core::StatusCode;
        using lanpaste::core::StatusDomain;

        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            // "lanpaste --help" reads as the help command
            if (std::strcmp(cmd, "--help") != 0 && std::strcmp(cmd, "-h") != 0) {
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            cmd = "help";
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                match = &specs[i];
                break;
            }
        }
        if (match == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return lanpaste::core::ok_status();
    }
} // namespace lanpaste::cli
