#include "lanpaste/cli/serve.hpp"

#include <array>
#include <exception>
#include <string>

namespace lanpaste::cli {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        constexpr u32 kMaxParsedOptions = 64;

        [[nodiscard]] Status invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
    } // namespace

    Status build_serve_config(const ParsedOptions& opts, lanpaste::service::ServeConfig* out, bool* help) noexcept {
        if (out == nullptr || help == nullptr || (opts.len > 0 && opts.data == nullptr)) {
            return invalid();
        }
        *help = false;

        try {
            for (u32 i = 0; i < opts.len; ++i) {
                const ParsedOption& o = opts.data[i];
                switch (o.id) {
                    case OptionId::Help:
                        *help = true;
                        break;
                    case OptionId::Dir:
                        out->dir = o.value.str;
                        break;
                    case OptionId::Bind: {
                        const Status s = lanpaste::service::parse_bind(o.value.str, &out->bind_host, &out->bind_port);
                        if (!is_ok(s)) {
                            return invalid();
                        }
                        break;
                    }
                    case OptionId::Token:
                        out->token = std::string(o.value.str);
                        break;
                    case OptionId::ApiKeysFile:
                        out->api_keys_file = std::filesystem::path(o.value.str);
                        break;
                    case OptionId::MaxBytes:
                        if (o.value.i64v <= 0) {
                            return invalid();
                        }
                        out->max_bytes = static_cast<lanpaste::core::u64>(o.value.i64v);
                        break;
                    case OptionId::Push: {
                        const Status s = lanpaste::service::parse_push_mode(o.value.str, &out->push);
                        if (!is_ok(s)) {
                            return invalid();
                        }
                        break;
                    }
                    case OptionId::Remote:
                        out->remote = o.value.str;
                        break;
                    case OptionId::AllowCidr: {
                        lanpaste::security::CidrBlock block{};
                        const Status s = lanpaste::security::parse_cidr(o.value.str, &block);
                        if (!is_ok(s)) {
                            return invalid();
                        }
                        out->allow_cidr.push_back(block);
                        break;
                    }
                    case OptionId::GitAuthorName:
                        out->git_author_name = o.value.str;
                        break;
                    case OptionId::GitAuthorEmail:
                        out->git_author_email = o.value.str;
                        break;
                    case OptionId::TrustForwardedFor:
                        out->trust_forwarded_for = true;
                        break;
                    case OptionId::LogLevel:
                        out->log_level = o.value.str;
                        break;
                    case OptionId::None:
                        return invalid();
                }
            }
        } catch (const std::exception&) {
            return make_status(StatusDomain::Cli, StatusCode::Internal);
        }
        return ok_status();
    }

    Status parse_serve_args(const CliArgs& args, lanpaste::service::ServeConfig* out, bool* help) noexcept {
        std::array<ParsedOption, kMaxParsedOptions> storage{};
        ParsedOptions opts{storage.data(), 0, kMaxParsedOptions};
        u32 consumed = 0;
        Status s = parse_options(args, kServeOptions, kServeOptionCount, &opts, &consumed);
        if (!is_ok(s)) {
            return s;
        }
        if (consumed != args.argc) {
            return invalid();
        }
        return build_serve_config(opts, out, help);
    }

} // namespace lanpaste::cli
