#include "lanpaste/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace lanpaste::cli {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;

    namespace {
        [[nodiscard]] Status invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::memcmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return ok_status();
        }

        // Fills opt.value from a textual value according to the option type.
        [[nodiscard]] Status assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return ok_status();
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return invalid();
                    }
                    opt->value.i64v = v;
                    return ok_status();
                }
                case OptionType::Flag:
                    break;
            }
            return invalid();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                const Status s = assign_value(*spec, value, &opt);
                if (!is_ok(s)) {
                    return s;
                }
            }

            const Status s = push_option(out, opt);
            if (!is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return ok_status();
    }
} // namespace lanpaste::cli
