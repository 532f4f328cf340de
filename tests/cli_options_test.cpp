#include <array>

#include <gtest/gtest.h>

#include "lanpaste/cli/options.hpp"
#include "lanpaste/cli/serve.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const std::array<lanpaste::cli::OptionSpec, 4> specs = {{
        {lanpaste::cli::OptionId::Dir, lanpaste::cli::OptionType::String, "dir", 'd'},
        {lanpaste::cli::OptionId::Bind, lanpaste::cli::OptionType::String, "bind", 'b'},
        {lanpaste::cli::OptionId::MaxBytes, lanpaste::cli::OptionType::I64, "max-bytes", '\0'},
        {lanpaste::cli::OptionId::TrustForwardedFor, lanpaste::cli::OptionType::Flag, "trust-forwarded-for", '\0'},
    }};

    const char* argv[] = {"--trust-forwarded-for", "--dir", "/srv/paste", "-b", "127.0.0.1:9000", "extra", "--dir"};
    const lanpaste::cli::CliArgs args{argv, 7};

    lanpaste::cli::ParsedOption buf[8]{};
    lanpaste::cli::ParsedOptions out{buf, 0, 8};
    lanpaste::cli::u32 consumed = 0;
    const lanpaste::core::Status s = lanpaste::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].type, lanpaste::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, lanpaste::cli::OptionId::Dir);
    EXPECT_STREQ(out.data[1].value.str, "/srv/paste");

    EXPECT_EQ(out.data[2].id, lanpaste::cli::OptionId::Bind);
    EXPECT_STREQ(out.data[2].value.str, "127.0.0.1:9000");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<lanpaste::cli::OptionSpec, 2> specs = {{
        {lanpaste::cli::OptionId::Dir, lanpaste::cli::OptionType::String, "dir", 'd'},
        {lanpaste::cli::OptionId::MaxBytes, lanpaste::cli::OptionType::I64, "max-bytes", 'm'},
    }};

    const char* argv[] = {"--dir=/srv/paste", "-m123"};
    const lanpaste::cli::CliArgs args{argv, 2};

    lanpaste::cli::ParsedOption buf[8]{};
    lanpaste::cli::ParsedOptions out{buf, 0, 8};
    lanpaste::cli::u32 consumed = 0;
    const lanpaste::core::Status s = lanpaste::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "/srv/paste");
    EXPECT_EQ(out.data[1].value.i64v, 123);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<lanpaste::cli::OptionSpec, 2> specs = {{
        {lanpaste::cli::OptionId::Dir, lanpaste::cli::OptionType::String, "dir", 'd'},
        {lanpaste::cli::OptionId::Help, lanpaste::cli::OptionType::Flag, "help", 'h'},
    }};

    const char* argv[] = {"--dir", "x", "--", "--help"};
    const lanpaste::cli::CliArgs args{argv, 4};

    lanpaste::cli::ParsedOption buf[8]{};
    lanpaste::cli::ParsedOptions out{buf, 0, 8};
    lanpaste::cli::u32 consumed = 0;
    const lanpaste::core::Status s = lanpaste::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "x");
}

TEST(CliOptions, InvalidOnUnknownMissingOrMalformedValue) {
    const std::array<lanpaste::cli::OptionSpec, 3> specs = {{
        {lanpaste::cli::OptionId::Dir, lanpaste::cli::OptionType::String, "dir", 'd'},
        {lanpaste::cli::OptionId::MaxBytes, lanpaste::cli::OptionType::I64, "max-bytes", '\0'},
        {lanpaste::cli::OptionId::Help, lanpaste::cli::OptionType::Flag, "help", 'h'},
    }};

    const auto parse = [&specs](std::initializer_list<const char*> tokens) {
        std::array<const char*, 4> argv{};
        lanpaste::cli::u32 n = 0;
        for (const char* t : tokens) {
            argv[n++] = t;
        }
        lanpaste::cli::ParsedOption buf[2]{};
        lanpaste::cli::ParsedOptions out{buf, 0, 2};
        lanpaste::cli::u32 consumed = 0;
        return lanpaste::cli::parse_options({argv.data(), n}, specs.data(), specs.size(), &out, &consumed).code;
    };

    EXPECT_EQ(parse({"--nope"}), lanpaste::core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--dir"}), lanpaste::core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--max-bytes", "12k"}), lanpaste::core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--help=yes"}), lanpaste::core::StatusCode::Invalid);
    EXPECT_EQ(parse({"--help", "--help", "--help"}), lanpaste::core::StatusCode::Invalid);  // capacity
}

// ============================================================================
// serve
// ============================================================================

TEST(CliServe, DefaultsWhenOnlyDirGiven) {
    const char* argv[] = {"--dir", "/srv/paste"};
    lanpaste::service::ServeConfig cfg;
    bool help = true;
    ASSERT_EQ(lanpaste::cli::parse_serve_args({argv, 2}, &cfg, &help).code, lanpaste::core::StatusCode::Ok);
    EXPECT_FALSE(help);
    EXPECT_EQ(cfg.dir, "/srv/paste");
    EXPECT_EQ(cfg.bind_host, "0.0.0.0");
    EXPECT_EQ(cfg.bind_port, 8090);
    EXPECT_EQ(cfg.max_bytes, 1048576u);
    EXPECT_EQ(cfg.push, lanpaste::core::PushMode::Off);
    EXPECT_EQ(cfg.remote, "origin");
    EXPECT_EQ(cfg.git_author_name, "LAN Paste");
    EXPECT_EQ(cfg.git_author_email, "paste@lan");
    EXPECT_FALSE(cfg.token.has_value());
    EXPECT_FALSE(cfg.trust_forwarded_for);
    EXPECT_TRUE(cfg.allow_cidr.empty());
}

TEST(CliServe, AllFlags) {
    const char* argv[] = {
        "-d", "/srv/paste",
        "--bind", "[::1]:9000",
        "--token", "s3cret",
        "--max-bytes", "2048",
        "--push", "best_effort",
        "--remote", "backup",
        "--allow-cidr", "10.0.0.0/8",
        "--allow-cidr=192.168.1.0/24",
        "--git-author-name", "Paste Bot",
        "--git-author-email", "bot@lan",
        "--trust-forwarded-for",
        "--log-level", "debug",
    };
    lanpaste::service::ServeConfig cfg;
    bool help = false;
    ASSERT_EQ(lanpaste::cli::parse_serve_args({argv, static_cast<lanpaste::cli::u32>(sizeof(argv) / sizeof(argv[0]))}, &cfg, &help).code,
              lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(cfg.bind_host, "::1");
    EXPECT_EQ(cfg.bind_port, 9000);
    EXPECT_EQ(cfg.token, "s3cret");
    EXPECT_EQ(cfg.max_bytes, 2048u);
    EXPECT_EQ(cfg.push, lanpaste::core::PushMode::BestEffort);
    EXPECT_EQ(cfg.remote, "backup");
    ASSERT_EQ(cfg.allow_cidr.size(), 2u);
    EXPECT_EQ(cfg.allow_cidr[1].prefix, 24);
    EXPECT_EQ(cfg.git_author_name, "Paste Bot");
    EXPECT_EQ(cfg.git_author_email, "bot@lan");
    EXPECT_TRUE(cfg.trust_forwarded_for);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(CliServe, RejectsBadValues) {
    lanpaste::service::ServeConfig cfg;
    bool help = false;
    {
        const char* argv[] = {"--push", "sometimes"};
        EXPECT_EQ(lanpaste::cli::parse_serve_args({argv, 2}, &cfg, &help).code, lanpaste::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--allow-cidr", "10.0.0.0/40"};
        EXPECT_EQ(lanpaste::cli::parse_serve_args({argv, 2}, &cfg, &help).code, lanpaste::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--max-bytes", "0"};
        EXPECT_EQ(lanpaste::cli::parse_serve_args({argv, 2}, &cfg, &help).code, lanpaste::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--bind", "nohost"};
        EXPECT_EQ(lanpaste::cli::parse_serve_args({argv, 2}, &cfg, &help).code, lanpaste::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--dir", "/srv", "stray"};
        EXPECT_EQ(lanpaste::cli::parse_serve_args({argv, 3}, &cfg, &help).code, lanpaste::core::StatusCode::Invalid);
    }
}

TEST(CliServe, HelpFlag) {
    const char* argv[] = {"-h"};
    lanpaste::service::ServeConfig cfg;
    bool help = false;
    ASSERT_EQ(lanpaste::cli::parse_serve_args({argv, 1}, &cfg, &help).code, lanpaste::core::StatusCode::Ok);
    EXPECT_TRUE(help);
}
