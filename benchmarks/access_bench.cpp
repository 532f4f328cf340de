#include <string>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

#include "lanpaste/security/access.hpp"

static void BM_CidrCheck(benchmark::State& state) {
    std::vector<lanpaste::security::CidrBlock> allow;
    for (const char* text : {"10.0.0.0/8", "172.16.0.0/12", "192.168.0.0/16", "fd00::/8"}) {
        lanpaste::security::CidrBlock b{};
        if (lanpaste::core::is_ok(lanpaste::security::parse_cidr(text, &b))) {
            allow.push_back(b);
        }
    }
    for (auto _ : state) {
        const lanpaste::core::Status s = lanpaste::security::check_cidr(allow, std::string_view("192.168.44.3"));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_CidrCheck);

static void BM_ApiKeyAuthorize(benchmark::State& state) {
    const int keys = static_cast<int>(state.range(0));
    std::vector<lanpaste::security::ApiKeyEntry> entries;
    for (int i = 0; i < keys; ++i) {
        lanpaste::security::ApiKeyEntry e;
        e.key = "key-" + std::to_string(i) + "-0123456789abcdef";
        e.scopes = {"paste:read", "recent:read"};
        entries.push_back(std::move(e));
    }
    const std::string probe = entries.back().key;

    lanpaste::security::ApiKeyStore store;
    if (!lanpaste::core::is_ok(store.set_entries(std::move(entries)))) {
        state.SkipWithError("set_entries failed");
        return;
    }
    for (auto _ : state) {
        const lanpaste::core::Status s = store.authorize(std::string_view(probe), lanpaste::security::Scope::PasteRead, 0);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_ApiKeyAuthorize)->Arg(1)->Arg(16)->Arg(256);
