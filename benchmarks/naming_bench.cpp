#include <string>

#include <benchmark/benchmark.h>

#include "lanpaste/core/ulid.hpp"
#include "lanpaste/storage/naming.hpp"

static void BM_SanitizeName(benchmark::State& state) {
    const std::string name = state.range(0) == 0 ? "my note.md" : std::string(200, 'a') + " (copy) #2.txt";
    for (auto _ : state) {
        std::string slug;
        const lanpaste::core::Status s = lanpaste::storage::sanitize_name(name, &slug);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(slug.data());
    }
}
BENCHMARK(BM_SanitizeName)->Arg(0)->Arg(1);

static void BM_ChooseExtension(benchmark::State& state) {
    for (auto _ : state) {
        const char* ext = lanpaste::storage::choose_extension(std::string_view("README.MD"), std::string_view("text/plain"));
        benchmark::DoNotOptimize(ext);
    }
}
BENCHMARK(BM_ChooseExtension);

static void BM_UlidNext(benchmark::State& state) {
    lanpaste::core::UlidGenerator gen;
    lanpaste::core::TimestampMs ts = 1738311302417;
    for (auto _ : state) {
        std::string id;
        const lanpaste::core::Status s = gen.next(ts, &id);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(id.data());
    }
}
BENCHMARK(BM_UlidNext);
