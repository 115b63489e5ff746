// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Query Sanitizer Benchmarks                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "internal/model/chart.hpp"
#include "internal/sql/sanitizer.hpp"

#include <string>

using namespace chartdb;

static void BM_SanitizeShortSelect(benchmark::State& state) {
    const std::string sql = "SELECT month, total FROM orders WHERE year = :year;";

    for (auto _ : state) {
        auto result = sql::sanitize_query(sql);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SanitizeShortSelect);

static void BM_SanitizePrototypeQuery(benchmark::State& state) {
    const std::string sql = *model::prototype_chart().query;

    for (auto _ : state) {
        auto result = sql::sanitize_query(sql);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(sql.size()));
}
BENCHMARK(BM_SanitizePrototypeQuery);

static void BM_SanitizeRejected(benchmark::State& state) {
    const std::string sql = "SELECT * FROM orders; DROP TABLE orders";

    for (auto _ : state) {
        auto result = sql::inspect_query(sql);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SanitizeRejected);

static void BM_NormalizeWhitespace(benchmark::State& state) {
    std::string sql;
    for (int i = 0; i < state.range(0); ++i) {
        sql += "  SELECT\n\t a ,  b\n FROM   t  ";
    }

    for (auto _ : state) {
        auto result = sql::normalize_whitespace(sql);
        benchmark::DoNotOptimize(result);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(sql.size()));
}
BENCHMARK(BM_NormalizeWhitespace)->Range(1, 256);

BENCHMARK_MAIN();
