// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Store Benchmarks                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "internal/store/chart_store.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace chartdb;

class ChartStoreBenchmark : public benchmark::Fixture {
public:
    void SetUp(benchmark::State& state) override {
        test_dir_ = std::filesystem::temp_directory_path() / "chartdb_store_bench";
        std::filesystem::remove_all(test_dir_);

        StoreConfig config;
        config.document_path = test_dir_ / "charts.json";
        store_ = store::ChartStore(config);

        std::vector<model::ChartRecord> seed;
        for (int64_t i = 0; i < state.range(0); ++i) {
            auto chart = model::prototype_chart();
            chart.id = std::to_string(i);
            chart.name = "Chart " + std::to_string(i);
            seed.push_back(std::move(chart));
        }

        if (!store_.initialize(seed)) {
            state.SkipWithError("failed to initialize chart document");
        }
    }

    void TearDown(benchmark::State&) override {
        std::filesystem::remove_all(test_dir_);
    }

protected:
    std::filesystem::path test_dir_;
    store::ChartStore store_;
};

BENCHMARK_DEFINE_F(ChartStoreBenchmark, SelectAll)(benchmark::State& state) {
    for (auto _ : state) {
        auto records = store_.select();
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(ChartStoreBenchmark, SelectAll)->Range(8, 512);

BENCHMARK_DEFINE_F(ChartStoreBenchmark, FindLast)(benchmark::State& state) {
    const std::string name = "Chart " + std::to_string(state.range(0) - 1);
    auto by_name = [&name](const model::ChartRecord& c) { return c.name == name; };

    for (auto _ : state) {
        auto record = store_.find_one(by_name);
        benchmark::DoNotOptimize(record);
    }
}
BENCHMARK_REGISTER_F(ChartStoreBenchmark, FindLast)->Range(8, 512);

BENCHMARK_DEFINE_F(ChartStoreBenchmark, UpdateOne)(benchmark::State& state) {
    model::ChartPatch patch;
    patch.label = "Updated";
    auto first = [](const model::ChartRecord& c) { return c.id == "0"; };

    for (auto _ : state) {
        auto updated = store_.update(first, patch);
        benchmark::DoNotOptimize(updated);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(ChartStoreBenchmark, UpdateOne)->Range(8, 512);

BENCHMARK_MAIN();
