// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Embedded Usage Example                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "chartdb/version.hpp"
#include "internal/core/chart_service.hpp"
#include "internal/core/defaults.hpp"
#include "internal/sql/sanitizer.hpp"
#include "internal/store/chart_store.hpp"

#include <fmt/core.h>
#include <fmt/color.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

chartdb::model::ChartRecord make_chart(std::string id, std::string name, std::string query) {
    chartdb::model::ChartRecord chart;
    chart.id = std::move(id);
    chart.name = std::move(name);
    chartdb::model::Axis x;
    x.fields["key"] = "month";
    chart.xaxis.push_back(x);
    chart.query = std::move(query);
    chart.vars = std::vector<chartdb::model::Variable>{
        {"year", "2024", std::nullopt, "select", nlohmann::json::object()},
    };
    return chart;
}

} // anonymous namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    fmt::print(fmt::emphasis::bold, "\n=== ChartDB Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", chartdb::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", chartdb::BUILD_TYPE, chartdb::COMPILER_ID);

    // Configure the store
    chartdb::StoreConfig config;
    config.document_path = "./example_data/charts.json";
    std::error_code ec;
    std::filesystem::remove(config.document_path, ec);

    chartdb::store::ChartStore store(config);

    auto init = store.initialize();
    if (!init) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", init.error().to_string());
        return 1;
    }

    fmt::print(fg(fmt::color::green), "Chart document ready at {}\n\n", store.path().string());

    // Bulk create
    std::vector<chartdb::model::ChartRecord> charts = {
        make_chart("1", "Sales", "SELECT month, total FROM sales WHERE year = :year"),
        make_chart("2", "Orders", "  SELECT month,\n    count(*) AS n\n  FROM orders\n  WHERE year = :year;"),
        make_chart("3", "Cleanup", "DELETE FROM orders"),
    };

    if (auto status = store.bulk_create(charts); !status) {
        fmt::print(fg(fmt::color::red), "Failed to create charts: {}\n", status.error().to_string());
        return 1;
    }

    // Query
    auto all = store.select();
    if (!all) {
        fmt::print(fg(fmt::color::red), "Failed to read charts: {}\n", all.error().to_string());
        return 1;
    }

    fmt::print("Stored charts:\n");
    for (const auto& chart : *all) {
        auto inspection = chartdb::sql::inspect_query(chart.query);
        fmt::print("  [{}] {:<8} {:<9} {}\n", chart.id, chart.name,
            chartdb::sql::query_verdict_to_string(inspection.verdict),
            inspection.executable() ? inspection.sql : inspection.reason);
    }
    fmt::print("\n");

    // Update by name
    chartdb::model::ChartPatch patch;
    patch.label = "Orders per month";

    auto updated = store.update(chartdb::core::ChartService::match_id_or_name("Orders"), patch);
    if (!updated) {
        fmt::print(fg(fmt::color::red), "Update failed: {}\n", updated.error().to_string());
        return 1;
    }
    fmt::print("Updated {} chart(s)\n", *updated);

    // Parameters for a data request
    auto orders = store.find_one(chartdb::core::ChartService::match_id("2"));
    if (orders) {
        auto params = chartdb::core::merge_parameters(
            chartdb::core::resolve_defaults(orders->vars), {{"year", "2023"}});
        fmt::print("Parameters for '{}': {}\n", orders->name, params.dump());
    }

    // Remove
    auto removed = store.remove(chartdb::core::ChartService::match_id("3"));
    if (!removed) {
        fmt::print(fg(fmt::color::red), "Remove failed: {}\n", removed.error().to_string());
        return 1;
    }
    fmt::print("Removed {} chart(s)\n\n", *removed);

    // Service layer without a database: data requests yield no rows
    chartdb::core::ChartService service(store);
    auto data = service.get_data("Sales");
    if (data) {
        fmt::print("Data for 'Sales': {} (filters {})\n", data->data.dump(), data->filters.dump());
    }

    fmt::print(fg(fmt::color::green), "\nDone!\n\n");

    return 0;
}
