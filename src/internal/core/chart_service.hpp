// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Service                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/id_generator.hpp"
#include "internal/core/types.hpp"
#include "internal/model/chart.hpp"
#include "internal/sql/query_executor.hpp"
#include "internal/store/chart_store.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chartdb::core {

/// Rows produced for a chart and the parameter map they were produced with
struct ChartData {
    nlohmann::json data = nlohmann::json::array();
    nlohmann::json filters = nlohmann::json::object();
};

/// Chart-level operations on top of a ChartStore. Records are addressed by
/// id or by name, the way dashboard routes refer to them.
class ChartService {
public:
    /// `executor` may be null, in which case get_data() never returns rows.
    /// It is not owned and must outlive the service.
    explicit ChartService(store::ChartStore store,
                          sql::QueryExecutor* executor = nullptr,
                          IdGenerator ids = IdGenerator{});

    /// Matches a record whose id or name equals `key`
    [[nodiscard]] static store::ChartStore::Predicate match_id_or_name(std::string key);

    /// Matches a record whose id equals `id`
    [[nodiscard]] static store::ChartStore::Predicate match_id(std::string id);

    /// Store `draft` under a freshly generated id; any id it carries is replaced
    [[nodiscard]] Result<model::ChartRecord> create(model::ChartRecord draft);

    [[nodiscard]] Result<std::vector<model::ChartRecord>> find_all() const;
    [[nodiscard]] Result<model::ChartRecord> find_one(const std::string& id_or_name) const;

    /// Update every chart matching `id_or_name` and return the first of them
    [[nodiscard]] Result<model::ChartRecord> update(const std::string& id_or_name,
                                                    const model::ChartPatch& patch);

    /// Delete by exact id and return the charts that remain
    [[nodiscard]] Result<std::vector<model::ChartRecord>> remove(const std::string& id);

    /// Resolve the chart, sanitize its query, merge defaults with `overrides`
    /// and run it. An absent or rejected query, or one yielding no rows,
    /// produces empty data rather than an error.
    [[nodiscard]] Result<ChartData> get_data(const std::string& id_or_name,
                                             const nlohmann::json& overrides = nlohmann::json::object());

    [[nodiscard]] const store::ChartStore& store() const noexcept { return store_; }

private:
    store::ChartStore store_;
    sql::QueryExecutor* executor_;
    IdGenerator ids_;
};

} // namespace chartdb::core
