// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Service Implementation                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "chart_service.hpp"

#include "internal/core/defaults.hpp"
#include "internal/sql/sanitizer.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>

#include <utility>

namespace chartdb::core {

ChartService::ChartService(store::ChartStore store, sql::QueryExecutor* executor, IdGenerator ids)
    : store_(std::move(store))
    , executor_(executor)
    , ids_(std::move(ids))
{
}

store::ChartStore::Predicate ChartService::match_id_or_name(std::string key) {
    return [key = std::move(key)](const model::ChartRecord& chart) {
        return chart.id == key || chart.name == key;
    };
}

store::ChartStore::Predicate ChartService::match_id(std::string id) {
    return [id = std::move(id)](const model::ChartRecord& chart) {
        return chart.id == id;
    };
}

// ==============================================================================
// CRUD
// ==============================================================================

Result<model::ChartRecord> ChartService::create(model::ChartRecord draft) {
    draft.id = ids_.next();

    if (auto status = store_.create(draft); !status) {
        return Err<model::ChartRecord>(status.error());
    }

    log::info("Created chart '{}' ({})", draft.name, draft.id);
    return Ok(std::move(draft));
}

Result<std::vector<model::ChartRecord>> ChartService::find_all() const {
    return store_.select();
}

Result<model::ChartRecord> ChartService::find_one(const std::string& id_or_name) const {
    auto chart = store_.find_one(match_id_or_name(id_or_name));
    if (!chart && chart.error().code() == ErrorCode::NotFound) {
        return Err<model::ChartRecord>(ErrorCode::NotFound,
            fmt::format("Chart '{}' not found", id_or_name));
    }
    return chart;
}

Result<model::ChartRecord> ChartService::update(const std::string& id_or_name,
                                                const model::ChartPatch& patch) {
    // Ids survive a patch while names may not, so remember which record to return.
    auto target = find_one(id_or_name);
    if (!target) {
        return target;
    }

    auto updated = store_.update(match_id_or_name(id_or_name), patch);
    if (!updated) {
        return Err<model::ChartRecord>(updated.error());
    }

    log::info("Updated {} chart(s) matching '{}'", *updated, id_or_name);
    return store_.find_one(match_id(target->id));
}

Result<std::vector<model::ChartRecord>> ChartService::remove(const std::string& id) {
    auto removed = store_.remove(match_id(id));
    if (!removed) {
        if (removed.error().code() == ErrorCode::NotFound) {
            return Err<std::vector<model::ChartRecord>>(ErrorCode::NotFound,
                fmt::format("Chart '{}' not found", id));
        }
        return Err<std::vector<model::ChartRecord>>(removed.error());
    }

    log::info("Removed {} chart(s) with id '{}'", *removed, id);
    return store_.select();
}

// ==============================================================================
// Data
// ==============================================================================

Result<ChartData> ChartService::get_data(const std::string& id_or_name,
                                         const nlohmann::json& overrides) {
    if (!overrides.is_object() && !overrides.is_null()) {
        return Err<ChartData>(ErrorCode::InvalidArgument,
            fmt::format("Query parameters must be a JSON object, got {}", overrides.type_name()));
    }

    auto chart = find_one(id_or_name);
    if (!chart) {
        return Err<ChartData>(chart.error());
    }

    ChartData result;
    result.filters = merge_parameters(resolve_defaults(chart->vars), overrides);

    auto query = sql::inspect_query(chart->query);
    switch (query.verdict) {
        case sql::QueryVerdict::Absent:
            log::debug("Chart '{}' has no query", chart->id);
            return Ok(std::move(result));
        case sql::QueryVerdict::Rejected:
            log::warn("Query of chart '{}' rejected: {}", chart->id, query.reason);
            return Ok(std::move(result));
        case sql::QueryVerdict::Present:
            break;
    }

    if (!executor_) {
        log::warn("No query executor configured; chart '{}' returns no data", chart->id);
        return Ok(std::move(result));
    }

    auto rows = executor_->execute(query.sql, result.filters);
    if (!rows) {
        log::error("Query of chart '{}' failed: {}", chart->id, rows.error().to_string());
        return Err<ChartData>(rows.error());
    }

    if (rows->is_array() && !rows->empty()) {
        result.data = std::move(*rows);
    }
    return Ok(std::move(result));
}

} // namespace chartdb::core
