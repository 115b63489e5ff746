// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Definition Model                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chartdb::model {

// ==============================================================================
// Records
// ==============================================================================

/// One axis descriptor, held verbatim. Only the object shape is checked:
/// keys and value types belong to the chart renderer.
struct Axis {
    nlohmann::json fields = nlohmann::json::object();

    /// The descriptor's "key", or an empty string when missing or not text
    [[nodiscard]] std::string key() const;

    bool operator==(const Axis&) const = default;
};

/// Query variable: `defaults` seeds the parameter map, the rest is UI metadata.
/// Explicit nulls on typed fields are held in `extra` and written back as null.
struct Variable {
    std::string key;
    std::optional<nlohmann::json> defaults;
    std::optional<nlohmann::json> value;
    std::optional<std::string> component;
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const Variable&) const = default;
};

/// Persisted chart definition. A known key stored as null leaves its typed
/// field empty and keeps the null in `extra`, so an untouched record is
/// written back exactly as it was read.
struct ChartRecord {
    std::string id;
    std::string name;
    std::optional<std::string> label;
    std::optional<bool> tooltip;
    std::optional<bool> legend;
    std::vector<Axis> xaxis;
    std::vector<Axis> yaxis;
    std::optional<std::string> query;
    std::optional<std::vector<Variable>> vars;
    std::optional<nlohmann::json> filters;
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const ChartRecord&) const = default;
};

/// Field-level shallow merge unit. Engaged fields overwrite, the rest are
/// retained. `id` is deliberately absent: ids are never reassigned.
/// `extra` carries keys merged verbatim: unmodelled keys, and nulls that
/// clear a modelled optional field.
struct ChartPatch {
    std::optional<std::string> name;
    std::optional<std::string> label;
    std::optional<bool> tooltip;
    std::optional<bool> legend;
    std::optional<std::vector<Axis>> xaxis;
    std::optional<std::vector<Axis>> yaxis;
    std::optional<std::string> query;
    std::optional<std::vector<Variable>> vars;
    std::optional<nlohmann::json> filters;
    nlohmann::json extra = nlohmann::json::object();

    [[nodiscard]] bool empty() const noexcept;
};

/// Merge `patch` into `record`
void apply_patch(ChartRecord& record, const ChartPatch& patch);

/// Decode a patch from a JSON object. "id" is ignored, a null "name" is
/// rejected, and unknown keys are merged into the record's `extra`.
[[nodiscard]] Result<ChartPatch> parse_patch(const nlohmann::json& object);

/// Decode a chart body (as accepted by create) from JSON
[[nodiscard]] Result<ChartRecord> parse_chart(const nlohmann::json& object);

/// The sample "Order History" chart shipped with `chartdb init --with-prototype`
[[nodiscard]] ChartRecord prototype_chart();

// ==============================================================================
// JSON mapping (found by nlohmann through ADL)
// ==============================================================================

void to_json(nlohmann::json& j, const Axis& axis);
void from_json(const nlohmann::json& j, Axis& axis);

void to_json(nlohmann::json& j, const Variable& variable);
void from_json(const nlohmann::json& j, Variable& variable);

void to_json(nlohmann::json& j, const ChartRecord& chart);
void from_json(const nlohmann::json& j, ChartRecord& chart);

void to_json(nlohmann::json& j, const ChartPatch& patch);

} // namespace chartdb::model
