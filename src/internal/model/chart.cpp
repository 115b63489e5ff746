// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Definition Model Implementation                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "chart.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string_view>

namespace chartdb::model {

using nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> kVariableKeys = {
    "key", "defaults", "value", "component"
};

constexpr std::array<std::string_view, 10> kChartKeys = {
    "id", "name", "label", "tooltip", "legend",
    "xaxis", "yaxis", "query", "vars", "filters"
};

template<std::size_t N>
bool is_known(const std::array<std::string_view, N>& keys, const std::string& key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

void require_object(const json& j, std::string_view what) {
    if (!j.is_object()) {
        throw std::invalid_argument(
            fmt::format("{} must be a JSON object, got {}", what, j.type_name()));
    }
}

// A stored null leaves the field empty and is remembered in `extra`.
template<typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out, json& extra) {
    out.reset();
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (it->is_null()) {
        extra[key] = nullptr;
        return;
    }
    out = it->get<T>();
}

// Free-form values keep an explicit null in the slot itself.
void read_optional_json(const json& j, const char* key, std::optional<json>& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        out.reset();
        return;
    }
    out = *it;
}

void read_axes(const json& j, const char* key, std::vector<Axis>& out, json& extra) {
    out.clear();
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (it->is_null()) {
        extra[key] = nullptr;
        return;
    }
    it->get_to(out);
}

template<typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<std::size_t N>
json collect_extra(const json& j, const std::array<std::string_view, N>& known) {
    json extra = json::object();
    for (const auto& [key, value] : j.items()) {
        if (!is_known(known, key)) {
            extra[key] = value;
        }
    }
    return extra;
}

void write_extra(json& j, const json& extra) {
    for (const auto& [key, value] : extra.items()) {
        if (!j.contains(key)) {
            j[key] = value;
        }
    }
}

template<typename T>
T decode_field(const json& value, std::string_view key) {
    if (value.is_null()) {
        throw std::invalid_argument(fmt::format("'{}' cannot be null", key));
    }
    return value.get<T>();
}

// Empty the modelled field behind `key` so a value in `extra` takes its place
void clear_field(ChartRecord& record, const std::string& key) {
    if (key == "label") record.label.reset();
    else if (key == "tooltip") record.tooltip.reset();
    else if (key == "legend") record.legend.reset();
    else if (key == "xaxis") record.xaxis.clear();
    else if (key == "yaxis") record.yaxis.clear();
    else if (key == "query") record.query.reset();
    else if (key == "vars") record.vars.reset();
    else if (key == "filters") record.filters.reset();
}

constexpr const char* kPrototypeChart = R"json({
    "name": "Order History",
    "label": "Order History ",
    "tooltip": true,
    "legend": true,
    "xaxis": [
        { "key": "month" }
    ],
    "yaxis": [
        { "type": "area", "key": "total_charged", "stroke": "#caca9d", "fill": "#caca9d" },
        { "type": "bar", "key": "total_cost_real", "stroke": "#8884d8", "fill": "#8884d8" },
        { "type": "line", "active": { "r": 8 }, "key": "total_profits", "stroke": "#82ca9d", "fill": "#82ca9d" }
    ],
    "query": "WITH monthly_totals AS (\n    SELECT\n        DATE_TRUNC('month', o.published_at) AS month,\n        COALESCE(SUM(o.charged),0) AS total_charged,\n        COALESCE(SUM(o.cost_real),0) AS total_cost_real,\n        COALESCE(SUM(o.profits),0) AS total_profits\n    FROM\n        public.orders AS o\n    INNER JOIN\n        public.orders_user_lnk AS ou\n        ON ou.order_id = o.id\n    INNER JOIN\n        public.up_users AS u\n        ON u.id = ou.user_id\n    WHERE\n        o.published_at IS NOT NULL\n        AND EXTRACT(YEAR FROM o.published_at) = :year\n    GROUP BY\n        DATE_TRUNC('month', o.published_at)\n)\nSELECT\n    TO_CHAR(month, 'YYYY-MM') AS month,\n    total_charged,\n    total_cost_real,\n    total_profits\nFROM\n    monthly_totals\nORDER BY\n    month;",
    "vars": [
        {
            "key": "year",
            "defaults": "2024",
            "component": "select",
            "value": [
                { "key": "2023", "value": "2023" },
                { "key": "2024", "value": "2024" },
                { "key": "2025", "value": "2025" },
                { "key": "2026", "value": "2026" },
                { "key": "2027", "value": "2027" },
                { "key": "2028", "value": "2028" },
                { "key": "2029", "value": "2029" }
            ]
        }
    ]
})json";

} // anonymous namespace

// ==============================================================================
// Axis
// ==============================================================================

std::string Axis::key() const {
    auto it = fields.find("key");
    if (it == fields.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

void to_json(json& j, const Axis& axis) {
    j = axis.fields;
}

void from_json(const json& j, Axis& axis) {
    require_object(j, "axis");
    axis.fields = j;
}

// ==============================================================================
// Variable
// ==============================================================================

void to_json(json& j, const Variable& variable) {
    j = json::object();
    j["key"] = variable.key;
    write_optional(j, "defaults", variable.defaults);
    write_optional(j, "value", variable.value);
    write_optional(j, "component", variable.component);
    write_extra(j, variable.extra);
}

void from_json(const json& j, Variable& variable) {
    require_object(j, "variable");
    j.at("key").get_to(variable.key);
    variable.extra = collect_extra(j, kVariableKeys);
    read_optional_json(j, "defaults", variable.defaults);
    read_optional_json(j, "value", variable.value);
    read_optional(j, "component", variable.component, variable.extra);
}

// ==============================================================================
// ChartRecord
// ==============================================================================

void to_json(json& j, const ChartRecord& chart) {
    j = json::object();
    j["id"] = chart.id;
    j["name"] = chart.name;
    write_optional(j, "label", chart.label);
    write_optional(j, "tooltip", chart.tooltip);
    write_optional(j, "legend", chart.legend);
    if (!chart.xaxis.empty() || !chart.extra.contains("xaxis")) {
        j["xaxis"] = chart.xaxis;
    }
    if (!chart.yaxis.empty() || !chart.extra.contains("yaxis")) {
        j["yaxis"] = chart.yaxis;
    }
    write_optional(j, "query", chart.query);
    write_optional(j, "vars", chart.vars);
    write_optional(j, "filters", chart.filters);
    write_extra(j, chart.extra);
}

void from_json(const json& j, ChartRecord& chart) {
    require_object(j, "chart");
    j.at("id").get_to(chart.id);
    j.at("name").get_to(chart.name);

    chart.extra = collect_extra(j, kChartKeys);
    read_optional(j, "label", chart.label, chart.extra);
    read_optional(j, "tooltip", chart.tooltip, chart.extra);
    read_optional(j, "legend", chart.legend, chart.extra);
    read_axes(j, "xaxis", chart.xaxis, chart.extra);
    read_axes(j, "yaxis", chart.yaxis, chart.extra);
    read_optional(j, "query", chart.query, chart.extra);
    read_optional(j, "vars", chart.vars, chart.extra);
    read_optional(j, "filters", chart.filters, chart.extra);
    if (chart.filters && !chart.filters->is_object()) {
        throw std::invalid_argument("'filters' must be a JSON object");
    }
}

// ==============================================================================
// ChartPatch
// ==============================================================================

bool ChartPatch::empty() const noexcept {
    return !name && !label && !tooltip && !legend && !xaxis && !yaxis
        && !query && !vars && !filters && extra.empty();
}

void to_json(json& j, const ChartPatch& patch) {
    j = json::object();
    write_optional(j, "name", patch.name);
    write_optional(j, "label", patch.label);
    write_optional(j, "tooltip", patch.tooltip);
    write_optional(j, "legend", patch.legend);
    write_optional(j, "xaxis", patch.xaxis);
    write_optional(j, "yaxis", patch.yaxis);
    write_optional(j, "query", patch.query);
    write_optional(j, "vars", patch.vars);
    write_optional(j, "filters", patch.filters);
    write_extra(j, patch.extra);
}

void apply_patch(ChartRecord& record, const ChartPatch& patch) {
    auto assign = [&record](auto& field, const auto& value, const char* key) {
        if (value) {
            field = *value;
            record.extra.erase(key);
        }
    };

    if (patch.name) record.name = *patch.name;
    assign(record.label, patch.label, "label");
    assign(record.tooltip, patch.tooltip, "tooltip");
    assign(record.legend, patch.legend, "legend");
    assign(record.xaxis, patch.xaxis, "xaxis");
    assign(record.yaxis, patch.yaxis, "yaxis");
    assign(record.query, patch.query, "query");
    assign(record.vars, patch.vars, "vars");
    assign(record.filters, patch.filters, "filters");

    for (const auto& [key, value] : patch.extra.items()) {
        clear_field(record, key);
        record.extra[key] = value;
    }
}

Result<ChartPatch> parse_patch(const json& object) {
    if (!object.is_object()) {
        return Err<ChartPatch>(ErrorCode::InvalidArgument,
            fmt::format("patch must be a JSON object, got {}", object.type_name()));
    }

    ChartPatch patch;
    try {
        for (const auto& [key, value] : object.items()) {
            if (key == "id") continue;
            if (key == "name") {
                patch.name = decode_field<std::string>(value, key);
                continue;
            }
            if (value.is_null() || !is_known(kChartKeys, key)) {
                patch.extra[key] = value;
                continue;
            }

            if (key == "label") patch.label = value.get<std::string>();
            else if (key == "tooltip") patch.tooltip = value.get<bool>();
            else if (key == "legend") patch.legend = value.get<bool>();
            else if (key == "xaxis") patch.xaxis = value.get<std::vector<Axis>>();
            else if (key == "yaxis") patch.yaxis = value.get<std::vector<Axis>>();
            else if (key == "query") patch.query = value.get<std::string>();
            else if (key == "vars") patch.vars = value.get<std::vector<Variable>>();
            else if (key == "filters") {
                if (!value.is_object()) {
                    return Err<ChartPatch>(ErrorCode::InvalidArgument,
                        "'filters' must be a JSON object");
                }
                patch.filters = value;
            }
        }
    } catch (const std::exception& e) {
        return Err<ChartPatch>(ErrorCode::InvalidArgument,
            fmt::format("invalid patch: {}", e.what()));
    }

    return Ok(std::move(patch));
}

Result<ChartRecord> parse_chart(const json& object) {
    if (!object.is_object()) {
        return Err<ChartRecord>(ErrorCode::InvalidArgument,
            fmt::format("chart must be a JSON object, got {}", object.type_name()));
    }

    json body = object;
    if (!body.contains("id")) {
        body["id"] = "";
    }

    try {
        return Ok(body.get<ChartRecord>());
    } catch (const std::exception& e) {
        return Err<ChartRecord>(ErrorCode::InvalidArgument,
            fmt::format("invalid chart: {}", e.what()));
    }
}

ChartRecord prototype_chart() {
    auto chart = parse_chart(json::parse(kPrototypeChart));
    return std::move(chart).value();
}

} // namespace chartdb::model
