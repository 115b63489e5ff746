// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Query Parameter Defaults Implementation                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "defaults.hpp"

namespace chartdb::core {

nlohmann::json resolve_defaults(const std::vector<model::Variable>& vars) {
    auto params = nlohmann::json::object();
    for (const auto& var : vars) {
        params[var.key] = var.defaults.value_or(nullptr);
    }
    return params;
}

nlohmann::json resolve_defaults(const std::optional<std::vector<model::Variable>>& vars) {
    if (!vars) {
        return nlohmann::json::object();
    }
    return resolve_defaults(*vars);
}

nlohmann::json merge_parameters(const nlohmann::json& defaults, const nlohmann::json& overrides) {
    auto merged = defaults.is_object() ? defaults : nlohmann::json::object();
    if (overrides.is_object()) {
        for (const auto& [key, value] : overrides.items()) {
            merged[key] = value;
        }
    }
    return merged;
}

} // namespace chartdb::core
