// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Query Parameter Defaults                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/model/chart.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace chartdb::core {

/// `{ var.key: var.defaults }` for every variable. A later duplicate key wins;
/// a variable without defaults contributes null.
[[nodiscard]] nlohmann::json resolve_defaults(const std::vector<model::Variable>& vars);
[[nodiscard]] nlohmann::json resolve_defaults(const std::optional<std::vector<model::Variable>>& vars);

/// Shallow merge where `overrides` win on key collision. Both arguments must
/// be objects (or null, which counts as empty).
[[nodiscard]] nlohmann::json merge_parameters(const nlohmann::json& defaults,
                                              const nlohmann::json& overrides);

} // namespace chartdb::core
