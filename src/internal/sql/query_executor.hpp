// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Query Executor Interface                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace chartdb::sql {

/// Database collaborator. ChartDB only prepares the statement text and the
/// parameter map; running them is left to an implementation of this interface.
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /// Run `sql` with named `params` (a JSON object). On success returns a
    /// JSON array holding one object per row, keyed by column name.
    [[nodiscard]] virtual Result<nlohmann::json> execute(std::string_view sql,
                                                         const nlohmann::json& params) = 0;
};

} // namespace chartdb::sql
