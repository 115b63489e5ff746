// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - SQLite Query Executor                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/sql/query_executor.hpp"

#include <filesystem>
#include <memory>

struct sqlite3;

namespace chartdb::sql {

/// Runs sanitized chart queries against a SQLite database opened read-only.
///
/// Named parameters (`:name`, `@name`, `$name`) are bound from the parameter
/// map; names missing from the map bind NULL. Only a single read-only
/// statement is accepted per call.
class SqliteExecutor final : public QueryExecutor {
public:
    [[nodiscard]] static Result<std::unique_ptr<SqliteExecutor>> open(const std::filesystem::path& path);

    ~SqliteExecutor() override;

    SqliteExecutor(const SqliteExecutor&) = delete;
    SqliteExecutor& operator=(const SqliteExecutor&) = delete;
    SqliteExecutor(SqliteExecutor&&) = delete;
    SqliteExecutor& operator=(SqliteExecutor&&) = delete;

    [[nodiscard]] Result<nlohmann::json> execute(std::string_view sql,
                                                 const nlohmann::json& params) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    SqliteExecutor(std::filesystem::path path, sqlite3* db);

    std::filesystem::path path_;
    sqlite3* db_ = nullptr;
};

} // namespace chartdb::sql
