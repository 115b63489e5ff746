// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - SQLite Query Executor Implementation                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlite_executor.hpp"

#include "internal/utils/logger.hpp"

#include <sqlite3.h>
#include <fmt/core.h>

#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace chartdb::sql {

using nlohmann::json;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

bool only_whitespace(std::string_view text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

const json* lookup(const json& params, const std::string& key) {
    if (!params.is_object()) {
        return nullptr;
    }
    auto it = params.find(key);
    return it == params.end() ? nullptr : &*it;
}

int bind_value(sqlite3_stmt* stmt, int index, const json& value) {
    switch (value.type()) {
        case json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return sqlite3_bind_text(stmt, index, text.data(),
                static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        case json::value_t::number_integer:
            return sqlite3_bind_int64(stmt, index, value.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            auto number = value.get<std::uint64_t>();
            if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return sqlite3_bind_double(stmt, index, static_cast<double>(number));
            }
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(number));
        }
        case json::value_t::number_float:
            return sqlite3_bind_double(stmt, index, value.get<double>());
        case json::value_t::boolean:
            return sqlite3_bind_int(stmt, index, value.get<bool>() ? 1 : 0);
        case json::value_t::array:
        case json::value_t::object: {
            auto text = value.dump();
            return sqlite3_bind_text(stmt, index, text.data(),
                static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        default:
            return sqlite3_bind_null(stmt, index);
    }
}

json read_row(sqlite3_stmt* stmt) {
    json row = json::object();
    const int columns = sqlite3_column_count(stmt);

    for (int c = 0; c < columns; ++c) {
        const char* name = sqlite3_column_name(stmt, c);
        std::string key = name ? name : fmt::format("column{}", c);

        switch (sqlite3_column_type(stmt, c)) {
            case SQLITE_INTEGER:
                row[key] = static_cast<std::int64_t>(sqlite3_column_int64(stmt, c));
                break;
            case SQLITE_FLOAT:
                row[key] = sqlite3_column_double(stmt, c);
                break;
            case SQLITE_TEXT: {
                const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, c));
                row[key] = std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, c)));
                break;
            }
            case SQLITE_BLOB: {
                const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, c));
                const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, c));
                row[key] = json::binary(std::vector<std::uint8_t>(data, data + size));
                break;
            }
            default:
                row[key] = nullptr;
                break;
        }
    }
    return row;
}

} // anonymous namespace

SqliteExecutor::SqliteExecutor(std::filesystem::path path, sqlite3* db)
    : path_(std::move(path))
    , db_(db)
{
}

SqliteExecutor::~SqliteExecutor() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<SqliteExecutor>> SqliteExecutor::open(const std::filesystem::path& path) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return Err<std::unique_ptr<SqliteExecutor>>(ErrorCode::ConnectionFailed,
            fmt::format("Failed to open database '{}': {}", path.string(), message));
    }

    log::debug("Opened database '{}' read-only", path.string());
    return Ok(std::unique_ptr<SqliteExecutor>(new SqliteExecutor(path, db)));
}

Result<json> SqliteExecutor::execute(std::string_view sql, const json& params) {
    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, &tail);
    Statement stmt(raw, &sqlite3_finalize);

    if (rc != SQLITE_OK) {
        return Err<json>(ErrorCode::QueryFailed,
            fmt::format("Failed to prepare query: {}", sqlite3_errmsg(db_)));
    }
    if (!stmt) {
        return Err<json>(ErrorCode::QueryFailed, "Query contains no statement");
    }

    // The sanitizer does not look for statement chains; refuse them here.
    if (tail) {
        std::string_view rest(tail, static_cast<std::size_t>(sql.data() + sql.size() - tail));
        if (!only_whitespace(rest)) {
            return Err<json>(ErrorCode::QueryFailed, "Only a single statement may be executed");
        }
    }

    if (!sqlite3_stmt_readonly(stmt.get())) {
        return Err<json>(ErrorCode::QueryFailed, "Statement would modify the database");
    }

    const int count = sqlite3_bind_parameter_count(stmt.get());
    for (int i = 1; i <= count; ++i) {
        const char* name = sqlite3_bind_parameter_name(stmt.get(), i);
        if (!name) {
            return Err<json>(ErrorCode::QueryFailed,
                fmt::format("Parameter {} is anonymous; only named parameters are supported", i));
        }

        // Drop the ':' / '@' / '$' / '?' prefix
        const json* value = lookup(params, std::string(name + 1));
        rc = value ? bind_value(stmt.get(), i, *value) : sqlite3_bind_null(stmt.get(), i);
        if (rc != SQLITE_OK) {
            return Err<json>(ErrorCode::QueryFailed,
                fmt::format("Failed to bind parameter '{}': {}", name, sqlite3_errmsg(db_)));
        }
    }

    log::debug("Executing query with {} bound parameters", count);

    json rows = json::array();
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(read_row(stmt.get()));
    }

    if (rc != SQLITE_DONE) {
        return Err<json>(ErrorCode::QueryFailed,
            fmt::format("Query failed: {}", sqlite3_errmsg(db_)));
    }

    return Ok(std::move(rows));
}

} // namespace chartdb::sql
