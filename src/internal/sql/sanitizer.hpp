// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Read-Only Query Sanitizer                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chartdb::sql {

/// Outcome of inspecting a stored query
enum class QueryVerdict {
    Present,    // normalized read-only text is available
    Absent,     // nothing to run (missing, empty or whitespace only)
    Rejected,   // forbidden keyword or comment marker found
};

[[nodiscard]] constexpr const char* query_verdict_to_string(QueryVerdict verdict) noexcept {
    switch (verdict) {
        case QueryVerdict::Present: return "present";
        case QueryVerdict::Absent: return "absent";
        case QueryVerdict::Rejected: return "rejected";
        default: return "unknown";
    }
}

struct QueryInspection {
    QueryVerdict verdict = QueryVerdict::Absent;
    std::string sql;       // set only when verdict == Present
    std::string reason;    // set only when verdict == Rejected

    [[nodiscard]] bool executable() const noexcept { return verdict == QueryVerdict::Present; }
};

/// Trim and collapse every run of whitespace to a single space
[[nodiscard]] std::string normalize_whitespace(std::string_view text);

/// Reduce `raw` to a normalized statement or explain why it cannot run.
///
/// This is an exclusion filter, not a parser. The text is rejected when it
/// contains, as a whole word and in any case, one of UPDATE DELETE CREATE
/// TRUNCATE DROP INSERT ALTER EXEC MERGE CALL GRANT REVOKE SET, or any of
/// the comment markers `--`, `/*`, `*/`. Nothing checks that what remains is
/// a valid SELECT. Keywords inside string literals still count, and
/// `;`-separated statement chains are not detected here.
[[nodiscard]] QueryInspection inspect_query(std::optional<std::string_view> raw);

/// Collapsed form of inspect_query(): rejected and absent both yield nullopt
[[nodiscard]] std::optional<std::string> sanitize_query(std::optional<std::string_view> raw);

} // namespace chartdb::sql
