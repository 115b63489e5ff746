// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Read-Only Query Sanitizer Implementation                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sanitizer.hpp"

#include <fmt/core.h>

#include <array>
#include <cctype>
#include <regex>

namespace chartdb::sql {

namespace {

const std::regex& forbidden_keywords() {
    static const std::regex pattern(
        R"(\b(UPDATE|DELETE|CREATE|TRUNCATE|DROP|INSERT|ALTER|EXEC|MERGE|CALL|GRANT|REVOKE|SET)\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return pattern;
}

constexpr std::array<std::string_view, 3> kCommentMarkers = { "--", "/*", "*/" };

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

QueryInspection absent() {
    return QueryInspection{QueryVerdict::Absent, {}, {}};
}

QueryInspection rejected(std::string reason) {
    return QueryInspection{QueryVerdict::Rejected, {}, std::move(reason)};
}

} // anonymous namespace

std::string normalize_whitespace(std::string_view text) {
    text = trim(text);

    std::string out;
    out.reserve(text.size());

    bool in_space = false;
    for (char c : text) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space) {
            out.push_back(' ');
            in_space = false;
        }
        out.push_back(c);
    }
    return out;
}

QueryInspection inspect_query(std::optional<std::string_view> raw) {
    if (!raw || raw->empty()) {
        return absent();
    }

    std::string text = normalize_whitespace(*raw);
    if (text.empty()) {
        return absent();
    }

    std::smatch match;
    if (std::regex_search(text, match, forbidden_keywords())) {
        return rejected(fmt::format("forbidden keyword '{}'", match.str(1)));
    }

    for (auto marker : kCommentMarkers) {
        if (text.find(marker) != std::string::npos) {
            return rejected(fmt::format("comment marker '{}'", marker));
        }
    }

    // One trailing terminator only
    if (text.back() == ';') {
        text.pop_back();
    }

    auto statement = trim(text);
    if (statement.empty()) {
        return absent();
    }

    return QueryInspection{QueryVerdict::Present, std::string(statement), {}};
}

std::optional<std::string> sanitize_query(std::optional<std::string_view> raw) {
    auto inspection = inspect_query(raw);
    if (!inspection.executable()) {
        return std::nullopt;
    }
    return std::move(inspection.sql);
}

} // namespace chartdb::sql
