// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Backing Document I/O                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace chartdb::store {

/// Read and parse the whole document. A missing file, an unreadable file or
/// malformed JSON is an error; nothing is ever defaulted to empty.
[[nodiscard]] Result<nlohmann::json> read_document(const std::filesystem::path& path);

/// Serialize `document` and atomically replace the file at `path`.
/// The document is written to a sibling temporary file which is then renamed
/// over the target, so on failure the previous contents are left in place.
[[nodiscard]] Status write_document(const std::filesystem::path& path,
                                    const nlohmann::json& document,
                                    int indent = 2);

} // namespace chartdb::store
