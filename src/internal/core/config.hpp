// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Store Configuration                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "chartdb/config.hpp"

#include <filesystem>

namespace chartdb {

struct StoreConfig {
    /// JSON array of records; relative paths resolve against the working directory
    std::filesystem::path document_path = CHARTDB_DEFAULT_CHARTS_FILE;

    /// Indentation used when the document is written back
    int indent = 2;
};

} // namespace chartdb
