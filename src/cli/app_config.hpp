// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Application Configuration                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "chartdb/config.hpp"
#include "internal/core/config.hpp"
#include "internal/core/types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace chartdb::cli {

struct AppConfig {
    // Storage
    std::string charts_file = CHARTDB_DEFAULT_CHARTS_FILE;
    std::string database;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::size_t max_log_size = 10 * 1024 * 1024;
    std::size_t max_log_files = 5;

    std::string config_file;

    /// Load `key = value` lines from `path`. Blank lines and lines starting
    /// with '#' or ';' are ignored. Keys for which `keep_current` returns true
    /// are skipped, so values given on the command line or in the
    /// environment take precedence.
    [[nodiscard]] Status load_from_file(const std::string& path,
                                        const std::function<bool(std::string_view)>& keep_current = {});

    [[nodiscard]] StoreConfig store_config() const;
};

} // namespace chartdb::cli
