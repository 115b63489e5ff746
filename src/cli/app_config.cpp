// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Application Configuration Implementation                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "app_config.hpp"

#include <fmt/core.h>

#include <exception>
#include <filesystem>
#include <fstream>

namespace chartdb::cli {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // anonymous namespace

Status AppConfig::load_from_file(const std::string& path,
                                 const std::function<bool(std::string_view)>& keep_current) {
    if (!std::filesystem::exists(path)) {
        return Err(ErrorCode::FileNotFound,
            fmt::format("Configuration file '{}' does not exist", path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err(ErrorCode::StorageReadFailure,
            fmt::format("Failed to open configuration file '{}'", path));
    }

    std::string line;
    std::size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            return Err(ErrorCode::InvalidArgument,
                fmt::format("{}:{}: expected 'key = value'", path, line_no));
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (keep_current && keep_current(key)) continue;

        try {
            if (key == "charts_file") charts_file = value;
            else if (key == "database") database = value;
            else if (key == "log_level") log_level = value;
            else if (key == "log_file") log_file = value;
            else if (key == "max_log_size") max_log_size = std::stoull(value);
            else if (key == "max_log_files") max_log_files = std::stoull(value);
            else {
                return Err(ErrorCode::InvalidArgument,
                    fmt::format("{}:{}: unknown key '{}'", path, line_no, key));
            }
        } catch (const std::exception&) {
            return Err(ErrorCode::InvalidArgument,
                fmt::format("{}:{}: invalid value '{}' for '{}'", path, line_no, value, key));
        }
    }

    return Ok();
}

StoreConfig AppConfig::store_config() const {
    StoreConfig config;
    config.document_path = charts_file;
    return config;
}

} // namespace chartdb::cli
