// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Backing Document I/O Implementation                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "document_file.hpp"

#include "internal/utils/logger.hpp"

#include <fmt/core.h>

#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace chartdb::store {

namespace fs = std::filesystem;

namespace {

fs::path temp_path_for(const fs::path& path) {
    auto tmp = path;
    tmp += fmt::format(".tmp-{}", ::getpid());
    return tmp;
}

void discard_temp(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) {
        log::warn("Failed to remove temporary file '{}': {}", tmp.string(), ec.message());
    }
}

} // anonymous namespace

Result<nlohmann::json> read_document(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Err<nlohmann::json>(ErrorCode::StorageReadFailure,
                fmt::format("Cannot stat '{}': {}", path.string(), ec.message()));
        }
        return Err<nlohmann::json>(ErrorCode::FileNotFound,
            fmt::format("Document '{}' does not exist", path.string()));
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Err<nlohmann::json>(ErrorCode::StorageReadFailure,
            fmt::format("Failed to open '{}' for reading", path.string()));
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<nlohmann::json>(ErrorCode::StorageReadFailure,
            fmt::format("Failed to read '{}'", path.string()));
    }

    try {
        return Ok(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return Err<nlohmann::json>(ErrorCode::DocumentCorrupted,
            fmt::format("Failed to parse '{}': {}", path.string(), e.what()));
    }
}

Status write_document(const fs::path& path, const nlohmann::json& document, int indent) {
    std::string text;
    try {
        text = document.dump(indent);
    } catch (const nlohmann::json::type_error& e) {
        // Invalid UTF-8 in a string value
        return Err(ErrorCode::StorageWriteFailure,
            fmt::format("Failed to serialize document for '{}': {}", path.string(), e.what()));
    }
    text.push_back('\n');

    const auto tmp = temp_path_for(path);

    {
        std::ofstream file(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Err(ErrorCode::StorageWriteFailure,
                fmt::format("Failed to create '{}'", tmp.string()));
        }

        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        file.flush();

        if (!file) {
            file.close();
            discard_temp(tmp);
            return Err(ErrorCode::StorageWriteFailure,
                fmt::format("Failed to write '{}'", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        discard_temp(tmp);
        return Err(ErrorCode::StorageWriteFailure,
            fmt::format("Failed to replace '{}': {}", path.string(), ec.message()));
    }

    return Ok();
}

} // namespace chartdb::store
