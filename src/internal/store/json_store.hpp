// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - JSON Record Store                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/config.hpp"
#include "internal/core/types.hpp"
#include "internal/store/document_file.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

namespace chartdb::store {

/// Predicate-addressed CRUD over a homogeneous collection persisted as one
/// JSON array.
///
/// `Record` must be convertible to and from `nlohmann::json` (ADL
/// `to_json`/`from_json`), and `apply_patch(Record&, const Patch&)` must be
/// reachable through ADL.
///
/// Nothing is cached: every call reads the whole document, works on an
/// in-memory copy and, when it mutates, writes the whole document back.
/// A call that fails leaves the document untouched. There is no locking;
/// two writers racing on the same document lose one of the updates.
template<typename Record, typename Patch>
class JsonStore {
public:
    using record_type = Record;
    using patch_type = Patch;

    /// Side-effect free test over one record. An empty function means "no predicate".
    using Predicate = std::function<bool(const Record&)>;

    struct UpdateEntry {
        Predicate predicate;
        Patch patch;
    };

    // ==========================================================================
    // Construction
    // ==========================================================================

    JsonStore()
        : JsonStore(StoreConfig{})
    {
    }

    explicit JsonStore(StoreConfig config)
        : config_(std::move(config))
    {
    }

    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return config_.document_path; }

    /// Create the backing document holding `seed` if it does not exist yet.
    /// Returns false when a document is already present (it is left alone).
    [[nodiscard]] Result<bool> initialize(const std::vector<Record>& seed = {}) const {
        std::error_code ec;
        if (std::filesystem::exists(path(), ec)) {
            return Ok(false);
        }
        if (ec) {
            return Err<bool>(ErrorCode::StorageReadFailure,
                fmt::format("Cannot stat '{}': {}", path().string(), ec.message()));
        }

        if (auto parent = path().parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Err<bool>(ErrorCode::StorageWriteFailure,
                    fmt::format("Failed to create directory '{}': {}",
                        parent.string(), ec.message()));
            }
        }

        if (auto status = write(seed); !status) {
            return Err<bool>(status.error());
        }

        log::info("Initialized '{}' with {} records", path().string(), seed.size());
        return Ok(true);
    }

    // ==========================================================================
    // Create
    // ==========================================================================

    [[nodiscard]] Status create(Record record) {
        auto records = read();
        if (!records) {
            return Err(records.error());
        }

        records->push_back(std::move(record));
        return write(*records);
    }

    /// Append all of `batch` with a single write
    [[nodiscard]] Status bulk_create(std::vector<Record> batch) {
        auto records = read();
        if (!records) {
            return Err(records.error());
        }

        records->insert(records->end(),
            std::make_move_iterator(batch.begin()),
            std::make_move_iterator(batch.end()));
        return write(*records);
    }

    // ==========================================================================
    // Read
    // ==========================================================================

    /// Matching records in document order; no predicate returns everything
    [[nodiscard]] Result<std::vector<Record>> select(const Predicate& predicate = {}) const {
        auto records = read();
        if (!records || !predicate) {
            return records;
        }

        std::vector<Record> matched;
        std::copy_if(records->begin(), records->end(), std::back_inserter(matched), predicate);
        return Ok(std::move(matched));
    }

    /// First match in document order. Without a predicate this is always
    /// NotFound, even on a non-empty collection.
    [[nodiscard]] Result<Record> find_one(const Predicate& predicate = {}) const {
        auto records = read();
        if (!records) {
            return Err<Record>(records.error());
        }

        if (predicate) {
            auto it = std::find_if(records->begin(), records->end(), predicate);
            if (it != records->end()) {
                return Ok(std::move(*it));
            }
        }

        return Err<Record>(ErrorCode::NotFound, "No matching record found");
    }

    // ==========================================================================
    // Update
    // ==========================================================================

    /// Merge `patch` into every match. Returns the number of updated records.
    [[nodiscard]] Result<std::size_t> update(const Predicate& predicate, const Patch& patch) {
        if (!predicate) {
            return Err<std::size_t>(ErrorCode::InvalidArgument,
                "A predicate must be provided for updates");
        }

        auto records = read();
        if (!records) {
            return Err<std::size_t>(records.error());
        }

        std::size_t updated = 0;
        for (auto& record : *records) {
            if (predicate(record)) {
                apply_patch(record, patch);
                ++updated;
            }
        }

        if (updated == 0) {
            return Err<std::size_t>(ErrorCode::NotFound,
                "No matching records found for update");
        }

        if (auto status = write(*records); !status) {
            return Err<std::size_t>(status.error());
        }
        return Ok(updated);
    }

    /// Apply each entry in order over one snapshot; later entries see the
    /// effect of earlier ones. Entries matching nothing are skipped.
    [[nodiscard]] Result<std::size_t> bulk_update(const std::vector<UpdateEntry>& entries) {
        auto records = read();
        if (!records) {
            return Err<std::size_t>(records.error());
        }

        std::size_t updated = 0;
        for (const auto& entry : entries) {
            if (!entry.predicate) {
                continue;
            }
            for (auto& record : *records) {
                if (entry.predicate(record)) {
                    apply_patch(record, entry.patch);
                    ++updated;
                }
            }
        }

        if (auto status = write(*records); !status) {
            return Err<std::size_t>(status.error());
        }
        return Ok(updated);
    }

    // ==========================================================================
    // Remove
    // ==========================================================================

    /// Delete every match. Without a predicate nothing is deleted, which
    /// makes the call fail with NotFound like any other empty match.
    [[nodiscard]] Result<std::size_t> remove(const Predicate& predicate = {}) {
        auto records = read();
        if (!records) {
            return Err<std::size_t>(records.error());
        }

        const auto before = records->size();
        if (predicate) {
            std::erase_if(*records, predicate);
        }

        const auto removed = before - records->size();
        if (removed == 0) {
            return Err<std::size_t>(ErrorCode::NotFound,
                "No matching records found for removal");
        }

        if (auto status = write(*records); !status) {
            return Err<std::size_t>(status.error());
        }
        return Ok(removed);
    }

    /// Filter the collection by each predicate in turn. A record removed by an
    /// earlier predicate is never shown to a later one. Never NotFound.
    [[nodiscard]] Result<std::size_t> bulk_remove(const std::vector<Predicate>& predicates) {
        auto records = read();
        if (!records) {
            return Err<std::size_t>(records.error());
        }

        const auto before = records->size();
        for (const auto& predicate : predicates) {
            if (predicate) {
                std::erase_if(*records, predicate);
            }
        }

        if (auto status = write(*records); !status) {
            return Err<std::size_t>(status.error());
        }
        return Ok(before - records->size());
    }

    // ==========================================================================
    // Document round trip
    // ==========================================================================

    [[nodiscard]] Result<std::vector<Record>> read() const {
        auto document = read_document(path());
        if (!document) {
            log::error("Error reading '{}': {}", path().string(), document.error().to_string());
            return Err<std::vector<Record>>(document.error());
        }

        if (!document->is_array()) {
            return Err<std::vector<Record>>(ErrorCode::DocumentCorrupted,
                fmt::format("'{}' must hold a JSON array, found {}",
                    path().string(), document->type_name()));
        }

        std::vector<Record> records;
        records.reserve(document->size());

        for (std::size_t i = 0; i < document->size(); ++i) {
            try {
                records.push_back((*document)[i].template get<Record>());
            } catch (const std::exception& e) {
                return Err<std::vector<Record>>(ErrorCode::DocumentCorrupted,
                    fmt::format("Record {} in '{}' is invalid: {}", i, path().string(), e.what()));
            }
        }

        log::debug("Read {} records from '{}'", records.size(), path().string());
        return Ok(std::move(records));
    }

    [[nodiscard]] Status write(const std::vector<Record>& records) const {
        auto document = nlohmann::json::array();
        try {
            for (const auto& record : records) {
                document.push_back(nlohmann::json(record));
            }
        } catch (const std::exception& e) {
            return Err(ErrorCode::StorageWriteFailure,
                fmt::format("Failed to encode records for '{}': {}", path().string(), e.what()));
        }

        if (auto status = write_document(path(), document, config_.indent); !status) {
            log::error("Error writing '{}': {}", path().string(), status.error().to_string());
            return status;
        }

        log::debug("Wrote {} records to '{}'", records.size(), path().string());
        return Ok();
    }

private:
    StoreConfig config_;
};

} // namespace chartdb::store
