// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Command Handlers                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/chart_service.hpp"
#include "internal/core/types.hpp"
#include "internal/store/chart_store.hpp"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace chartdb::cli {

/// Streams a command reads its body from and prints its result to
struct CommandIo {
    std::istream& in;
    std::ostream& out;
};

/// Parse JSON from the file at `source`, or from `io.in` when `source` is "-"
[[nodiscard]] Result<nlohmann::json> read_json_input(const std::string& source, std::istream& in);

/// Turn `key=value` assignments into a parameter object. Values that parse
/// as JSON (numbers, booleans, quoted strings, ...) keep their type; anything
/// else is taken as a plain string.
[[nodiscard]] Result<nlohmann::json> parse_parameters(const std::vector<std::string>& assignments);

void print_json(std::ostream& out, const nlohmann::json& value);

[[nodiscard]] Status run_list(core::ChartService& service, CommandIo io);
[[nodiscard]] Status run_show(core::ChartService& service, CommandIo io, const std::string& id_or_name);
[[nodiscard]] Status run_create(core::ChartService& service, CommandIo io, const std::string& source);
[[nodiscard]] Status run_update(core::ChartService& service, CommandIo io,
                                const std::string& id_or_name, const std::string& source);
[[nodiscard]] Status run_delete(core::ChartService& service, CommandIo io, const std::string& id);
[[nodiscard]] Status run_data(core::ChartService& service, CommandIo io,
                              const std::string& id_or_name, const std::vector<std::string>& assignments);
[[nodiscard]] Status run_sanitize(CommandIo io, const std::string& text);
[[nodiscard]] Status run_init(const store::ChartStore& store, CommandIo io, bool with_prototype);

} // namespace chartdb::cli
