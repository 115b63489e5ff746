// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Command Handlers Implementation                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "commands.hpp"

#include "internal/model/chart.hpp"
#include "internal/sql/sanitizer.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>

#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>

namespace chartdb::cli {

using nlohmann::json;

Result<json> read_json_input(const std::string& source, std::istream& in) {
    std::string text;

    if (source == "-") {
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(source, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return Err<json>(ErrorCode::FileNotFound,
                fmt::format("Failed to open '{}'", source));
        }
        text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<json>(ErrorCode::InvalidArgument,
            fmt::format("'{}' does not contain valid JSON", source == "-" ? "<stdin>" : source));
    }
    return Ok(std::move(parsed));
}

Result<json> parse_parameters(const std::vector<std::string>& assignments) {
    auto params = json::object();

    for (const auto& assignment : assignments) {
        auto pos = assignment.find('=');
        if (pos == std::string::npos || pos == 0) {
            return Err<json>(ErrorCode::InvalidArgument,
                fmt::format("Parameter '{}' must have the form key=value", assignment));
        }

        auto key = assignment.substr(0, pos);
        auto raw = assignment.substr(pos + 1);

        auto value = json::parse(raw, nullptr, false);
        params[key] = value.is_discarded() ? json(raw) : std::move(value);
    }

    return Ok(std::move(params));
}

void print_json(std::ostream& out, const json& value) {
    out << value.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
}

Status run_list(core::ChartService& service, CommandIo io) {
    auto charts = service.find_all();
    if (!charts) {
        return Err(charts.error());
    }
    print_json(io.out, json(*charts));
    return Ok();
}

Status run_show(core::ChartService& service, CommandIo io, const std::string& id_or_name) {
    auto chart = service.find_one(id_or_name);
    if (!chart) {
        return Err(chart.error());
    }
    print_json(io.out, json(*chart));
    return Ok();
}

Status run_create(core::ChartService& service, CommandIo io, const std::string& source) {
    auto body = read_json_input(source, io.in);
    if (!body) {
        return Err(body.error());
    }

    auto draft = model::parse_chart(*body);
    if (!draft) {
        return Err(draft.error());
    }

    auto chart = service.create(std::move(*draft));
    if (!chart) {
        return Err(chart.error());
    }
    print_json(io.out, json(*chart));
    return Ok();
}

Status run_update(core::ChartService& service, CommandIo io,
                  const std::string& id_or_name, const std::string& source) {
    auto body = read_json_input(source, io.in);
    if (!body) {
        return Err(body.error());
    }

    auto patch = model::parse_patch(*body);
    if (!patch) {
        return Err(patch.error());
    }
    if (patch->empty()) {
        return Err(ErrorCode::InvalidArgument, "Patch does not change any field");
    }

    auto chart = service.update(id_or_name, *patch);
    if (!chart) {
        return Err(chart.error());
    }
    print_json(io.out, json(*chart));
    return Ok();
}

Status run_delete(core::ChartService& service, CommandIo io, const std::string& id) {
    auto remaining = service.remove(id);
    if (!remaining) {
        return Err(remaining.error());
    }
    print_json(io.out, json(*remaining));
    return Ok();
}

Status run_data(core::ChartService& service, CommandIo io,
                const std::string& id_or_name, const std::vector<std::string>& assignments) {
    auto params = parse_parameters(assignments);
    if (!params) {
        return Err(params.error());
    }

    auto data = service.get_data(id_or_name, *params);
    if (!data) {
        return Err(data.error());
    }

    print_json(io.out, json{{"data", data->data}, {"filters", data->filters}});
    return Ok();
}

Status run_sanitize(CommandIo io, const std::string& text) {
    std::string sql = text;
    if (text == "-") {
        sql.assign(std::istreambuf_iterator<char>(io.in), std::istreambuf_iterator<char>());
    }

    auto inspection = sql::inspect_query(sql);

    json report = {{"verdict", sql::query_verdict_to_string(inspection.verdict)}};
    if (inspection.verdict == sql::QueryVerdict::Present) {
        report["sql"] = inspection.sql;
    } else if (inspection.verdict == sql::QueryVerdict::Rejected) {
        report["reason"] = inspection.reason;
    }
    print_json(io.out, report);
    return Ok();
}

Status run_init(const store::ChartStore& store, CommandIo io, bool with_prototype) {
    std::vector<model::ChartRecord> seed;
    if (with_prototype) {
        auto chart = model::prototype_chart();
        chart.id = core::IdGenerator{}.next();
        seed.push_back(std::move(chart));
    }

    auto created = store.initialize(seed);
    if (!created) {
        return Err(created.error());
    }

    if (!*created) {
        log::warn("'{}' already exists; left unchanged", store.path().string());
    }
    print_json(io.out, json{{"path", store.path().string()}, {"created", *created}});
    return Ok();
}

} // namespace chartdb::cli
