#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// Third-party includes
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

// Project includes
#include "chartdb/version.hpp"
#include "cli/app_config.hpp"
#include "cli/commands.hpp"
#include "internal/core/chart_service.hpp"
#include "internal/sql/sqlite_executor.hpp"
#include "internal/store/chart_store.hpp"

// ============================================================================
// Logging
// ============================================================================
namespace {

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void setup_logging(const chartdb::cli::AppConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink; stdout is reserved for command output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink
        if (!config.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file,
                config.max_log_size,
                config.max_log_files
            );
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("chartdb", sinks.begin(), sinks.end());
        logger->set_level(parse_level(config.log_level));
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// ============================================================================
// Subcommand Options
// ============================================================================
struct CommandArgs {
    std::string target;
    std::string source = "-";
    std::vector<std::string> params;
    bool with_prototype = false;
};

chartdb::Status run_data_command(const chartdb::cli::AppConfig& config,
                                 chartdb::store::ChartStore store,
                                 chartdb::cli::CommandIo io,
                                 const CommandArgs& args) {
    std::unique_ptr<chartdb::sql::SqliteExecutor> executor;
    if (!config.database.empty()) {
        auto opened = chartdb::sql::SqliteExecutor::open(config.database);
        if (!opened) {
            return chartdb::Err(opened.error());
        }
        executor = std::move(*opened);
    }

    chartdb::core::ChartService service(std::move(store), executor.get());
    return chartdb::cli::run_data(service, io, args.target, args.params);
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    chartdb::cli::AppConfig config;
    CommandArgs args;

    CLI::App app{"ChartDB - chart definition store"};
    app.require_subcommand(1);

    // Storage options
    std::map<std::string, CLI::Option*, std::less<>> overridable;

    overridable["charts_file"] = app.add_option("-f,--charts-file", config.charts_file,
        "Chart document path")
        ->envname("CHARTDB_CHARTS_FILE");

    overridable["database"] = app.add_option("-d,--database", config.database,
        "SQLite database that chart queries run against")
        ->envname("CHARTDB_DATABASE");

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("CHARTDB_CONFIG");

    // Logging options
    overridable["log_level"] = app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error/off)")
        ->envname("CHARTDB_LOG_LEVEL");

    overridable["log_file"] = app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("CHARTDB_LOG_FILE");

    // Version flag
    app.add_flag_callback("--version", []() {
        std::cout << "ChartDB version " << CHARTDB_VERSION << std::endl;
        std::cout << "Build type: " << CHARTDB_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << CHARTDB_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    // Subcommands
    auto* list = app.add_subcommand("list", "Print every chart");

    auto* show = app.add_subcommand("show", "Print one chart by id or name");
    show->add_option("chart", args.target, "Chart id or name")->required();

    auto* create = app.add_subcommand("create", "Store a new chart read from a JSON body");
    create->add_option("body", args.source, "JSON file, or - for stdin");

    auto* update = app.add_subcommand("update", "Merge a JSON patch into a chart");
    update->add_option("chart", args.target, "Chart id or name")->required();
    update->add_option("patch", args.source, "JSON file, or - for stdin");

    auto* remove = app.add_subcommand("delete", "Delete a chart by id");
    remove->add_option("id", args.target, "Chart id")->required();

    auto* data = app.add_subcommand("data", "Run a chart's query and print its rows");
    data->add_option("chart", args.target, "Chart id or name")->required();
    data->add_option("-P,--param", args.params, "Query parameter override (key=value)");

    auto* sanitize = app.add_subcommand("sanitize", "Check SQL against the read-only filter");
    sanitize->add_option("sql", args.target, "SQL text, or - for stdin")->required();

    auto* init = app.add_subcommand("init", "Create the chart document if it does not exist");
    init->add_flag("--with-prototype", args.with_prototype, "Seed the document with a sample chart");

    // Parse
    CLI11_PARSE(app, argc, argv);

    // Load config file; flags and environment win over it
    if (!config.config_file.empty()) {
        auto loaded = config.load_from_file(config.config_file, [&overridable](std::string_view key) {
            auto it = overridable.find(key);
            return it != overridable.end() && it->second->count() > 0;
        });
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().to_string() << std::endl;
            return EXIT_FAILURE;
        }
    }

    setup_logging(config);
    spdlog::debug("ChartDB v{} ({} with {})", CHARTDB_VERSION, CHARTDB_BUILD_TYPE, CHARTDB_COMPILER);
    spdlog::debug("Chart document: {}", config.charts_file);

    chartdb::store::ChartStore store(config.store_config());
    chartdb::cli::CommandIo io{std::cin, std::cout};
    chartdb::Status status;

    try {
        if (*sanitize) {
            status = chartdb::cli::run_sanitize(io, args.target);
        } else if (*init) {
            status = chartdb::cli::run_init(store, io, args.with_prototype);
        } else if (*data) {
            status = run_data_command(config, std::move(store), io, args);
        } else {
            chartdb::core::ChartService service(std::move(store));

            if (*list) status = chartdb::cli::run_list(service, io);
            else if (*show) status = chartdb::cli::run_show(service, io, args.target);
            else if (*create) status = chartdb::cli::run_create(service, io, args.source);
            else if (*update) status = chartdb::cli::run_update(service, io, args.target, args.source);
            else if (*remove) status = chartdb::cli::run_delete(service, io, args.target);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    if (!status) {
        spdlog::error("{}", status.error().to_string());
        return EXIT_FAILURE;
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}
