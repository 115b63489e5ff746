// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Command Handler Unit Tests                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cli/commands.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace chartdb;
using namespace chartdb::cli;
using nlohmann::json;

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "chartdb_commands_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        StoreConfig config;
        config.document_path = test_dir_ / "charts.json";
        store_ = store::ChartStore(config);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    CommandIo io() { return CommandIo{in_, out_}; }

    void feed(const std::string& text) {
        in_.clear();
        in_.str(text);
    }

    json output() {
        auto parsed = json::parse(out_.str());
        out_.str("");
        return parsed;
    }

    std::filesystem::path test_dir_;
    store::ChartStore store_;
    std::istringstream in_;
    std::ostringstream out_;
};

// ==============================================================================
// Helpers
// ==============================================================================

TEST(ParametersTest, ValuesKeepJsonTypes) {
    auto params = parse_parameters({"year=2023", "name=\"2023\"", "live=true", "region=EU", "empty="});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ((*params)["year"], 2023);
    EXPECT_EQ((*params)["name"], "2023");
    EXPECT_EQ((*params)["live"], true);
    EXPECT_EQ((*params)["region"], "EU");
    EXPECT_EQ((*params)["empty"], "");
}

TEST(ParametersTest, MissingEqualsIsRejected) {
    auto params = parse_parameters({"year"});
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().code(), ErrorCode::InvalidArgument);
}

TEST(ParametersTest, ValueMayContainEquals) {
    auto params = parse_parameters({"expr=a=b"});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ((*params)["expr"], "a=b");
}

TEST_F(CommandsTest, ReadJsonFromStdin) {
    feed(R"({"name": "Sales"})");
    auto body = read_json_input("-", in_);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["name"], "Sales");
}

TEST_F(CommandsTest, ReadInvalidJsonFails) {
    feed("{ not json");
    auto body = read_json_input("-", in_);
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(CommandsTest, ReadMissingFileFails) {
    auto body = read_json_input((test_dir_ / "absent.json").string(), in_);
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code(), ErrorCode::FileNotFound);
}

// ==============================================================================
// Subcommands
// ==============================================================================

TEST_F(CommandsTest, InitCreatesEmptyDocumentOnce) {
    ASSERT_TRUE(run_init(store_, io(), false).has_value());
    EXPECT_EQ(output()["created"], true);

    ASSERT_TRUE(run_init(store_, io(), true).has_value());
    EXPECT_EQ(output()["created"], false);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records->empty());
}

TEST_F(CommandsTest, InitWithPrototype) {
    ASSERT_TRUE(run_init(store_, io(), true).has_value());

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].name, "Order History");
    EXPECT_FALSE((*records)[0].id.empty());
}

TEST_F(CommandsTest, CreateShowUpdateDelete) {
    ASSERT_TRUE(run_init(store_, io(), false).has_value());
    output();

    core::ChartService service(store_);

    {
        auto body = test_dir_ / "sales.json";
        std::ofstream(body) << R"({"name": "Sales", "xaxis": [{"key": "month"}], "yaxis": []})";
        ASSERT_TRUE(run_create(service, io(), body.string()).has_value());
    }
    auto created = output();
    const auto id = created["id"].get<std::string>();
    EXPECT_FALSE(id.empty());

    ASSERT_TRUE(run_show(service, io(), "Sales").has_value());
    EXPECT_EQ(output()["id"], id);

    feed(R"({"label": "Monthly"})");
    ASSERT_TRUE(run_update(service, io(), "Sales", "-").has_value());
    EXPECT_EQ(output()["label"], "Monthly");

    ASSERT_TRUE(run_list(service, io()).has_value());
    EXPECT_EQ(output().size(), 1u);

    ASSERT_TRUE(run_delete(service, io(), id).has_value());
    EXPECT_EQ(output(), json::array());
}

TEST_F(CommandsTest, EmptyPatchIsRejected) {
    ASSERT_TRUE(run_init(store_, io(), true).has_value());
    core::ChartService service(store_);

    feed("{}");
    auto status = run_update(service, io(), "Order History", "-");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(CommandsTest, ShowUnknownFails) {
    ASSERT_TRUE(run_init(store_, io(), false).has_value());
    core::ChartService service(store_);

    auto status = run_show(service, io(), "Nope");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::NotFound);
}

TEST_F(CommandsTest, DataWithoutExecutorPrintsFilters) {
    ASSERT_TRUE(run_init(store_, io(), true).has_value());
    output();
    core::ChartService service(store_);

    ASSERT_TRUE(run_data(service, io(), "Order History", {"year=2026"}).has_value());
    auto printed = output();
    EXPECT_EQ(printed["data"], json::array());
    EXPECT_EQ(printed["filters"], json({{"year", 2026}}));
}

TEST_F(CommandsTest, SanitizeReportsVerdict) {
    ASSERT_TRUE(run_sanitize(io(), "SELECT *\n FROM t;").has_value());
    auto present = output();
    EXPECT_EQ(present["verdict"], "present");
    EXPECT_EQ(present["sql"], "SELECT * FROM t");

    ASSERT_TRUE(run_sanitize(io(), "DROP TABLE t").has_value());
    auto rejected = output();
    EXPECT_EQ(rejected["verdict"], "rejected");
    EXPECT_EQ(rejected["reason"], "forbidden keyword 'DROP'");

    feed("   ");
    ASSERT_TRUE(run_sanitize(io(), "-").has_value());
    EXPECT_EQ(output()["verdict"], "absent");
}
