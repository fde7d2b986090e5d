#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>

using namespace sqlquote;
using ::testing::ElementsAre;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "sql_quote_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    static Config parse(std::vector<std::string> args) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>("sql-quote"));
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Config::parseArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_EQ(config.dialect.database_type, "mysql");
    EXPECT_TRUE(config.dialect.reserved_words.empty());
    EXPECT_EQ(config.quoting.mode, "table_and_columns");
    EXPECT_EQ(config.quoting.policy, "add_always");
    EXPECT_FALSE(config.output.tables);
    EXPECT_FALSE(config.output.columns);
    EXPECT_FALSE(config.output.unquote);
    EXPECT_FALSE(config.output.json);
    EXPECT_TRUE(config.output.pretty_json);
    EXPECT_FALSE(config.debug);
    EXPECT_TRUE(config.identifiers.empty());
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
[dialect]
type = postgresql
reserved_words = tenant, widget

[quoting]
mode = columns_only
policy = add_reserved

[output]
json = true
pretty_json = false

[logging]
debug = 1
file = /tmp/sql-quote.log
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->dialect.database_type, "postgresql");
    EXPECT_THAT(config->dialect.reserved_words, ElementsAre("tenant", "widget"));
    EXPECT_EQ(config->quoting.mode, "columns_only");
    EXPECT_EQ(config->quoting.policy, "add_reserved");
    EXPECT_TRUE(config->output.json);
    EXPECT_FALSE(config->output.pretty_json);
    EXPECT_TRUE(config->debug);
    EXPECT_EQ(config->log_file, "/tmp/sql-quote.log");
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    auto config = Config::loadFromFile("/nonexistent/path/config.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromEmptyFile) {
    writeConfigFile("empty.conf", "");

    auto config = Config::loadFromFile(tempDir_ / "empty.conf");

    // Should still return a config with defaults
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->dialect.database_type, "mysql");
}

TEST_F(ConfigTest, ConfigWithCommentsAndQuotedValues) {
    writeConfigFile("comments.conf", R"(
# dialect settings
[dialect]
; SQL Server
type = "mssql"
not a key value line

[quoting]
policy = 'no_add'
)");

    auto config = Config::loadFromFile(tempDir_ / "comments.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->dialect.database_type, "mssql");
    EXPECT_EQ(config->quoting.policy, "no_add");
    EXPECT_EQ(config->quoting.mode, "table_and_columns");
}

TEST_F(ConfigTest, KeysOutsideKnownSectionsAreIgnored) {
    writeConfigFile("unknown.conf", R"(
type = oracle
[other]
type = oracle
)");

    auto config = Config::loadFromFile(tempDir_ / "unknown.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->dialect.database_type, "mysql");
}

// Validation tests
TEST_F(ConfigTest, ValidateDefaultsWithIdentifier) {
    Config config;
    config.identifiers = {"users"};

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsUnknownValues) {
    Config config;
    config.identifiers = {"users"};

    config.dialect.database_type = "db2";
    EXPECT_FALSE(config.validate());

    config.dialect.database_type = "sqlite";
    config.quoting.mode = "rows";
    EXPECT_FALSE(config.validate());

    config.quoting.mode = "table_only";
    config.quoting.policy = "sometimes";
    EXPECT_FALSE(config.validate());

    config.quoting.policy = "add_reserved";
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsTableWithColumns) {
    Config config;
    config.identifiers = {"users"};
    config.output.tables = true;
    config.output.columns = true;

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRequiresIdentifiers) {
    Config config;

    EXPECT_FALSE(config.validate());
}

// Command line tests
TEST_F(ConfigTest, ParseArgs) {
    auto config = parse({"-t", "postgres", "--mode", "table_only", "--policy", "no_add",
                         "--reserved", "a,b", "--table", "--json", "users", "app.orders"});

    EXPECT_EQ(config.dialect.database_type, "postgres");
    EXPECT_EQ(config.quoting.mode, "table_only");
    EXPECT_EQ(config.quoting.policy, "no_add");
    EXPECT_THAT(config.dialect.reserved_words, ElementsAre("a", "b"));
    EXPECT_TRUE(config.output.tables);
    EXPECT_TRUE(config.output.json);
    EXPECT_FALSE(config.output.unquote);
    EXPECT_THAT(config.identifiers, ElementsAre("users", "app.orders"));
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    writeConfigFile("base.conf", R"(
[dialect]
type = oracle
reserved_words = tenant

[quoting]
policy = add_reserved
)");

    auto config = parse({"-c", (tempDir_ / "base.conf").string(), "-t", "sqlite",
                         "-r", "widget", "--unquote", "\"x\""});

    EXPECT_EQ(config.dialect.database_type, "sqlite");
    EXPECT_EQ(config.quoting.policy, "add_reserved");
    EXPECT_THAT(config.dialect.reserved_words, ElementsAre("tenant", "widget"));
    EXPECT_TRUE(config.output.unquote);
    EXPECT_THAT(config.identifiers, ElementsAre("\"x\""));
}

TEST_F(ConfigTest, MissingConfigFileKeepsDefaults) {
    auto config = parse({"-c", (tempDir_ / "missing.conf").string(), "users"});

    EXPECT_EQ(config.dialect.database_type, "mysql");
    EXPECT_THAT(config.identifiers, ElementsAre("users"));
}
