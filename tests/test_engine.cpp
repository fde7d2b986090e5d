#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Engine.hpp"
#include "MySQLDialect.hpp"
#include "MSSQLDialect.hpp"
#include <thread>

using namespace sqlquote;

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.dialect.database_type = "postgresql";
        config_.quoting.mode = "table_and_columns";
        config_.quoting.policy = "add_always";
    }

    Config config_;
};

TEST_F(EngineTest, CreateFromConfig) {
    auto engine = Engine::create(config_);

    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->dialect().type(), DatabaseType::PostgreSQL);
    EXPECT_EQ(engine->quotes(), std::make_pair('"', '"'));
    EXPECT_EQ(engine->quoteMode(), QuoteMode::TableAndColumns);
    EXPECT_EQ(engine->quotePolicy(), QuotePolicy::AddAlways);
}

TEST_F(EngineTest, CreateRejectsUnknownSettings) {
    Config badType = config_;
    badType.dialect.database_type = "informix";
    EXPECT_THROW(Engine::create(badType), std::invalid_argument);

    Config badMode = config_;
    badMode.quoting.mode = "everything";
    EXPECT_THROW(Engine::create(badMode), std::invalid_argument);

    Config badPolicy = config_;
    badPolicy.quoting.policy = "maybe";
    EXPECT_THROW(Engine::create(badPolicy), std::invalid_argument);
}

TEST_F(EngineTest, NullDialectThrows) {
    EXPECT_THROW(Engine engine(nullptr, QuoteMode::TableAndColumns, QuotePolicy::AddAlways),
                 std::invalid_argument);
}

TEST_F(EngineTest, QuoteForwardsToPipeline) {
    auto engine = Engine::create(config_);

    EXPECT_EQ(engine->quote("users", false), "\"users\"");
    EXPECT_EQ(engine->quote("`app`.users", false), "\"app\".\"users\"");
    EXPECT_EQ(engine->quote("*", true), "*");
    EXPECT_EQ(engine->quote("  ", true), "");
}

TEST_F(EngineTest, ReservedPolicyWithConfiguredWords) {
    config_.quoting.policy = "add_reserved";
    config_.dialect.reserved_words = {"tenant"};
    auto engine = Engine::create(config_);

    EXPECT_TRUE(engine->isReserved("TENANT"));
    EXPECT_EQ(engine->quote("tenant", true), "\"tenant\"");
    EXPECT_EQ(engine->quote("user", false), "\"user\"");
    EXPECT_EQ(engine->quote("accounts", false), "accounts");
}

TEST_F(EngineTest, TableOnlyMode) {
    Engine engine(std::make_unique<MySQLDialect>(), QuoteMode::TableOnly, QuotePolicy::AddAlways);

    EXPECT_EQ(engine.quote("users", false), "`users`");
    EXPECT_EQ(engine.quote("name", true), "name");
    EXPECT_EQ(engine.quoteColumns("a,b"), "a,b");
}

TEST_F(EngineTest, BatchHelpers) {
    Engine engine(std::make_unique<MSSQLDialect>(), QuoteMode::TableAndColumns,
                  QuotePolicy::AddAlways);

    EXPECT_EQ(engine.quoteColumns("id,name"), "[id],[name]");
    EXPECT_EQ(engine.quoteJoin({"dbo.t", "`c`"}), "[dbo].[t],[c]");
    EXPECT_EQ(quoteJoinFunc({"a", "b"},
                            [&engine](const std::string& v) { return engine.quote(v, true); },
                            " ="),
              "[a] = [b]");
}

TEST_F(EngineTest, Unquote) {
    Engine engine(std::make_unique<MSSQLDialect>(), QuoteMode::TableAndColumns,
                  QuotePolicy::AddAlways);

    EXPECT_EQ(engine.unquote("[users]"), "users");
    EXPECT_EQ(engine.unquote("`users`"), "users");
    EXPECT_EQ(engine.unquote(engine.quote("users", false)), "users");
}

TEST_F(EngineTest, UsableAsQuoter) {
    auto engine = Engine::create(config_);
    const Quoter& quoter = *engine;

    EXPECT_EQ(quote(quoter, "a.b", true), "\"a\".\"b\"");
    EXPECT_EQ(unquote(quoter, "\"a\""), "a");
}

// Concurrent reads of one engine
TEST_F(EngineTest, ConcurrentQuoting) {
    auto engine = Engine::create(config_);

    const int numThreads = 8;
    const int opsPerThread = 200;
    std::vector<std::thread> threads;
    std::vector<int> mismatches(numThreads, 0);

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&engine, &mismatches, t, opsPerThread]() {
            for (int i = 0; i < opsPerThread; ++i) {
                std::string name = "s" + std::to_string(t) + ".c" + std::to_string(i);
                std::string expected = "\"s" + std::to_string(t) + "\".\"c" +
                                       std::to_string(i) + "\"";
                if (engine->quote(name, true) != expected) {
                    ++mismatches[t];
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int count : mismatches) {
        EXPECT_EQ(count, 0);
    }
}
