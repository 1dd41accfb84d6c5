#include <gtest/gtest.h>
#include "TestUtils.hpp"
#include "Database.hpp"

using namespace sqlctx;
using namespace sqlctx::testing_utils;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<FakeServer>();
    }

    std::shared_ptr<FakeServer> server_;
    Database db_;
};

TEST_F(DatabaseTest, UnboundOperationsRaise) {
    EXPECT_FALSE(db_.isBound());
    EXPECT_THROW(db_.bind(), UninitializedError);
    EXPECT_THROW(db_.acquire(), UninitializedError);
    EXPECT_THROW(db_.all("SELECT 1"), UninitializedError);
    EXPECT_THROW(db_.scalar("SELECT 1"), UninitializedError);
    EXPECT_THROW(db_.transaction([](Transaction&) {}), UninitializedError);
    EXPECT_THROW(db_.compile("SELECT 1"), UninitializedError);
}

TEST_F(DatabaseTest, UninitializedIsNotAnInterfaceError) {
    try {
        db_.first("SELECT 1");
        FAIL() << "Expected UninitializedError";
    } catch (const InterfaceError&) {
        FAIL() << "UninitializedError must not be an InterfaceError";
    } catch (const Error&) {
        SUCCEED();
    }
}

TEST_F(DatabaseTest, BoundEngineRunsQueries) {
    auto engine = makeFakeEngine(server_);
    EXPECT_EQ(db_.setBind(engine), engine);

    EXPECT_TRUE(db_.isBound());
    EXPECT_EQ(db_.bind(), engine);
    EXPECT_EQ(db_.scalar("SELECT 6").asInt(), 6);
    EXPECT_EQ(db_.one("SELECT 2")[0].asInt(), 2);
    EXPECT_EQ(server_->opened.load(), 1);
}

TEST_F(DatabaseTest, TransactionRunsOnBoundEngine) {
    db_.setBind(makeFakeEngine(server_));

    db_.transaction([&](Transaction&) {
        db_.status("SELECT 1");
    });

    auto log = server_->log();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.front(), "BEGIN");
    EXPECT_EQ(log.back(), "COMMIT");
}

TEST_F(DatabaseTest, PopBindReturnsPrevious) {
    auto engine = makeFakeEngine(server_);
    db_.setBind(engine);

    EXPECT_EQ(db_.popBind(), engine);
    EXPECT_FALSE(db_.isBound());
    EXPECT_EQ(db_.popBind(), nullptr);
}

TEST_F(DatabaseTest, BindScopeRestoresPreviousEngine) {
    auto outer = makeFakeEngine(server_);
    auto inner = makeFakeEngine(server_);
    db_.setBind(outer);

    {
        BindScope scope(db_, inner);
        EXPECT_EQ(db_.bind(), inner);
    }

    EXPECT_EQ(db_.bind(), outer);
}

TEST_F(DatabaseTest, BindScopeOnUnboundDatabase) {
    {
        BindScope scope(db_, makeFakeEngine(server_));
        EXPECT_TRUE(db_.isBound());
    }

    EXPECT_FALSE(db_.isBound());
}

TEST_F(DatabaseTest, SetBindFromUrl) {
    TempDatabase file;

    auto engine = db_.setBind(file.url());

    EXPECT_EQ(engine->dialect()->name(), "sqlite");
    EXPECT_EQ(db_.scalar("SELECT 3 * 3").asInt(), 9);
    engine->close();
}

TEST_F(DatabaseTest, SetBindFromConfig) {
    TempDatabase file;
    Config config;
    config.engine.database_type = "sqlite";
    config.connection.database = file.path();
    config.pool.pool_size = 1;

    db_.setBind(config);

    EXPECT_EQ(db_.bind()->status().size, 1u);
    EXPECT_EQ(db_.compile(Query("SELECT ?", {1})).sql, "SELECT ?");
    db_.bind()->close();
}

TEST_F(DatabaseTest, FailedSetBindKeepsPreviousEngine) {
    auto engine = makeFakeEngine(server_);
    db_.setBind(engine);

    EXPECT_THROW(db_.setBind(std::string("bogus")), InterfaceError);
    EXPECT_EQ(db_.bind(), engine);
}
