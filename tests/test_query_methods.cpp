#include <gtest/gtest.h>
#include "TestUtils.hpp"
#include "Engine.hpp"
#include "Loader.hpp"
#include "SQLiteConnection.hpp"
#include <thread>

using namespace sqlctx;
using namespace sqlctx::testing_utils;
using namespace std::chrono_literals;

namespace {

struct User {
    int64_t id;
    std::string name;

    static User fromRow(const Row& row) {
        return User{row.at("id").asInt(), row.at("name").asString()};
    }
};

}  // namespace

class QueryMethodsTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = Engine::create(db_.url());
        engine_->status("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL, "
                        "score REAL, avatar BLOB)");
        engine_->executeMany("INSERT INTO users (id, name, score, avatar) VALUES (?, ?, ?, ?)", {
            {1, "alice", 9.5, Blob{0x01, 0x02}},
            {2, "bob", nullptr, nullptr},
            {3, "carol", 7.25, nullptr},
        });
    }

    void TearDown() override {
        engine_->close();
    }

    TempDatabase db_;
    std::shared_ptr<Engine> engine_;
};

// ============================================================================
// Result shapes
// ============================================================================

TEST_F(QueryMethodsTest, AllReturnsRowsInOrder) {
    auto rows = engine_->all("SELECT id, name FROM users ORDER BY id");

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].at("name").asString(), "alice");
    EXPECT_EQ(rows[2].at("id").asInt(), 3);
    EXPECT_EQ(rows[1].columns(), (std::vector<std::string>{"id", "name"}));
}

TEST_F(QueryMethodsTest, ValueTypesRoundTrip) {
    auto row = engine_->one(Query("SELECT id, name, score, avatar FROM users WHERE id = ?", {1}));

    EXPECT_EQ(row.at("id").type(), Value::Type::Integer);
    EXPECT_EQ(row.at("name").type(), Value::Type::Text);
    EXPECT_DOUBLE_EQ(row.at("score").asDouble(), 9.5);
    EXPECT_EQ(row.at("avatar").asBlob(), (Blob{0x01, 0x02}));

    auto bob = engine_->one(Query("SELECT score FROM users WHERE id = ?", {2}));
    EXPECT_TRUE(bob[0].isNull());
}

TEST_F(QueryMethodsTest, FirstReturnsOnlyFirstRow) {
    auto row = engine_->first("SELECT name FROM users ORDER BY id DESC");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at(0).asString(), "carol");

    EXPECT_FALSE(engine_->first("SELECT name FROM users WHERE id > 100").has_value());
}

TEST_F(QueryMethodsTest, OneCardinality) {
    EXPECT_THROW(engine_->one("SELECT * FROM users WHERE id > 100"), NoResultError);
    EXPECT_EQ(engine_->one("SELECT name FROM users WHERE id = 2")[0].asString(), "bob");
    EXPECT_THROW(engine_->one("SELECT * FROM users"), MultipleResultsError);
}

TEST_F(QueryMethodsTest, OneOrNoneCardinality) {
    EXPECT_FALSE(engine_->oneOrNone("SELECT * FROM users WHERE id > 100").has_value());
    EXPECT_EQ(engine_->oneOrNone("SELECT name FROM users WHERE id = 3")->at(0).asString(), "carol");
    EXPECT_THROW(engine_->oneOrNone("SELECT * FROM users"), MultipleResultsError);
}

TEST_F(QueryMethodsTest, Scalar) {
    EXPECT_EQ(engine_->scalar("SELECT COUNT(*) FROM users").asInt(), 3);
    EXPECT_EQ(engine_->scalar("SELECT name, id FROM users WHERE id = 1").asString(), "alice");
    EXPECT_TRUE(engine_->scalar("SELECT name FROM users WHERE id > 100").isNull());
}

TEST_F(QueryMethodsTest, StatusReportsAffectedRows) {
    auto result = engine_->status("UPDATE users SET score = 0 WHERE score IS NOT NULL");

    EXPECT_EQ(result.rowsAffected, 2u);
    EXPECT_EQ(result.statusTag, "UPDATE 2");
    EXPECT_TRUE(result.rows.empty());

    auto select = engine_->status("SELECT id FROM users");
    EXPECT_EQ(select.statusTag, "SELECT 3");
    EXPECT_EQ(select.rows.size(), 3u);
}

TEST_F(QueryMethodsTest, ExecuteManyAccumulatesAffectedRows) {
    auto result = engine_->executeMany("UPDATE users SET name = name || ? WHERE id = ?", {
        {"!", 1},
        {"?", 2},
        {"", 404},
    });

    EXPECT_EQ(result.rowsAffected, 2u);
    EXPECT_EQ(engine_->scalar("SELECT name FROM users WHERE id = 2").asString(), "bob?");
}

TEST_F(QueryMethodsTest, ExecuteManyWithNoParameterSets) {
    auto result = engine_->executeMany("DELETE FROM users WHERE id = ?", {});

    EXPECT_EQ(result.rowsAffected, 0u);
    EXPECT_EQ(engine_->scalar("SELECT COUNT(*) FROM users").asInt(), 3);
}

TEST_F(QueryMethodsTest, NamedParameters) {
    Query query("SELECT name FROM users WHERE id = :id OR name = :name ORDER BY id",
                Params::fromNamed({{"id", Value(1)}, {"name", Value("carol")}}));

    auto rows = engine_->all(query);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][0].asString(), "carol");
}

TEST_F(QueryMethodsTest, DriverErrorsPropagateUnwrapped) {
    try {
        engine_->status("INSERT INTO users (id, name) VALUES (1, 'duplicate')");
        FAIL() << "Expected a constraint violation";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.errorCode() & 0xff, SQLITE_CONSTRAINT);
    }

    EXPECT_THROW(engine_->all("SELECT * FROM missing_table"), DriverError);
}

TEST_F(QueryMethodsTest, MultipleStatementsAllRun) {
    engine_->status("CREATE TABLE t (x INTEGER)");

    auto result = engine_->status("INSERT INTO t VALUES (1); INSERT INTO t VALUES (2)");

    EXPECT_EQ(engine_->scalar("SELECT COUNT(*) FROM t").asInt(), 2);
    EXPECT_EQ(result.statusTag, "INSERT 1");
}

TEST_F(QueryMethodsTest, MultipleStatementsShareParameters) {
    engine_->status("CREATE TABLE t (x INTEGER)");

    engine_->status(Query("INSERT INTO t VALUES (?);\n-- second\nINSERT INTO t VALUES (?), (?);", {1, 2, 3}));

    EXPECT_EQ(engine_->scalar("SELECT SUM(x) FROM t").asInt(), 6);
    auto last = engine_->all("UPDATE t SET x = x + 1; SELECT x FROM t ORDER BY x");
    ASSERT_EQ(last.size(), 3u);
    EXPECT_EQ(last[0][0].asInt(), 2);
}

TEST_F(QueryMethodsTest, WhitespaceOnlyStatementIsRejected) {
    EXPECT_THROW(engine_->status("  -- nothing\n"), InterfaceError);
}

TEST_F(QueryMethodsTest, ParameterCountMismatch) {
    EXPECT_THROW(engine_->all(Query("SELECT * FROM users WHERE id = ?")), InterfaceError);
}

// ============================================================================
// Loaders
// ============================================================================

TEST_F(QueryMethodsTest, ModelLoaderFromExecutionOptions) {
    ExecutionOptions options;
    options.model = modelLoader<User>();
    Query query = Query("SELECT id, name FROM users ORDER BY id").executionOptions(options);

    auto users = engine_->allAs<User>(query);
    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[1].name, "bob");

    auto first = engine_->firstAs<User>(query);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, 1);
}

TEST_F(QueryMethodsTest, ExplicitLoaderWinsOverModel) {
    ExecutionOptions options;
    options.model = modelLoader<User>();
    options.loader = std::make_shared<ColumnLoader>("name");

    auto names = engine_->allAs<Value>(Query("SELECT id, name FROM users ORDER BY id", {}, options));
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0].asString(), "alice");
}

TEST_F(QueryMethodsTest, ReturnModelFalseYieldsRows) {
    ExecutionOptions options;
    options.model = modelLoader<User>();
    options.returnModel = false;

    auto row = engine_->oneAs<Row>(Query("SELECT id, name FROM users WHERE id = 3", {}, options));
    EXPECT_EQ(row.at("name").asString(), "carol");
}

TEST_F(QueryMethodsTest, OneOrNoneAs) {
    ExecutionOptions options;
    options.loader = std::make_shared<CallableLoader>([](const Row& row) -> std::any {
        return row[0].asString() + "@example.com";
    });

    auto email = engine_->oneOrNoneAs<std::string>(
        Query("SELECT name FROM users WHERE id = 2", {}, options));
    ASSERT_TRUE(email.has_value());
    EXPECT_EQ(*email, "bob@example.com");

    EXPECT_FALSE(engine_->oneOrNoneAs<std::string>(
        Query("SELECT name FROM users WHERE id = 9", {}, options)).has_value());
}

TEST_F(QueryMethodsTest, HandleOptionsApplyToQueries) {
    auto conn = engine_->acquire();
    ExecutionOptions options;
    options.model = modelLoader<User>();
    auto modeled = conn->executionOptions(options);

    EXPECT_TRUE(modeled->isReusing());
    EXPECT_TRUE(modeled->isLazy());
    EXPECT_EQ(modeled->oneAs<User>("SELECT id, name FROM users WHERE id = 1").name, "alice");
    EXPECT_EQ(modeled->rawConnection(), conn->rawConnection());

    // The original handle is left untouched
    EXPECT_EQ(conn->executionOptions().model, nullptr);
    EXPECT_THROW(conn->oneAs<User>("SELECT id, name FROM users WHERE id = 1"), InterfaceError);
    modeled->release();
}

TEST_F(QueryMethodsTest, QueryOptionsOverrideHandleOptions) {
    ExecutionOptions engineOptions;
    engineOptions.model = modelLoader<User>();
    engine_->updateExecutionOptions(engineOptions);

    ExecutionOptions plain;
    plain.returnModel = false;
    auto row = engine_->oneAs<Row>(Query("SELECT id, name FROM users WHERE id = 1", {}, plain));
    EXPECT_EQ(row.at("id").asInt(), 1);

    auto user = engine_->oneAs<User>("SELECT id, name FROM users WHERE id = 2");
    EXPECT_EQ(user.name, "bob");
}

// ============================================================================
// Timeouts
// ============================================================================

TEST_F(QueryMethodsTest, StatementTimeout) {
    ExecutionOptions options;
    options.timeout = 50ms;
    Query endless("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                  "SELECT COUNT(*) FROM c", {}, options);

    auto start = Clock::now();
    EXPECT_THROW(engine_->scalar(endless), TimeoutError);
    EXPECT_LT(Clock::now() - start, 5000ms);

    // The connection stays usable
    EXPECT_EQ(engine_->scalar("SELECT COUNT(*) FROM users").asInt(), 3);
}

TEST_F(QueryMethodsTest, TimeoutOptionBoundsRootLockWait) {
    auto conn = engine_->acquire();
    auto lease = conn->leaseRaw(std::nullopt);

    ExecutionOptions options;
    options.timeout = 30ms;
    auto shared = conn->executionOptions(options);
    std::thread other([&]() {
        EXPECT_THROW(shared->scalar("SELECT 1"), TimeoutError);
    });
    other.join();

    lease.lock.unlock();
    EXPECT_EQ(shared->scalar("SELECT 1").asInt(), 1);
    shared->release();
}

// ============================================================================
// Fake backend
// ============================================================================

TEST(QueryMethodsFakeTest, ShortcutsRunOnCurrentConnection) {
    auto server = std::make_shared<FakeServer>();
    auto engine = makeFakeEngine(server);

    auto conn = engine->acquire();
    engine->scalar("SELECT 1");
    engine->status("SELECT 2");

    EXPECT_EQ(server->opened.load(), 1);
    EXPECT_EQ(engine->status().checkedOut, 1);
}

TEST(QueryMethodsFakeTest, ShortcutsWithoutCurrentConnectionReturnIt) {
    auto server = std::make_shared<FakeServer>();
    auto engine = makeFakeEngine(server);

    EXPECT_EQ(engine->scalar("SELECT 8").asInt(), 8);

    EXPECT_EQ(engine->status().checkedOut, 0);
    EXPECT_EQ(engine->currentConnection(), nullptr);
}
