#include <gtest/gtest.h>
#include "TestUtils.hpp"
#include "Engine.hpp"
#include "Loader.hpp"
#include "PreparedStatement.hpp"
#include "SQLiteConnection.hpp"
#include <map>

using namespace sqlctx;
using namespace sqlctx::testing_utils;
using namespace std::chrono_literals;

namespace {

struct User {
    int64_t id;
    std::string nickname;

    static User fromRow(const Row& row) {
        return User{row.at("id").asInt(), row.at("nickname").asString()};
    }
};

Params named(const std::string& name, Value value) {
    return Params::fromNamed({{name, std::move(value)}});
}

}  // namespace

class PreparedStatementTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = Engine::create(db_.url());
        engine_->status("CREATE TABLE users (id INTEGER PRIMARY KEY AUTOINCREMENT, nickname TEXT NOT NULL)");
    }

    void TearDown() override {
        engine_->close();
    }

    TempDatabase db_;
    std::shared_ptr<Engine> engine_;
};

// ============================================================================
// Executions
// ============================================================================

TEST_F(PreparedStatementTest, InsertAndSelectWithNamedParameters) {
    auto conn = engine_->acquire();
    auto insert = conn->prepare("INSERT INTO users (nickname) VALUES (:name) RETURNING id, nickname");

    std::map<int64_t, std::string> users;
    for (const char* name : {"1", "2", "3", "4", "5"}) {
        auto row = insert.first(named("name", name));
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ(row->at("nickname").asString(), name);
        users[row->at("id").asInt()] = name;
    }
    ASSERT_EQ(users.size(), 5u);

    auto get = conn->prepare("SELECT id, nickname FROM users WHERE id = :uid");
    EXPECT_EQ(get.compiledSql(), "SELECT id, nickname FROM users WHERE id = ?");
    for (const auto& user : users) {
        auto row = get.first(named("uid", user.first));
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ(row->at("nickname").asString(), user.second);
        EXPECT_EQ(get.all(named("uid", user.first))[0].at("nickname").asString(), user.second);
    }

    EXPECT_TRUE(get.scalar(named("uid", -1)).isNull());
    EXPECT_FALSE(get.oneOrNone(named("uid", -1)).has_value());
    EXPECT_THROW(get.one(named("uid", -1)), NoResultError);
}

TEST_F(PreparedStatementTest, StatusTagPerExecution) {
    engine_->executeMany("INSERT INTO users (nickname) VALUES (?)", {{"a"}, {"b"}, {"c"}});
    auto conn = engine_->acquire();

    auto remove = conn->prepare("DELETE FROM users WHERE nickname = :name");
    for (const char* name : {"a", "b", "c"}) {
        EXPECT_EQ(remove.status(named("name", name)).statusTag, "DELETE 1");
    }
    EXPECT_EQ(remove.status(named("name", "a")).statusTag, "DELETE 0");
}

TEST_F(PreparedStatementTest, RepeatedStatementWithoutParameters) {
    auto conn = engine_->acquire();
    auto count = conn->prepare("SELECT COUNT(*) FROM users");

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(count.scalar().asInt(), i);
        conn->status(Query("INSERT INTO users (nickname) VALUES (?)", {"n"}));
    }
}

TEST_F(PreparedStatementTest, QueryParametersAreTheDefault) {
    engine_->executeMany("INSERT INTO users (nickname) VALUES (?)", {{"a"}, {"b"}});
    auto conn = engine_->acquire();

    auto lookup = conn->prepare(Query("SELECT nickname FROM users WHERE id = ?", {1}));

    EXPECT_EQ(lookup.scalar().asString(), "a");
    EXPECT_EQ(lookup.scalar({2}).asString(), "b");
    EXPECT_THROW(lookup.scalar({1, 2}), InterfaceError);
}

TEST_F(PreparedStatementTest, MultipleResultsRaise) {
    engine_->executeMany("INSERT INTO users (nickname) VALUES (?)", {{"a"}, {"b"}});
    auto conn = engine_->acquire();

    auto all = conn->prepare("SELECT nickname FROM users ORDER BY id");

    EXPECT_THROW(all.one(), MultipleResultsError);
    EXPECT_THROW(all.oneOrNone(), MultipleResultsError);
    EXPECT_EQ(all.all().size(), 2u);
}

TEST_F(PreparedStatementTest, LoaderFromQueryOptions) {
    engine_->executeMany("INSERT INTO users (nickname) VALUES (?)", {{"x"}, {"y"}});
    auto conn = engine_->acquire();

    ExecutionOptions options;
    options.model = modelLoader<User>();
    auto users = conn->prepare(Query("SELECT id, nickname FROM users ORDER BY id", {}, options));

    auto loaded = users.allAs<User>();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[1].nickname, "y");
    EXPECT_EQ(users.firstAs<User>()->id, 1);
}

TEST_F(PreparedStatementTest, DriverErrorsPropagate) {
    auto conn = engine_->acquire();

    EXPECT_THROW(conn->prepare("SELECT * FROM missing_table"), SQLiteException);
    EXPECT_THROW(conn->prepare("SELECT 1; SELECT 2"), InterfaceError);
    EXPECT_THROW(conn->prepare("SELECT :missing").scalar(), InterfaceError);

    auto insert = conn->prepare("INSERT INTO users (id, nickname) VALUES (?, ?)");
    insert.status({1, "a"});
    EXPECT_THROW(insert.status({1, "again"}), SQLiteException);

    // The statement stays usable after a failed execution
    insert.status({2, "b"});
    EXPECT_EQ(engine_->scalar("SELECT COUNT(*) FROM users").asInt(), 2);
}

// ============================================================================
// Cursors
// ============================================================================

TEST_F(PreparedStatementTest, IterateInsideTransaction) {
    engine_->executeMany("INSERT INTO users (nickname) VALUES (?)", {{"a"}, {"b"}, {"c"}});
    auto conn = engine_->acquire();
    auto select = conn->prepare("SELECT nickname FROM users WHERE id >= :from ORDER BY id");

    EXPECT_THROW(select.iterate(named("from", 1)), InterfaceError);

    conn->transaction()->run([&](Transaction&) {
        Cursor cursor = select.iterate(named("from", 2));

        // Executions of the same statement while its cursor is open
        EXPECT_EQ(select.all(named("from", 1)).size(), 3u);

        EXPECT_EQ(cursor.next()->at(0).asString(), "b");
        EXPECT_EQ(cursor.next()->at(0).asString(), "c");
        EXPECT_FALSE(cursor.next().has_value());
    });
}

// ============================================================================
// Connection binding
// ============================================================================

TEST_F(PreparedStatementTest, InvalidAfterSoftRelease) {
    auto conn = engine_->acquire();
    auto count = conn->prepare("SELECT COUNT(*) FROM users");
    EXPECT_EQ(count.scalar().asInt(), 0);

    conn->release(false);

    EXPECT_THROW(count.scalar(), InterfaceError);

    // A new physical connection does not revive the statement
    EXPECT_EQ(conn->scalar("SELECT 1").asInt(), 1);
    EXPECT_THROW(count.scalar(), InterfaceError);
    EXPECT_NO_THROW(count.close());
}

TEST_F(PreparedStatementTest, InvalidAfterPermanentRelease) {
    auto conn = engine_->acquire();
    auto count = conn->prepare("SELECT COUNT(*) FROM users");

    conn.release();

    EXPECT_THROW(count.scalar(), InterfaceError);
}

TEST_F(PreparedStatementTest, CloseDropsDriverStatement) {
    auto conn = engine_->acquire();
    auto count = conn->prepare("SELECT COUNT(*) FROM users");
    auto other = conn->prepare("SELECT 1");
    ASSERT_NE(conn->rawConnection(), nullptr);
    EXPECT_EQ(conn->rawConnection()->preparedCount(), 2u);

    count.close();

    EXPECT_TRUE(count.isClosed());
    EXPECT_EQ(conn->rawConnection()->preparedCount(), 1u);
    EXPECT_THROW(count.scalar(), InterfaceError);
    EXPECT_EQ(other.scalar().asInt(), 1);
}

TEST_F(PreparedStatementTest, ReleaseDropsAllDriverStatements) {
    auto conn = engine_->acquire();
    DbConnection* raw = conn->getRawConnection();
    {
        auto count = conn->prepare("SELECT COUNT(*) FROM users");
        auto other = conn->prepare("SELECT 1");
        EXPECT_EQ(raw->preparedCount(), 2u);

        conn->release(false);
    }

    // The same physical connection comes back from the pool, now without statements
    EXPECT_EQ(conn->getRawConnection(), raw);
    EXPECT_EQ(raw->preparedCount(), 0u);
}

TEST_F(PreparedStatementTest, MovedStatementKeepsWorking) {
    auto conn = engine_->acquire();
    auto count = conn->prepare("SELECT COUNT(*) FROM users");

    PreparedStatement moved = std::move(count);

    EXPECT_EQ(moved.scalar().asInt(), 0);
    EXPECT_EQ(conn->rawConnection()->preparedCount(), 1u);
}

TEST_F(PreparedStatementTest, ReusingHandleSharesStatement) {
    auto conn = engine_->acquire();
    AcquireOptions options;
    options.reuse = true;
    auto reused = engine_->acquire(options);

    auto count = reused->prepare("SELECT COUNT(*) FROM users");
    reused.release();

    // Released reusing handle, the root still holds the physical connection
    EXPECT_THROW(count.scalar(), InterfaceError);
    EXPECT_EQ(conn->rawConnection()->preparedCount(), 1u);
}

// ============================================================================
// Drivers without server-side statements
// ============================================================================

TEST(PreparedStatementFallbackTest, ResendsSqlPerExecution) {
    auto server = std::make_shared<FakeServer>();
    auto engine = makeFakeEngine(server);
    auto conn = engine->acquire();

    auto select = conn->prepare("SELECT 5");
    EXPECT_TRUE(server->log().empty());

    EXPECT_EQ(select.scalar().asInt(), 5);
    EXPECT_EQ(select.status().statusTag, "SELECT 1");

    auto log = server->log();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "SELECT 5");
    EXPECT_EQ(log[1], "SELECT 5");
}
