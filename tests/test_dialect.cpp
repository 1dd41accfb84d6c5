#include <gtest/gtest.h>
#include "Dialect.hpp"
#include "DbConnection.hpp"
#include "Errors.hpp"
#include "SQLiteDialect.hpp"
#ifdef SQLCTX_HAVE_POSTGRESQL
#include "PostgreSQLDialect.hpp"
#endif
#ifdef SQLCTX_HAVE_MYSQL
#include "MySQLDialect.hpp"
#endif

using namespace sqlctx;

namespace {

// Dollar-numbered placeholders without pulling in a driver
class NumericDialect : public Dialect {
public:
    std::string name() const override { return "numeric"; }
    ParamStyle paramStyle() const override { return ParamStyle::Numeric; }

    std::unique_ptr<DbConnection> connect(const ConnectionConfig&) const override {
        throw InterfaceError("not connectable");
    }
};

}  // namespace

class DialectTest : public ::testing::Test {
protected:
    SQLiteDialect qmark_;
    NumericDialect numeric_;
};

// ============================================================================
// Placeholder compilation
// ============================================================================

TEST_F(DialectTest, PositionalPlaceholders) {
    auto compiled = qmark_.compile(Query("SELECT * FROM t WHERE a = ? AND b = ?", {1, "x"}));

    EXPECT_EQ(compiled.sql, "SELECT * FROM t WHERE a = ? AND b = ?");
    ASSERT_EQ(compiled.params.size(), 2u);
    EXPECT_EQ(compiled.params[0], Value(1));
    EXPECT_EQ(compiled.params[1], Value("x"));
}

TEST_F(DialectTest, NamedPlaceholders) {
    Query query("UPDATE t SET name = :name WHERE id = :id OR parent = :id",
                Params::fromNamed({{"id", Value(7)}, {"name", Value("n")}}));

    auto compiled = qmark_.compile(query);
    EXPECT_EQ(compiled.sql, "UPDATE t SET name = ? WHERE id = ? OR parent = ?");
    ASSERT_EQ(compiled.params.size(), 3u);
    EXPECT_EQ(compiled.params[0], Value("n"));
    EXPECT_EQ(compiled.params[1], Value(7));
    EXPECT_EQ(compiled.params[2], Value(7));
}

TEST_F(DialectTest, NumericStyle) {
    Params params{10};
    params.named["tag"] = Value("red");
    auto compiled = numeric_.compile(Query("SELECT ? WHERE tag = :tag", params));

    EXPECT_EQ(compiled.sql, "SELECT $1 WHERE tag = $2");
    ASSERT_EQ(compiled.params.size(), 2u);
    EXPECT_EQ(compiled.params[1], Value("red"));
}

TEST_F(DialectTest, PlaceholdersInQuotesAndCommentsAreKept) {
    const std::string sql =
        "SELECT '?', 'it''s :x', \"col?\", `b:q` -- what?\n"
        "/* :name ? */ FROM t WHERE a = ?";

    auto compiled = numeric_.compile(Query(sql, {5}));

    EXPECT_EQ(compiled.sql,
              "SELECT '?', 'it''s :x', \"col?\", `b:q` -- what?\n"
              "/* :name ? */ FROM t WHERE a = $1");
    ASSERT_EQ(compiled.params.size(), 1u);
    EXPECT_EQ(compiled.params[0], Value(5));
}

TEST_F(DialectTest, CastsAndTimeLiteralsAreNotParameters) {
    auto compiled = qmark_.compile(Query("SELECT x::int, '12:30', a:b FROM t"));

    EXPECT_EQ(compiled.sql, "SELECT x::int, '12:30', a:b FROM t");
    EXPECT_TRUE(compiled.params.empty());
}

TEST_F(DialectTest, UnterminatedQuoteIsCopied) {
    auto compiled = qmark_.compile(Query("SELECT 'open ?"));

    EXPECT_EQ(compiled.sql, "SELECT 'open ?");
    EXPECT_TRUE(compiled.params.empty());
}

TEST_F(DialectTest, TooFewPositionalParameters) {
    EXPECT_THROW(qmark_.compile(Query("SELECT ?, ?", {1})), InterfaceError);
}

TEST_F(DialectTest, TooManyPositionalParameters) {
    EXPECT_THROW(qmark_.compile(Query("SELECT ?", {1, 2})), InterfaceError);
}

TEST_F(DialectTest, MissingNamedParameter) {
    EXPECT_THROW(qmark_.compile(Query("SELECT :missing")), InterfaceError);
}

TEST_F(DialectTest, ParseKeepsSlotsUnbound) {
    auto layout = numeric_.parse("SELECT :a, ?, :a");

    EXPECT_EQ(layout.sql, "SELECT $1, $2, $3");
    EXPECT_EQ(layout.slots, (std::vector<std::string>{"a", "", "a"}));
    EXPECT_EQ(layout.positionalCount, 1u);

    Params params{9};
    params.named["a"] = Value("x");
    auto values = layout.bind(params);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], Value("x"));
    EXPECT_EQ(values[1], Value(9));
    EXPECT_EQ(values[2], Value("x"));

    EXPECT_THROW(layout.bind(Params{1, 2}), InterfaceError);
    EXPECT_THROW(layout.bind(Params{1}), InterfaceError);
}

TEST_F(DialectTest, BackslashIsLiteralInStandardStrings) {
    // 'a\' ends at the second quote, so the ? after it is a placeholder
    auto compiled = qmark_.compile(Query("SELECT 'a\\', ?", {1}));

    EXPECT_EQ(compiled.sql, "SELECT 'a\\', ?");
    ASSERT_EQ(compiled.params.size(), 1u);
}

TEST_F(DialectTest, HashIsNotACommentByDefault) {
    auto compiled = qmark_.compile(Query("SELECT 1 # ?", {2}));

    EXPECT_EQ(compiled.params.size(), 1u);
}

// ============================================================================
// Transaction statements
// ============================================================================

TEST_F(DialectTest, SavepointStatements) {
    EXPECT_EQ(qmark_.savepointStatement("sp_1"), "SAVEPOINT sp_1");
    EXPECT_EQ(qmark_.releaseSavepointStatement("sp_1"), "RELEASE SAVEPOINT sp_1");
    EXPECT_EQ(qmark_.rollbackToSavepointStatement("sp_1"), "ROLLBACK TO SAVEPOINT sp_1");
    EXPECT_EQ(qmark_.commitStatement(), "COMMIT");
    EXPECT_EQ(qmark_.rollbackStatement(), "ROLLBACK");
}

TEST_F(DialectTest, SQLiteBegin) {
    TransactionOptions options;
    EXPECT_EQ(qmark_.beginStatements(options), std::vector<std::string>{"BEGIN"});

    options.isolation = IsolationLevel::ReadCommitted;
    EXPECT_EQ(qmark_.beginStatements(options), std::vector<std::string>{"BEGIN"});

    options.isolation = IsolationLevel::Serializable;
    EXPECT_EQ(qmark_.beginStatements(options), std::vector<std::string>{"BEGIN IMMEDIATE"});
}

#ifdef SQLCTX_HAVE_POSTGRESQL
TEST_F(DialectTest, PostgreSQLDollarQuotedBodies) {
    PostgreSQLDialect dialect;
    const std::string sql =
        "CREATE FUNCTION f(x int) RETURNS text AS $$ SELECT 'why?' || :x $$ LANGUAGE sql; "
        "SELECT $body$ it's ? $body$, $1x, ?";

    auto compiled = dialect.compile(Query(sql, {3}));

    EXPECT_EQ(compiled.sql,
              "CREATE FUNCTION f(x int) RETURNS text AS $$ SELECT 'why?' || :x $$ LANGUAGE sql; "
              "SELECT $body$ it's ? $body$, $1x, $1");
    ASSERT_EQ(compiled.params.size(), 1u);
    EXPECT_EQ(compiled.params[0], Value(3));
}

TEST_F(DialectTest, PostgreSQLEscapeStrings) {
    PostgreSQLDialect dialect;

    auto compiled = dialect.compile(Query("SELECT E'it\\'s :name ?', :name, name'x'",
                                          Params::fromNamed({{"name", Value("n")}})));

    EXPECT_EQ(compiled.sql, "SELECT E'it\\'s :name ?', $1, name'x'");
    ASSERT_EQ(compiled.params.size(), 1u);
}

TEST_F(DialectTest, PostgreSQLUnterminatedDollarQuoteIsCopied) {
    PostgreSQLDialect dialect;

    auto compiled = dialect.compile(Query("SELECT $tag$ ?"));

    EXPECT_EQ(compiled.sql, "SELECT $tag$ ?");
    EXPECT_TRUE(compiled.params.empty());
}

TEST_F(DialectTest, PostgreSQLBegin) {
    PostgreSQLDialect dialect;
    EXPECT_EQ(dialect.paramStyle(), ParamStyle::Numeric);

    TransactionOptions options;
    EXPECT_EQ(dialect.beginStatements(options), std::vector<std::string>{"BEGIN"});

    options.isolation = IsolationLevel::Serializable;
    options.readOnly = true;
    options.deferrable = true;
    EXPECT_EQ(dialect.beginStatements(options),
              std::vector<std::string>{"BEGIN ISOLATION LEVEL SERIALIZABLE READ ONLY DEFERRABLE"});
}
#endif

#ifdef SQLCTX_HAVE_MYSQL
TEST_F(DialectTest, MySQLBackslashEscapedQuotes) {
    MySQLDialect dialect;

    auto compiled = dialect.compile(Query("SELECT 'it\\'s ?'"));
    EXPECT_EQ(compiled.sql, "SELECT 'it\\'s ?'");
    EXPECT_TRUE(compiled.params.empty());

    compiled = dialect.compile(Query("SELECT 'O\\'Reilly :name', \"a\\\"?\", :name",
                                     Params::fromNamed({{"name", Value("n")}})));
    EXPECT_EQ(compiled.sql, "SELECT 'O\\'Reilly :name', \"a\\\"?\", ?");
    ASSERT_EQ(compiled.params.size(), 1u);
    EXPECT_EQ(compiled.params[0], Value("n"));
}

TEST_F(DialectTest, MySQLHashComments) {
    MySQLDialect dialect;

    auto compiled = dialect.compile(Query("SELECT 1 # why?\nFROM t WHERE a = ?", {4}));

    EXPECT_EQ(compiled.sql, "SELECT 1 # why?\nFROM t WHERE a = ?");
    ASSERT_EQ(compiled.params.size(), 1u);
    EXPECT_TRUE(dialect.compile(Query("SELECT 1 # why?")).params.empty());
}

TEST_F(DialectTest, MySQLBegin) {
    MySQLDialect dialect;
    EXPECT_EQ(dialect.paramStyle(), ParamStyle::Qmark);

    TransactionOptions options;
    EXPECT_EQ(dialect.beginStatements(options), std::vector<std::string>{"START TRANSACTION"});

    options.isolation = IsolationLevel::RepeatableRead;
    options.readOnly = true;
    std::vector<std::string> expected{"SET TRANSACTION ISOLATION LEVEL REPEATABLE READ",
                                      "START TRANSACTION READ ONLY"};
    EXPECT_EQ(dialect.beginStatements(options), expected);
}
#endif

// ============================================================================
// Isolation levels and registry
// ============================================================================

TEST(IsolationLevelTest, ParseSpellings) {
    EXPECT_EQ(parseIsolationLevel("READ COMMITTED"), IsolationLevel::ReadCommitted);
    EXPECT_EQ(parseIsolationLevel("read_uncommitted"), IsolationLevel::ReadUncommitted);
    EXPECT_EQ(parseIsolationLevel("RepeatableRead"), IsolationLevel::RepeatableRead);
    EXPECT_EQ(parseIsolationLevel("serializable"), IsolationLevel::Serializable);
    EXPECT_FALSE(parseIsolationLevel("snapshot").has_value());
}

TEST(IsolationLevelTest, SqlSpelling) {
    EXPECT_EQ(toString(IsolationLevel::RepeatableRead), "REPEATABLE READ");
    EXPECT_EQ(toString(IsolationLevel::ReadUncommitted), "READ UNCOMMITTED");
}

TEST(CreateDialectTest, KnownNames) {
    EXPECT_EQ(createDialect("sqlite")->name(), "sqlite");
    EXPECT_EQ(createDialect("SQLite3")->name(), "sqlite");
#ifdef SQLCTX_HAVE_POSTGRESQL
    EXPECT_EQ(createDialect("postgres")->name(), "postgresql");
#else
    EXPECT_THROW(createDialect("postgres"), InterfaceError);
#endif
#ifdef SQLCTX_HAVE_MYSQL
    EXPECT_EQ(createDialect("mariadb")->name(), "mysql");
#else
    EXPECT_THROW(createDialect("mariadb"), InterfaceError);
#endif
}

TEST(CreateDialectTest, UnknownName) {
    EXPECT_THROW(createDialect("oracle"), InterfaceError);
}
