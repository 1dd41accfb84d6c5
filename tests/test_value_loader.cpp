#include <gtest/gtest.h>
#include "Loader.hpp"
#include "Query.hpp"
#include "Value.hpp"

using namespace sqlctx;

namespace {

Row makeRow(std::vector<std::string> names, std::vector<Value> values) {
    auto columns = std::make_shared<const std::vector<std::string>>(std::move(names));
    return Row(columns, std::move(values));
}

struct User {
    int64_t id;
    std::string name;

    static User fromRow(const Row& row) {
        return User{row.at("id").asInt(), row.at("name").asString()};
    }
};

}  // namespace

// ============================================================================
// Value
// ============================================================================

TEST(ValueTest, TypesFromConstructors) {
    EXPECT_EQ(Value().type(), Value::Type::Null);
    EXPECT_EQ(Value(nullptr).type(), Value::Type::Null);
    EXPECT_EQ(Value(42).type(), Value::Type::Integer);
    EXPECT_EQ(Value(true).type(), Value::Type::Integer);
    EXPECT_EQ(Value(uint16_t{7}).type(), Value::Type::Integer);
    EXPECT_EQ(Value(1.5).type(), Value::Type::Real);
    EXPECT_EQ(Value(2.5f).type(), Value::Type::Real);
    EXPECT_EQ(Value("text").type(), Value::Type::Text);
    EXPECT_EQ(Value(std::string("text")).type(), Value::Type::Text);
    EXPECT_EQ(Value(Blob{1, 2}).type(), Value::Type::Blob);
}

TEST(ValueTest, NumericConversions) {
    EXPECT_EQ(Value(42).asInt(), 42);
    EXPECT_DOUBLE_EQ(Value(42).asDouble(), 42.0);
    EXPECT_EQ(Value(3.9).asInt(), 3);
    EXPECT_EQ(Value("123").asInt(), 123);
    EXPECT_DOUBLE_EQ(Value("2.25").asDouble(), 2.25);
    EXPECT_EQ(Value(true).asInt(), 1);
}

TEST(ValueTest, ConversionErrors) {
    EXPECT_THROW(Value().asInt(), InterfaceError);
    EXPECT_THROW(Value("12abc").asInt(), InterfaceError);
    EXPECT_THROW(Value("abc").asDouble(), InterfaceError);
    EXPECT_THROW(Value(Blob{1}).asInt(), InterfaceError);
    EXPECT_THROW(Value().asString(), InterfaceError);
    EXPECT_THROW(Value(Blob{1}).asString(), InterfaceError);
    EXPECT_THROW(Value(5).asBlob(), InterfaceError);
}

TEST(ValueTest, StringForms) {
    EXPECT_EQ(Value(-7).asString(), "-7");
    EXPECT_EQ(Value(1.5).asString(), "1.5");
    EXPECT_EQ(Value("hello").asString(), "hello");
    EXPECT_EQ(Value().toString(), "NULL");
    EXPECT_EQ(Value(Blob{0x00, 0xAB, 0x10}).toString(), "\\x00ab10");
}

TEST(ValueTest, BlobFromText) {
    Blob expected{'a', 'b'};
    EXPECT_EQ(Value("ab").asBlob(), expected);
}

TEST(ValueTest, Equality) {
    EXPECT_EQ(Value(1), Value(int64_t{1}));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_EQ(Value(), Value(nullptr));
}

TEST(ValueTest, ToJson) {
    EXPECT_TRUE(Value().toJson().is_null());
    EXPECT_EQ(Value(5).toJson(), 5);
    EXPECT_EQ(Value("x").toJson(), "x");
    EXPECT_EQ(Value(Blob{0xFF}).toJson(), "\\xff");
}

// ============================================================================
// Row
// ============================================================================

TEST(RowTest, AccessByIndexAndName) {
    Row row = makeRow({"id", "name"}, {Value(1), Value("alice")});

    EXPECT_EQ(row.size(), 2u);
    EXPECT_EQ(row[0].asInt(), 1);
    EXPECT_EQ(row.at(1).asString(), "alice");
    EXPECT_EQ(row.at("name").asString(), "alice");
    EXPECT_TRUE(row.hasColumn("id"));
    EXPECT_FALSE(row.hasColumn("email"));
}

TEST(RowTest, OutOfRangeAccess) {
    Row row = makeRow({"id"}, {Value(1)});

    EXPECT_THROW(row.at(1), InterfaceError);
    EXPECT_THROW(row.at("missing"), InterfaceError);
}

TEST(RowTest, RowWithoutColumns) {
    Row row;

    EXPECT_TRUE(row.empty());
    EXPECT_TRUE(row.columns().empty());
}

TEST(RowTest, ToJson) {
    Row row = makeRow({"id", "name", "note"}, {Value(3), Value("bob"), Value()});

    nlohmann::json expected = {{"id", 3}, {"name", "bob"}, {"note", nullptr}};
    EXPECT_EQ(row.toJson(), expected);
}

TEST(ParamsTest, PositionalAndNamed) {
    Params positional{1, "two"};
    EXPECT_EQ(positional.positional.size(), 2u);
    EXPECT_FALSE(positional.empty());

    Params named = Params::fromNamed({{"id", Value(5)}});
    EXPECT_TRUE(named.positional.empty());
    EXPECT_EQ(named.named.at("id").asInt(), 5);

    EXPECT_TRUE(Params().empty());
}

// ============================================================================
// Loaders
// ============================================================================

TEST(LoaderTest, ColumnLoader) {
    Row row = makeRow({"id", "name"}, {Value(9), Value("carol")});

    EXPECT_EQ(loadAs<Value>(row, std::make_shared<ColumnLoader>("name")).asString(), "carol");
    EXPECT_EQ(loadAs<Value>(row, std::make_shared<ColumnLoader>(size_t{0})).asInt(), 9);
    EXPECT_THROW(loadAs<Value>(row, std::make_shared<ColumnLoader>("missing")), InterfaceError);
}

TEST(LoaderTest, CallableLoader) {
    Row row = makeRow({"a", "b"}, {Value(2), Value(3)});
    auto loader = std::make_shared<CallableLoader>([](const Row& r) -> std::any {
        return r[0].asInt() * r[1].asInt();
    });

    EXPECT_EQ(loadAs<int64_t>(row, loader), 6);
    EXPECT_THROW(CallableLoader(nullptr), InterfaceError);
}

TEST(LoaderTest, TupleLoader) {
    Row row = makeRow({"id", "name"}, {Value(1), Value("dave")});
    auto loader = std::make_shared<TupleLoader>(std::vector<LoaderPtr>{
        std::make_shared<ColumnLoader>("name"),
        std::make_shared<ValueLoader>(std::string("literal")),
        nullptr
    });

    auto parts = loadAs<std::vector<std::any>>(row, loader);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(std::any_cast<Value>(parts[0]).asString(), "dave");
    EXPECT_EQ(std::any_cast<std::string>(parts[1]), "literal");
    EXPECT_EQ(std::any_cast<Row>(parts[2]), row);
}

TEST(LoaderTest, ModelLoader) {
    Row row = makeRow({"id", "name"}, {Value(4), Value("erin")});

    User user = loadAs<User>(row, modelLoader<User>());
    EXPECT_EQ(user.id, 4);
    EXPECT_EQ(user.name, "erin");
}

TEST(LoaderTest, LoadAsWithoutLoader) {
    Row row = makeRow({"id"}, {Value(1)});

    EXPECT_EQ(loadAs<Row>(row, nullptr), row);
    EXPECT_THROW(loadAs<User>(row, nullptr), InterfaceError);
}

TEST(LoaderTest, LoadAsWrongType) {
    Row row = makeRow({"id"}, {Value(1)});

    EXPECT_THROW(loadAs<std::string>(row, std::make_shared<ColumnLoader>("id")), InterfaceError);
}

// ============================================================================
// Execution options
// ============================================================================

TEST(ExecutionOptionsTest, ResolveLoaderPrecedence) {
    auto model = modelLoader<User>();
    auto loader = std::make_shared<ColumnLoader>("id");

    ExecutionOptions options;
    EXPECT_EQ(resolveLoader(options), nullptr);

    options.model = model;
    EXPECT_EQ(resolveLoader(options), model);

    options.loader = loader;
    EXPECT_EQ(resolveLoader(options), loader);

    options.returnModel = false;
    EXPECT_EQ(resolveLoader(options), nullptr);
}

TEST(ExecutionOptionsTest, MergeOverridesSetFieldsOnly) {
    ExecutionOptions base;
    base.timeout = std::chrono::milliseconds(100);
    base.model = modelLoader<User>();
    base.isolationLevel = IsolationLevel::ReadCommitted;

    ExecutionOptions overrides;
    overrides.returnModel = false;
    overrides.isolationLevel = IsolationLevel::Serializable;

    ExecutionOptions merged = base.mergedWith(overrides);
    EXPECT_EQ(merged.timeout, std::chrono::milliseconds(100));
    EXPECT_EQ(merged.model, base.model);
    EXPECT_EQ(merged.returnModel, false);
    EXPECT_EQ(merged.isolationLevel, IsolationLevel::Serializable);
}

TEST(QueryTest, BuildersReturnCopies) {
    Query base("SELECT ?", {1});
    ExecutionOptions options;
    options.timeout = std::chrono::milliseconds(50);

    Query rebound = base.withParams({2});
    Query timed = base.executionOptions(options);

    EXPECT_EQ(base.params().positional[0].asInt(), 1);
    EXPECT_EQ(rebound.params().positional[0].asInt(), 2);
    EXPECT_EQ(rebound.sql(), "SELECT ?");
    EXPECT_FALSE(base.options().timeout.has_value());
    EXPECT_EQ(timed.options().timeout, std::chrono::milliseconds(50));
}
