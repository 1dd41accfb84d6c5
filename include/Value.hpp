#pragma once

/**
 * @file Value.hpp
 * @brief Dynamically typed SQL values, result rows and bind parameters.
 *
 * Every backend converts its native column representation into Value so the
 * connection layer, loaders and tests can work with rows independently of
 * the driver in use.
 */

#include <nlohmann/json.hpp>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sqlctx {

using Blob = std::vector<uint8_t>;

/**
 * @class Value
 * @brief A single SQL value: NULL, integer, real, text or blob.
 *
 * Integral types (including bool) are stored as int64_t and floating point
 * types as double.
 */
class Value {
public:
    enum class Type {
        Null,
        Integer,
        Real,
        Text,
        Blob
    };

    Value() = default;
    Value(std::nullptr_t) {}

    template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    Value(T value) : m_data(static_cast<int64_t>(value)) {}

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T value) : m_data(static_cast<double>(value)) {}

    Value(const char* value) : m_data(std::string(value)) {}
    Value(std::string value) : m_data(std::move(value)) {}
    Value(std::string_view value) : m_data(std::string(value)) {}
    Value(Blob value) : m_data(std::move(value)) {}

    Type type() const { return static_cast<Type>(m_data.index()); }
    bool isNull() const { return type() == Type::Null; }

    /**
     * @brief Integer view of the value.
     * @throws InterfaceError for NULL, blobs and non-numeric text.
     */
    int64_t asInt() const;

    /**
     * @brief Floating point view of the value.
     * @throws InterfaceError for NULL, blobs and non-numeric text.
     */
    double asDouble() const;

    /**
     * @brief Text of a text value, decimal form of numbers.
     * @throws InterfaceError for NULL and blobs.
     */
    std::string asString() const;

    /**
     * @brief Blob content, or the bytes of a text value.
     * @throws InterfaceError for NULL and numbers.
     */
    Blob asBlob() const;

    // Human readable form, "NULL" for null values
    std::string toString() const;

    nlohmann::json toJson() const;

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, int64_t, double, std::string, Blob> m_data;
};

/**
 * @class Row
 * @brief One result row: values plus the column names shared by all rows of
 * the same result.
 */
class Row {
public:
    using Columns = std::shared_ptr<const std::vector<std::string>>;

    Row() = default;
    Row(Columns columns, std::vector<Value> values);

    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    const Value& operator[](size_t index) const { return m_values[index]; }

    // Bounds checked access, throws InterfaceError
    const Value& at(size_t index) const;
    const Value& at(const std::string& column) const;

    bool hasColumn(const std::string& column) const;
    const std::vector<std::string>& columns() const;
    const std::vector<Value>& values() const { return m_values; }

    // Object keyed by column name
    nlohmann::json toJson() const;

    bool operator==(const Row& other) const { return m_values == other.m_values; }

private:
    Columns m_columns;
    std::vector<Value> m_values;
};

/**
 * @struct Params
 * @brief Bind parameters for `?` (positional) and `:name` (named) placeholders.
 */
struct Params {
    std::vector<Value> positional;
    std::map<std::string, Value> named;

    Params() = default;
    Params(std::initializer_list<Value> values) : positional(values) {}
    explicit Params(std::vector<Value> values) : positional(std::move(values)) {}

    static Params fromNamed(std::map<std::string, Value> values);

    bool empty() const { return positional.empty() && named.empty(); }
};

}  // namespace sqlctx
