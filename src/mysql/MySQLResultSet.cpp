/**
 * @file MySQLResultSet.cpp
 * @brief Implementation of RAII MySQL result set wrapper.
 */

#include "MySQLResultSet.hpp"
#include <cstdlib>

namespace sqlctx {

namespace {

// Character set number of the binary collation
constexpr unsigned int kBinaryCharset = 63;

}  // namespace

Value MySQLResultSet::convert(const MYSQL_FIELD& field, const char* data, unsigned long length) {
    if (!data) return Value();

    switch (field.type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            if (field.flags & UNSIGNED_FLAG) {
                return Value(static_cast<int64_t>(std::strtoull(data, nullptr, 10)));
            }
            return Value(static_cast<int64_t>(std::strtoll(data, nullptr, 10)));
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return Value(std::strtod(data, nullptr));
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_BIT:
            if (field.charsetnr == kBinaryCharset) {
                const auto* bytes = reinterpret_cast<const uint8_t*>(data);
                return Value(Blob(bytes, bytes + length));
            }
            return Value(std::string(data, length));
        default:
            return Value(std::string(data, length));
    }
}

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    if (m_res) {
        mysql_free_result(m_res);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

MySQLResultSet::MySQLResultSet(MySQLResultSet&& other) noexcept : m_res(other.m_res) {
    other.m_res = nullptr;
}

MySQLResultSet& MySQLResultSet::operator=(MySQLResultSet&& other) noexcept {
    if (this != &other) {
        // Free current result before taking ownership of new one
        if (m_res) {
            mysql_free_result(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

// ============================================================================
// Row and Field Access
// ============================================================================

MYSQL_ROW MySQLResultSet::fetchRow() {
    return m_res ? mysql_fetch_row(m_res) : nullptr;
}

unsigned int MySQLResultSet::numFields() const {
    return m_res ? mysql_num_fields(m_res) : 0;
}

MYSQL_FIELD* MySQLResultSet::fetchFields() const {
    return m_res ? mysql_fetch_fields(m_res) : nullptr;
}

Row::Columns MySQLResultSet::columns() const {
    auto names = std::make_shared<std::vector<std::string>>();
    if (!m_res) return names;

    unsigned int numFields = mysql_num_fields(m_res);
    MYSQL_FIELD* fields = mysql_fetch_fields(m_res);

    names->reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
        names->emplace_back(fields[i].name);
    }

    return names;
}

Row MySQLResultSet::readRow(MYSQL_ROW row, const Row::Columns& columns) const {
    unsigned int count = numFields();
    MYSQL_FIELD* fields = fetchFields();
    unsigned long* lengths = mysql_fetch_lengths(m_res);

    std::vector<Value> values;
    values.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        values.push_back(convert(fields[i], row[i], lengths ? lengths[i] : 0));
    }
    return Row(columns, std::move(values));
}

}  // namespace sqlctx
