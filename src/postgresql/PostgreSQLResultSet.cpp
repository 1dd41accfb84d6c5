#include "PostgreSQLResultSet.hpp"
#include <cstdlib>
#include <cstring>

namespace sqlctx {

namespace {

// Type Oids from pg_type.h, which is not part of the client headers
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kOidOid = 26;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res) {
    other.m_res = nullptr;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            PQclear(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType status = PQresultStatus(m_res);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

ExecStatusType PostgreSQLResultSet::status() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

const char* PostgreSQLResultSet::errorMessage() const {
    return m_res ? PQresultErrorMessage(m_res) : "No result";
}

std::string PostgreSQLResultSet::sqlState() const {
    if (!m_res) return "";
    const char* state = PQresultErrorField(m_res, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

std::string PostgreSQLResultSet::commandStatus() const {
    if (!m_res) return "";
    const char* tag = PQcmdStatus(m_res);
    return tag ? tag : "";
}

uint64_t PostgreSQLResultSet::affectedRows() const {
    if (!m_res) return 0;
    const char* affected = PQcmdTuples(m_res);
    if (!affected || !*affected) return 0;
    return std::strtoull(affected, nullptr, 10);
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

bool PostgreSQLResultSet::isNull(int row, int col) const {
    if (!m_res) return true;
    if (row < 0 || row >= numRows()) return true;
    if (col < 0 || col >= numFields()) return true;
    return PQgetisnull(m_res, row, col) != 0;
}

Value PostgreSQLResultSet::value(int row, int col) const {
    if (isNull(row, col)) return Value();

    const char* text = PQgetvalue(m_res, row, col);
    int length = PQgetlength(m_res, row, col);

    switch (fieldType(col)) {
        case kBoolOid:
            return Value(text[0] == 't');
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
        case kOidOid:
            return Value(static_cast<int64_t>(std::strtoll(text, nullptr, 10)));
        case kFloat4Oid:
        case kFloat8Oid:
            return Value(std::strtod(text, nullptr));
        case kByteaOid: {
            size_t size = 0;
            unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &size);
            if (!bytes) return Value(std::string(text, length));
            Blob blob(bytes, bytes + size);
            PQfreemem(bytes);
            return Value(std::move(blob));
        }
        default:
            return Value(std::string(text, length));
    }
}

Row PostgreSQLResultSet::readRow(int row, const Row::Columns& columns) const {
    std::vector<Value> values;
    int count = numFields();
    values.reserve(count);
    for (int col = 0; col < count; ++col) {
        values.push_back(value(row, col));
    }
    return Row(columns, std::move(values));
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return InvalidOid;
    return PQftype(m_res, col);
}

Row::Columns PostgreSQLResultSet::columns() const {
    auto names = std::make_shared<std::vector<std::string>>();
    if (!m_res) return names;

    int nFields = PQnfields(m_res);
    names->reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        const char* name = PQfname(m_res, i);
        names->emplace_back(name ? name : "");
    }

    return names;
}

void PostgreSQLResultSet::reset(PGresult* res) {
    if (m_res) {
        PQclear(m_res);
    }
    m_res = res;
}

}  // namespace sqlctx
