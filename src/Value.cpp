#include "Value.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace sqlctx {

namespace {

const char* typeName(Value::Type type) {
    switch (type) {
        case Value::Type::Null: return "NULL";
        case Value::Type::Integer: return "integer";
        case Value::Type::Real: return "real";
        case Value::Type::Text: return "text";
        case Value::Type::Blob: return "blob";
    }
    return "unknown";
}

}  // namespace

// ============================================================================
// Value Conversions
// ============================================================================

int64_t Value::asInt() const {
    switch (type()) {
        case Type::Integer:
            return std::get<int64_t>(m_data);
        case Type::Real:
            return static_cast<int64_t>(std::get<double>(m_data));
        case Type::Text: {
            const auto& text = std::get<std::string>(m_data);
            try {
                size_t used = 0;
                int64_t result = std::stoll(text, &used);
                if (used == text.size()) return result;
            } catch (const std::logic_error&) {
                // fall through to the error below
            }
            throw InterfaceError("Cannot convert text '" + text + "' to integer");
        }
        default:
            throw InterfaceError(std::string("Cannot convert ") + typeName(type()) + " to integer");
    }
}

double Value::asDouble() const {
    switch (type()) {
        case Type::Integer:
            return static_cast<double>(std::get<int64_t>(m_data));
        case Type::Real:
            return std::get<double>(m_data);
        case Type::Text: {
            const auto& text = std::get<std::string>(m_data);
            try {
                size_t used = 0;
                double result = std::stod(text, &used);
                if (used == text.size()) return result;
            } catch (const std::logic_error&) {
                // fall through to the error below
            }
            throw InterfaceError("Cannot convert text '" + text + "' to real");
        }
        default:
            throw InterfaceError(std::string("Cannot convert ") + typeName(type()) + " to real");
    }
}

std::string Value::asString() const {
    switch (type()) {
        case Type::Integer:
            return std::to_string(std::get<int64_t>(m_data));
        case Type::Real:
            return nlohmann::json(std::get<double>(m_data)).dump();
        case Type::Text:
            return std::get<std::string>(m_data);
        default:
            throw InterfaceError(std::string("Cannot convert ") + typeName(type()) + " to text");
    }
}

Blob Value::asBlob() const {
    switch (type()) {
        case Type::Blob:
            return std::get<Blob>(m_data);
        case Type::Text: {
            const auto& text = std::get<std::string>(m_data);
            return Blob(text.begin(), text.end());
        }
        default:
            throw InterfaceError(std::string("Cannot convert ") + typeName(type()) + " to blob");
    }
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Null:
            return "NULL";
        case Type::Blob: {
            static const char* hex = "0123456789abcdef";
            const auto& blob = std::get<Blob>(m_data);
            std::string out = "\\x";
            out.reserve(2 + blob.size() * 2);
            for (uint8_t byte : blob) {
                out += hex[byte >> 4];
                out += hex[byte & 0x0F];
            }
            return out;
        }
        default:
            return asString();
    }
}

nlohmann::json Value::toJson() const {
    switch (type()) {
        case Type::Null:
            return nullptr;
        case Type::Integer:
            return std::get<int64_t>(m_data);
        case Type::Real:
            return std::get<double>(m_data);
        case Type::Text:
            return std::get<std::string>(m_data);
        case Type::Blob:
            return toString();
    }
    return nullptr;
}

// ============================================================================
// Row
// ============================================================================

Row::Row(Columns columns, std::vector<Value> values)
    : m_columns(std::move(columns)), m_values(std::move(values)) {
}

const Value& Row::at(size_t index) const {
    if (index >= m_values.size()) {
        throw InterfaceError("Column index " + std::to_string(index) +
                             " out of range (row has " + std::to_string(m_values.size()) + " columns)");
    }
    return m_values[index];
}

const Value& Row::at(const std::string& column) const {
    const auto& names = columns();
    auto it = std::find(names.begin(), names.end(), column);
    if (it == names.end()) {
        throw InterfaceError("No such column: " + column);
    }
    return at(static_cast<size_t>(it - names.begin()));
}

bool Row::hasColumn(const std::string& column) const {
    const auto& names = columns();
    return std::find(names.begin(), names.end(), column) != names.end();
}

const std::vector<std::string>& Row::columns() const {
    static const std::vector<std::string> empty;
    return m_columns ? *m_columns : empty;
}

nlohmann::json Row::toJson() const {
    nlohmann::json obj = nlohmann::json::object();
    const auto& names = columns();
    for (size_t i = 0; i < m_values.size(); ++i) {
        std::string key = i < names.size() ? names[i] : std::to_string(i);
        obj[key] = m_values[i].toJson();
    }
    return obj;
}

// ============================================================================
// Params
// ============================================================================

Params Params::fromNamed(std::map<std::string, Value> values) {
    Params params;
    params.named = std::move(values);
    return params;
}

}  // namespace sqlctx
