#pragma once

#include <optional>
#include <string>

namespace sqlctx {

enum class IsolationLevel {
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable
};

// SQL spelling, e.g. "READ COMMITTED"
std::string toString(IsolationLevel level);

// Accepts "READ COMMITTED", "read_committed", "ReadCommitted"...
std::optional<IsolationLevel> parseIsolationLevel(const std::string& name);

// Options of a root transaction, ignored for savepoints
struct TransactionOptions {
    std::optional<IsolationLevel> isolation;
    bool readOnly = false;
    bool deferrable = false;  // PostgreSQL only, needs serializable read only

    bool isDefault() const { return !isolation && !readOnly && !deferrable; }
};

}  // namespace sqlctx
