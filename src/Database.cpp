#include "Database.hpp"
#include "Errors.hpp"

namespace sqlctx {

Database::Database(EnginePtr engine)
    : m_bind(std::move(engine)) {}

EnginePtr Database::setBind(EnginePtr engine) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bind = std::move(engine);
    return m_bind;
}

EnginePtr Database::setBind(const Config& config) {
    return setBind(Engine::create(config));
}

EnginePtr Database::setBind(const std::string& url) {
    return setBind(Engine::create(url));
}

EnginePtr Database::popBind() {
    std::lock_guard<std::mutex> lock(m_mutex);
    EnginePtr previous = std::move(m_bind);
    m_bind.reset();
    return previous;
}

bool Database::isBound() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bind != nullptr;
}

EnginePtr Database::bind() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_bind) {
        throw UninitializedError("Database is not bound to an engine");
    }
    return m_bind;
}

ConnectionGuard Database::acquire(const AcquireOptions& options) {
    return bind()->acquire(options);
}

std::vector<Row> Database::all(const Query& query) {
    return bind()->all(query);
}

std::optional<Row> Database::first(const Query& query) {
    return bind()->first(query);
}

Row Database::one(const Query& query) {
    return bind()->one(query);
}

std::optional<Row> Database::oneOrNone(const Query& query) {
    return bind()->oneOrNone(query);
}

Value Database::scalar(const Query& query) {
    return bind()->scalar(query);
}

QueryResult Database::status(const Query& query) {
    return bind()->status(query);
}

void Database::transaction(const Transaction::Body& body, const TransactionOptions& options) {
    bind()->transaction(body, options);
}

Cursor Database::iterate(const Query& query) {
    return bind()->iterate(query);
}

CompiledStatement Database::compile(const Query& query) const {
    return bind()->compile(query);
}

BindScope::BindScope(Database& database, EnginePtr engine)
    : m_database(database),
      m_previous(database.popBind()) {
    m_database.setBind(std::move(engine));
}

BindScope::~BindScope() {
    m_database.setBind(std::move(m_previous));
}

}  // namespace sqlctx
