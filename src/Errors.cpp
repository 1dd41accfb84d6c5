#include "Errors.hpp"

#include <utility>

namespace sqlctx {

Error::Error(const std::string& message)
    : std::runtime_error(message) {
}

UninitializedError::UninitializedError(const std::string& message)
    : Error(message) {
}

InterfaceError::InterfaceError(const std::string& message)
    : Error(message) {
}

PoolClosedError::PoolClosedError(const std::string& message)
    : InterfaceError(message) {
}

NoResultError::NoResultError(const std::string& message)
    : Error(message) {
}

MultipleResultsError::MultipleResultsError(const std::string& message)
    : Error(message) {
}

TimeoutError::TimeoutError(const std::string& message)
    : Error(message) {
}

CancelledError::CancelledError(const std::string& message)
    : Error(message) {
}

DriverError::DriverError(int code, const std::string& message, std::string sqlState)
    : std::runtime_error(message)
    , m_errorCode(code)
    , m_sqlState(std::move(sqlState)) {
}

}  // namespace sqlctx
