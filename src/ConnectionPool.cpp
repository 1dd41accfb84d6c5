#include "ConnectionPool.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlctx {

nlohmann::json PoolStatus::toJson() const {
    return {
        {"size", size},
        {"overflow", overflow},
        {"checked_in", checkedIn},
        {"checked_out", checkedOut},
        {"waiting", waiting},
        {"timeout_ms", timeout.count()}
    };
}

bool ConnectionPool::healthCheck() {
    try {
        auto conn = acquire(Clock::now() + std::chrono::milliseconds(1000));
        bool healthy = conn && conn->ping();
        release(std::move(conn));
        return healthy;
    } catch (const std::exception& e) {
        spdlog::debug("Pool health check failed: {}", e.what());
        return false;
    }
}

}  // namespace sqlctx
