#include "riskdesk/data/connection_pool.hpp"
#include <algorithm>
#include "riskdesk/core/logger.hpp"

namespace riskdesk {

ConnectionPool::ConnectionPool(std::string connection_string, size_t pool_size,
                               size_t max_pool_size)
    : connection_string_(std::move(connection_string)),
      pool_size_(pool_size),
      max_pool_size_(std::max(pool_size, max_pool_size)) {}

std::shared_ptr<pqxx::connection> ConnectionPool::open_connection_unsafe() {
    try {
        auto connection = std::make_shared<pqxx::connection>(connection_string_);
        if (!connection->is_open()) {
            ERROR("Opened database connection is not usable");
            return nullptr;
        }
        total_connections_++;
        DEBUG("Opened database connection, total " << total_connections_);
        return connection;
    } catch (const std::exception& e) {
        ERROR("Failed to open database connection: " << e.what());
        return nullptr;
    }
}

Result<void> ConnectionPool::initialize() {
    Logger::register_component("ConnectionPool");
    std::lock_guard<std::mutex> lock(mutex_);

    if (total_connections_ > 0) {
        WARN("Connection pool already initialized");
        return Result<void>();
    }

    for (size_t i = 0; i < pool_size_; ++i) {
        auto connection = open_connection_unsafe();
        if (connection) {
            available_.push_back(std::move(connection));
        }
    }

    if (available_.empty()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Could not open any database connection", "ConnectionPool");
    }

    INFO("Connection pool initialized with " << available_.size() << " connections");
    return Result<void>();
}

ConnectionPool::ConnectionGuard ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (available_.empty() && total_connections_ < max_pool_size_) {
        auto connection = open_connection_unsafe();
        if (connection) {
            return ConnectionGuard(std::move(connection), this);
        }
    }

    if (!cv_.wait_for(lock, timeout, [this]() { return !available_.empty(); })) {
        WARN("Timed out waiting " << timeout.count() << "ms for a database connection");
        return ConnectionGuard(nullptr, this);
    }

    auto connection = std::move(available_.front());
    available_.pop_front();

    if (!connection->is_open()) {
        INFO("Replacing closed database connection");
        total_connections_--;
        connection = open_connection_unsafe();
    }
    return ConnectionGuard(std::move(connection), this);
}

void ConnectionPool::return_connection(std::shared_ptr<pqxx::connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!connection->is_open()) {
        // Dropped here, acquire() opens a replacement on demand
        total_connections_--;
        WARN("Discarding closed database connection");
        return;
    }

    available_.push_back(std::move(connection));
    cv_.notify_one();
}

}  // namespace riskdesk
