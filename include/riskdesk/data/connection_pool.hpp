// include/riskdesk/data/connection_pool.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "riskdesk/core/error.hpp"

namespace riskdesk {

/**
 * @brief Pool of PostgreSQL connections shared by store operations
 */
class ConnectionPool {
public:
    /**
     * @param connection_string libpq connection string
     * @param pool_size Connections opened up front
     * @param max_pool_size Upper bound including emergency connections
     */
    ConnectionPool(std::string connection_string, size_t pool_size = 4, size_t max_pool_size = 8);
    ~ConnectionPool() = default;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Open the initial connections
     * @return CONNECTION_ERROR if not a single connection could be opened
     */
    Result<void> initialize();

    /**
     * @brief Returns its connection to the pool on destruction
     */
    class ConnectionGuard {
    public:
        ConnectionGuard(std::shared_ptr<pqxx::connection> connection, ConnectionPool* pool)
            : connection_(std::move(connection)), pool_(pool) {}

        ~ConnectionGuard() {
            if (connection_ && pool_) {
                pool_->return_connection(std::move(connection_));
            }
        }

        pqxx::connection& operator*() const {
            return *connection_;
        }

        pqxx::connection* get() const {
            return connection_.get();
        }

        explicit operator bool() const {
            return connection_ != nullptr;
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : connection_(std::move(other.connection_)), pool_(other.pool_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                if (connection_ && pool_) {
                    pool_->return_connection(std::move(connection_));
                }
                connection_ = std::move(other.connection_);
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

    private:
        std::shared_ptr<pqxx::connection> connection_;
        ConnectionPool* pool_;
    };

    /**
     * @brief Borrow a connection, waiting up to timeout for one to free up
     * @return Guard holding a connection, empty when none could be obtained
     */
    ConnectionGuard acquire(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    size_t available_connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_.size();
    }

    size_t total_connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_connections_;
    }

private:
    void return_connection(std::shared_ptr<pqxx::connection> connection);

    // Caller holds mutex_
    std::shared_ptr<pqxx::connection> open_connection_unsafe();

    std::string connection_string_;
    size_t pool_size_;
    size_t max_pool_size_;
    size_t total_connections_{0};
    std::deque<std::shared_ptr<pqxx::connection>> available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace riskdesk
