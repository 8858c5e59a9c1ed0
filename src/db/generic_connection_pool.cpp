#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for database '{}'",
                i + 1, db_name_));
        }
    }

    utils::log::info(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Pool '{}' exhausted: no connection within {}ms",
            db_name_, timeout.count()));
        return nullptr;
    }

    // Shutdown may have been set while waiting on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    std::unique_ptr<IDbConnection> conn;
    ConnectionTimes times{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            const auto it = times_.find(conn.get());
            if (it != times_.end()) times = it->second;
        }
    }

    const auto now = std::chrono::steady_clock::now();
    // Recycle connections past max_lifetime
    if (conn && config_.max_lifetime.count() > 0 && now - times.created_at > config_.max_lifetime) {
        destroy_connection(std::move(conn));
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
    }

    // Probe connections that sat idle longer than idle_timeout
    if (conn && now - times.last_used > config_.idle_timeout
        && !conn->is_healthy(config_.health_check_query)) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Pool '{}': idle connection failed health check, replacing", db_name_));
        destroy_connection(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            times_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        times_[conn.get()] = ConnectionTimes{now, now};
    }
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        times_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable) {
        connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Pool '{}': discarding connection", db_name_));
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    if (shutdown_.load(std::memory_order_acquire)) {
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on the next acquire
    {
        std::lock_guard lock(mutex_);
        times_[conn.get()].last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlguard
