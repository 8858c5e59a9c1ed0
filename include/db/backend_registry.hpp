#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <format>
#include <functional>
#include <stdexcept>

namespace sqlguard {

/**
 * @brief Registry for database backends
 *
 * Backends are registered once at startup (register_builtin_backends()).
 * The registry is queried by DatabaseType to instantiate the right backend.
 *
 * Usage:
 *   BackendRegistry::instance().register_backend(
 *       DatabaseType::SQLITE, []{ return std::make_unique<SqliteBackend>(); });
 *   auto backend = BackendRegistry::instance().create(DatabaseType::SQLITE);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::format("No backend registered for database type: {}", database_type_to_string(type)));
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.contains(type);
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register the PostgreSQL and SQLite backends (idempotent)
 *
 * Called explicitly rather than from static initializers: objects in a static
 * library that nothing references are dropped by the linker.
 */
void register_builtin_backends();

} // namespace sqlguard
