#include "db/backend_registry.hpp"
#include "db/postgresql/pg_backend.hpp"
#include "db/sqlite/sqlite_backend.hpp"

namespace sqlguard {

void register_builtin_backends() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto& registry = BackendRegistry::instance();
        registry.register_backend(DatabaseType::POSTGRESQL,
            [] { return std::make_unique<PgBackend>(); });
        registry.register_backend(DatabaseType::SQLITE,
            [] { return std::make_unique<SqliteBackend>(); });
    });
}

} // namespace sqlguard
