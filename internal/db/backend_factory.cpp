#include "backend_factory.hpp"

#include <algorithm>
#include <cstdint>

#include "internal/db/api/backend_type.hpp"
#include "internal/db/json/json_backend.hpp"
#include "internal/util/errors.hpp"
#if STATESHIFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_backend.hpp"
#endif
#if STATESHIFT_DB_POSTGRES
#include "internal/db/postgres/pg_backend.hpp"
#endif

namespace stateshift::db {

std::unique_ptr<Backend> CreateBackend(const stateshift::runtime::config::DatabaseConfig& config) {
  switch (ParseBackendType(config.backend())) {
    case BackendType::kJson: {
      json::JsonBackendOptions options;
      options.path              = config.connection_string();
      options.cache_size        = config.cache_size();
      options.auto_save         = config.has_auto_save() ? config.auto_save() : true;
      options.file_backup_count = config.has_file_backup_count() ? config.file_backup_count() : 3;
      return std::make_unique<json::JsonBackend>(std::move(options));
    }

    case BackendType::kSqlite: {
#if STATESHIFT_DB_SQLITE
      sqlite::SqliteBackendOptions options;
      options.path            = config.connection_string();
      options.cache_size      = config.cache_size();
      options.timeout_seconds = static_cast<int>(std::min<std::uint32_t>(config.timeout_seconds(), kMaxTimeoutSeconds));
      return std::make_unique<sqlite::SqliteBackend>(std::move(options));
#else
      throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
    }

    case BackendType::kPostgresql: {
#if STATESHIFT_DB_POSTGRES
      postgres::PgBackendOptions options;
      options.conninfo        = config.connection_string();
      options.pool_size       = config.pool_size();
      options.cache_size      = config.cache_size();
      options.timeout_seconds = static_cast<int>(std::min<std::uint32_t>(config.timeout_seconds(), kMaxTimeoutSeconds));
      return std::make_unique<postgres::PgBackend>(std::move(options));
#else
      throw util::ConfigurationError("postgresql backend requested but not enabled at build time");
#endif
    }
  }

  throw util::ConfigurationError("Unsupported backend: " + config.backend());
}

} // namespace stateshift::db
