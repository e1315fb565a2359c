#include "internal/db/api/backend_type.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace stateshift::db {

BackendType ParseBackendType(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "json") return BackendType::kJson;
  if (lowered == "sqlite") return BackendType::kSqlite;
  if (lowered == "postgresql") return BackendType::kPostgresql;

  throw util::ConfigurationError("Unsupported backend: " + std::string(name));
}

std::string ToString(BackendType type) {
  switch (type) {
    case BackendType::kJson:
      return "json";
    case BackendType::kSqlite:
      return "sqlite";
    case BackendType::kPostgresql:
      return "postgresql";
  }
  return "unknown";
}

int TimeoutMillis(int timeout_seconds) {
  return std::clamp(timeout_seconds, 0, kMaxTimeoutSeconds) * 1000;
}

} // namespace stateshift::db
