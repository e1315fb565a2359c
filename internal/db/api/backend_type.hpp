#pragma once

#include <string>
#include <string_view>

namespace stateshift::db {

enum class BackendType {
  kJson,
  kSqlite,
  kPostgresql,
};

// "json" | "sqlite" | "postgresql" (case-insensitive). Throws util::ConfigurationError.
BackendType ParseBackendType(std::string_view name);

std::string ToString(BackendType type);

// Upper bound for backend timeouts; keeps the millisecond value within int.
constexpr int kMaxTimeoutSeconds = 86400;

// Seconds clamped to [0, kMaxTimeoutSeconds], in milliseconds.
int TimeoutMillis(int timeout_seconds);

} // namespace stateshift::db
