#include "internal/db/api/backend.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace stateshift::db {

std::map<std::string, std::optional<Document>> Backend::BatchGet(const std::vector<std::string>& keys) {
  std::map<std::string, std::optional<Document>> result;
  for (const auto& key : keys) {
    result[key] = Get(key);
  }
  return result;
}

void Backend::BatchSet(const DataMap& items) {
  RunInTransaction(*this, [&] {
    for (const auto& [key, value] : items) {
      Set(key, value);
    }
  });
}

std::map<std::string, bool> Backend::BatchDelete(const std::vector<std::string>& keys) {
  std::map<std::string, bool> result;
  RunInTransaction(*this, [&] {
    for (const auto& key : keys) {
      result[key] = Delete(key);
    }
  });
  return result;
}

void RunInTransaction(Backend& backend, const std::function<void()>& body) {
  auto tx = backend.Begin();
  try {
    body();
  } catch (...) {
    try {
      tx->Rollback();
    } catch (const std::exception& rollback_error) {
      STATESHIFT_LOG_WARN("Rollback failed", {observability::StringField("error", rollback_error.what())});
    }
    throw;
  }
  tx->Commit();
}

} // namespace stateshift::db
