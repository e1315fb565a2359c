#include "pg_backend.hpp"

#include <type_traits>

#include "internal/db/api/backend_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "pg_tx.hpp"

namespace stateshift::db::postgres {

using observability::IntField;
using util::StorageError;

PgBackend::PgBackend(PgBackendOptions options) : options_(std::move(options)), cache_(options_.cache_size) {
}

PgBackend::~PgBackend() {
  Close();
}

PgPool& PgBackend::Pool() const {
  if (!pool_) {
    throw StorageError("PostgreSQL backend not initialized");
  }
  return *pool_;
}

// Runs `fn` on the open transaction's work, or on a fresh autocommitted one.
template <typename Fn>
auto PgBackend::WithWork(Fn&& fn) {
  try {
    if (active_work_) {
      return fn(*active_work_);
    }

    auto       conn = Pool().Acquire();
    pqxx::work work(*conn);
    if constexpr (std::is_void_v<decltype(fn(work))>) {
      fn(work);
      work.commit();
    } else {
      auto result = fn(work);
      work.commit();
      return result;
    }
  } catch (const pqxx::failure& e) {
    throw StorageError("postgres: " + std::string(e.what()));
  }
}

void PgBackend::Initialize() {
  std::scoped_lock lock(mutex_);
  if (pool_) return;

  try {
    CreateTables();
    pool_ = std::make_shared<PgPool>(options_.conninfo, options_.pool_size, TimeoutMillis(options_.timeout_seconds));
  } catch (const std::exception& e) {
    pool_.reset();
    throw StorageError("Failed to initialize PostgreSQL backend: " + std::string(e.what()));
  }

  STATESHIFT_LOG_INFO("PostgreSQL backend initialized", {IntField("pool_size", static_cast<std::int64_t>(options_.pool_size))});
}

void PgBackend::Close() {
  std::scoped_lock lock(mutex_);
  if (!pool_) return;

  pool_.reset();
  cache_.Clear();
  STATESHIFT_LOG_INFO("PostgreSQL backend closed");
}

bool PgBackend::IsInitialized() const {
  std::scoped_lock lock(mutex_);
  return pool_ != nullptr;
}

void PgBackend::CreateTables() {
  // The prepared statements reference `storage`, so DDL runs on a bare connection.
  pqxx::connection conn(options_.conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS storage (key TEXT PRIMARY KEY, value JSONB NOT NULL, created_at TIMESTAMPTZ DEFAULT NOW(), updated_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_storage_updated_at ON storage(updated_at);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_storage_value_gin ON storage USING gin(value);");
  tx.commit();
}

// ------------------------------------------------------------------
// Key-value
// ------------------------------------------------------------------

std::optional<Document> PgBackend::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);

  if (auto cached = cache_.Get(key)) {
    return cached;
  }

  auto json = WithWork([&](pqxx::work& w) -> std::optional<std::string> {
    auto res = w.exec_prepared("get_value", key);
    if (res.empty()) return std::nullopt;
    return std::string(res[0][0].c_str());
  });
  if (!json) return std::nullopt;

  auto value = DecodeJson(*json);
  cache_.Put(key, value);
  return value;
}

void PgBackend::Set(const std::string& key, const Document& value) {
  std::scoped_lock lock(mutex_);

  const auto json = EncodeJson(value);
  WithWork([&](pqxx::work& w) { w.exec_prepared("upsert_value", key, json); });
  cache_.Put(key, value);
}

bool PgBackend::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);

  const auto affected = WithWork([&](pqxx::work& w) { return w.exec_prepared("delete_value", key).affected_rows(); });
  cache_.Erase(key);
  return affected > 0;
}

bool PgBackend::Exists(const std::string& key) {
  std::scoped_lock lock(mutex_);
  return WithWork([&](pqxx::work& w) { return !w.exec_prepared("exists_value", key).empty(); });
}

std::vector<std::string> PgBackend::ListKeys(const std::string& prefix) {
  std::scoped_lock lock(mutex_);

  return WithWork([&](pqxx::work& w) {
    auto                     res = w.exec_prepared("list_keys", prefix);
    std::vector<std::string> keys;
    keys.reserve(res.size());
    for (const auto& row : res) {
      keys.emplace_back(row[0].c_str());
    }
    return keys;
  });
}

void PgBackend::Clear() {
  std::scoped_lock lock(mutex_);
  WithWork([&](pqxx::work& w) { w.exec("DELETE FROM storage;"); });
  cache_.Clear();
}

// ------------------------------------------------------------------
// Bulk
// ------------------------------------------------------------------

DataMap PgBackend::ExportData() {
  std::scoped_lock lock(mutex_);

  auto rows = WithWork([&](pqxx::work& w) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& row : w.exec("SELECT key, value::text FROM storage ORDER BY key COLLATE \"C\";")) {
      out.emplace_back(row[0].c_str(), row[1].c_str());
    }
    return out;
  });

  DataMap data;
  for (const auto& [key, json] : rows) {
    data.emplace(key, DecodeJson(json));
  }
  return data;
}

void PgBackend::ImportData(const DataMap& data) {
  std::scoped_lock lock(mutex_);

  std::vector<std::pair<std::string, std::string>> rows;
  rows.reserve(data.size());
  for (const auto& [key, value] : data) {
    rows.emplace_back(key, EncodeJson(value));
  }

  RunInTransaction(*this, [&] {
    WithWork([&](pqxx::work& w) {
      w.exec("DELETE FROM storage;");
      for (const auto& [key, json] : rows) {
        w.exec_prepared("insert_value", key, json);
      }
    });
  });
  cache_.Clear();
}

// ------------------------------------------------------------------
// Transactions
// ------------------------------------------------------------------

std::unique_ptr<Transaction> PgBackend::Begin() {
  return std::make_unique<PgTransaction>(*this);
}

bool PgBackend::InTransaction() const {
  std::scoped_lock lock(mutex_);
  return tx_state_.in_transaction;
}

Document PgBackend::Stats() {
  std::scoped_lock lock(mutex_);

  Document stats = EmptyObject();
  *MutableField(stats, "type")      = StringValue("postgresql");
  *MutableField(stats, "pool_size") = IntValue(static_cast<std::int64_t>(options_.pool_size));

  if (pool_) {
    auto sizes = WithWork([&](pqxx::work& w) {
      auto table = w.exec("SELECT pg_total_relation_size('storage'), COUNT(*) FROM storage;");
      return std::make_pair(table[0][0].as<std::int64_t>(), table[0][1].as<std::int64_t>());
    });
    *MutableField(stats, "table_size") = IntValue(sizes.first);
    *MutableField(stats, "key_count")  = IntValue(sizes.second);
  }

  *MutableField(stats, "cache_size")     = IntValue(static_cast<std::int64_t>(cache_.Size()));
  *MutableField(stats, "cache_hit_rate") = NumberValue(cache_.HitRate());
  *MutableField(stats, "is_initialized") = BoolValue(pool_ != nullptr);
  return stats;
}

} // namespace stateshift::db::postgres
