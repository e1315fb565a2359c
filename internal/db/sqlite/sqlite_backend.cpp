#include "sqlite_backend.hpp"

#include "internal/db/api/backend_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace stateshift::db::sqlite {

namespace fs = std::filesystem;

using observability::StringField;
using util::StorageError;

SqliteBackend::SqliteBackend(SqliteBackendOptions options)
    : options_(std::move(options)), cache_(options_.cache_size) {
}

SqliteBackend::~SqliteBackend() {
  Close();
}

void SqliteBackend::Initialize() {
  std::scoped_lock lock(mutex_);
  if (db_) return;

  try {
    if (options_.path.has_parent_path()) {
      fs::create_directories(options_.path.parent_path());
    }
    db_ = std::make_unique<SqliteDB>(options_.path.string(), TimeoutMillis(options_.timeout_seconds));
    CreateTables();
  } catch (const std::exception& e) {
    db_.reset();
    throw StorageError("Failed to initialize SQLite backend: " + std::string(e.what()));
  }

  STATESHIFT_LOG_INFO("SQLite backend initialized", {StringField("path", options_.path.string())});
}

void SqliteBackend::Close() {
  std::scoped_lock lock(mutex_);
  if (!db_) return;

  db_.reset();
  cache_.Clear();
  STATESHIFT_LOG_INFO("SQLite backend closed", {StringField("path", options_.path.string())});
}

bool SqliteBackend::IsInitialized() const {
  std::scoped_lock lock(mutex_);
  return db_ != nullptr;
}

SqliteDB& SqliteBackend::Db() const {
  if (!db_) {
    throw StorageError("SQLite backend not initialized: " + options_.path.string());
  }
  return *db_;
}

void SqliteBackend::CreateTables() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS storage ("
      " key TEXT PRIMARY KEY,"
      " value TEXT NOT NULL,"
      " created_at TEXT NOT NULL,"
      " updated_at TEXT NOT NULL);");
  db_->Exec("CREATE INDEX IF NOT EXISTS idx_storage_updated_at ON storage(updated_at);");
}

// ------------------------------------------------------------------
// Key-value
// ------------------------------------------------------------------

std::optional<Document> SqliteBackend::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);

  if (auto cached = cache_.Get(key)) {
    return cached;
  }

  Statement st(Db().Handle(), "SELECT value FROM storage WHERE key=?1;");
  st.BindText(1, key);
  if (!st.Step()) return std::nullopt;

  auto value = DecodeJson(st.ColumnText(0));
  cache_.Put(key, value);
  return value;
}

void SqliteBackend::Set(const std::string& key, const Document& value) {
  std::scoped_lock lock(mutex_);

  Statement st(Db().Handle(),
               "INSERT INTO storage(key,value,created_at,updated_at) VALUES(?1,?2,?3,?3) "
               "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at=excluded.updated_at;");
  st.BindText(1, key);
  st.BindText(2, EncodeJson(value));
  st.BindText(3, util::ToIso8601(util::Now()));
  st.Step();

  cache_.Put(key, value);
}

bool SqliteBackend::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);

  Statement st(Db().Handle(), "DELETE FROM storage WHERE key=?1;");
  st.BindText(1, key);
  st.Step();

  cache_.Erase(key);
  return sqlite3_changes(Db().Handle()) > 0;
}

bool SqliteBackend::Exists(const std::string& key) {
  std::scoped_lock lock(mutex_);

  Statement st(Db().Handle(), "SELECT 1 FROM storage WHERE key=?1 LIMIT 1;");
  st.BindText(1, key);
  return st.Step();
}

std::vector<std::string> SqliteBackend::ListKeys(const std::string& prefix) {
  std::scoped_lock lock(mutex_);

  // substr() instead of LIKE: prefixes may contain % and _
  Statement st(Db().Handle(), "SELECT key FROM storage WHERE substr(key,1,length(?1))=?1 ORDER BY key;");
  st.BindText(1, prefix);

  std::vector<std::string> keys;
  while (st.Step()) {
    keys.push_back(st.ColumnText(0));
  }
  return keys;
}

void SqliteBackend::Clear() {
  std::scoped_lock lock(mutex_);
  Db().Exec("DELETE FROM storage;");
  cache_.Clear();
}

// ------------------------------------------------------------------
// Bulk
// ------------------------------------------------------------------

DataMap SqliteBackend::ExportData() {
  std::scoped_lock lock(mutex_);

  Statement st(Db().Handle(), "SELECT key,value FROM storage ORDER BY key;");

  DataMap data;
  while (st.Step()) {
    data.emplace(st.ColumnText(0), DecodeJson(st.ColumnText(1)));
  }
  return data;
}

void SqliteBackend::ImportData(const DataMap& data) {
  std::scoped_lock lock(mutex_);

  RunInTransaction(*this, [&] {
    Db().Exec("DELETE FROM storage;");
    for (const auto& [key, value] : data) {
      Insert(key, value);
    }
  });
  cache_.Clear();
}

void SqliteBackend::Insert(const std::string& key, const Document& value) {
  Statement st(Db().Handle(), "INSERT INTO storage(key,value,created_at,updated_at) VALUES(?1,?2,?3,?3);");
  st.BindText(1, key);
  st.BindText(2, EncodeJson(value));
  st.BindText(3, util::ToIso8601(util::Now()));
  st.Step();
}

// ------------------------------------------------------------------
// Transactions
// ------------------------------------------------------------------

std::unique_ptr<Transaction> SqliteBackend::Begin() {
  return std::make_unique<SqliteTransaction>(*this);
}

bool SqliteBackend::InTransaction() const {
  std::scoped_lock lock(mutex_);
  return tx_state_.in_transaction;
}

Document SqliteBackend::Stats() {
  std::scoped_lock lock(mutex_);

  Document stats = EmptyObject();
  *MutableField(stats, "type")    = StringValue("sqlite");
  *MutableField(stats, "db_path") = StringValue(options_.path.string());

  if (db_) {
    Statement size(db_->Handle(), "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size();");
    *MutableField(stats, "db_size") = IntValue(size.Step() ? size.ColumnInt64(0) : 0);

    Statement count(db_->Handle(), "SELECT COUNT(*) FROM storage;");
    *MutableField(stats, "key_count") = IntValue(count.Step() ? count.ColumnInt64(0) : 0);
  }

  *MutableField(stats, "cache_size")     = IntValue(static_cast<std::int64_t>(cache_.Size()));
  *MutableField(stats, "cache_hit_rate") = NumberValue(cache_.HitRate());
  *MutableField(stats, "is_initialized") = BoolValue(db_ != nullptr);
  return stats;
}

} // namespace stateshift::db::sqlite
