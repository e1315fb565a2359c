#include "json_backend.hpp"

#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "json_tx.hpp"

namespace stateshift::db::json {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;
using util::StorageError;

namespace {

fs::path Sibling(const fs::path& path, const std::string& suffix) {
  return fs::path(path.string() + suffix);
}

} // namespace

JsonBackend::JsonBackend(JsonBackendOptions options)
    : options_(std::move(options)), cache_(options_.cache_size) {
}

JsonBackend::~JsonBackend() {
  try {
    Close();
  } catch (const std::exception& e) {
    STATESHIFT_LOG_WARN("Json backend close failed", {StringField("error", e.what())});
  }
}

void JsonBackend::Initialize() {
  std::scoped_lock lock(mutex_);
  if (initialized_) return;

  try {
    if (options_.path.has_parent_path()) {
      fs::create_directories(options_.path.parent_path());
    }

    if (fs::exists(options_.path)) {
      data_ = DecodeDataMap(util::ReadFile(options_.path));
    } else {
      data_.clear();
      WriteFile();
    }
  } catch (const StorageError&) {
    throw;
  } catch (const std::exception& e) {
    throw StorageError("Failed to initialize JSON backend: " + std::string(e.what()));
  }

  cache_.Clear();
  initialized_ = true;
  STATESHIFT_LOG_INFO("JSON backend initialized", {StringField("path", options_.path.string())});
}

void JsonBackend::Close() {
  std::scoped_lock lock(mutex_);
  if (!initialized_) return;

  if (!tx_state_.in_transaction) {
    WriteFile();
  }
  initialized_ = false;
  cache_.Clear();
  STATESHIFT_LOG_INFO("JSON backend closed", {StringField("path", options_.path.string())});
}

bool JsonBackend::IsInitialized() const {
  std::scoped_lock lock(mutex_);
  return initialized_;
}

std::optional<Document> JsonBackend::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  if (auto cached = cache_.Get(key)) {
    return cached;
  }

  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;

  cache_.Put(key, it->second);
  return it->second;
}

void JsonBackend::Set(const std::string& key, const Document& value) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  data_[key] = value;
  cache_.Put(key, value);
  PersistIfAutoSave();
}

bool JsonBackend::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  const bool existed = data_.erase(key) > 0;
  if (existed) {
    cache_.Erase(key);
    PersistIfAutoSave();
  }
  return existed;
}

bool JsonBackend::Exists(const std::string& key) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();
  return data_.contains(key);
}

std::vector<std::string> JsonBackend::ListKeys(const std::string& prefix) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  std::vector<std::string> keys;
  for (auto it = data_.lower_bound(prefix); it != data_.end() && it->first.starts_with(prefix); ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

void JsonBackend::Clear() {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  data_.clear();
  cache_.Clear();
  PersistIfAutoSave();
}

DataMap JsonBackend::ExportData() {
  std::scoped_lock lock(mutex_);
  RequireInitialized();
  return data_;
}

void JsonBackend::ImportData(const DataMap& data) {
  std::scoped_lock lock(mutex_);
  RequireInitialized();

  data_ = data;
  cache_.Clear();
  PersistIfAutoSave();
}

std::unique_ptr<Transaction> JsonBackend::Begin() {
  return std::make_unique<JsonTransaction>(*this);
}

bool JsonBackend::InTransaction() const {
  std::scoped_lock lock(mutex_);
  return tx_state_.in_transaction;
}

Document JsonBackend::Stats() {
  std::scoped_lock lock(mutex_);

  std::error_code ec;
  const auto      file_size = fs::exists(options_.path, ec) ? fs::file_size(options_.path, ec) : 0;

  Document stats = EmptyObject();
  *MutableField(stats, "type")           = StringValue("json");
  *MutableField(stats, "file_path")      = StringValue(options_.path.string());
  *MutableField(stats, "file_size")      = IntValue(ec ? 0 : static_cast<std::int64_t>(file_size));
  *MutableField(stats, "key_count")      = IntValue(static_cast<std::int64_t>(data_.size()));
  *MutableField(stats, "cache_size")     = IntValue(static_cast<std::int64_t>(cache_.Size()));
  *MutableField(stats, "cache_hit_rate") = NumberValue(cache_.HitRate());
  *MutableField(stats, "is_initialized") = BoolValue(initialized_);
  return stats;
}

void JsonBackend::Save() {
  std::scoped_lock lock(mutex_);
  if (tx_state_.in_transaction) {
    throw StorageError("cannot save while a transaction is open");
  }
  WriteFile();
}

void JsonBackend::RequireInitialized() const {
  if (!initialized_) {
    throw StorageError("JSON backend not initialized: " + options_.path.string());
  }
}

void JsonBackend::PersistIfAutoSave() {
  // Inside a transaction only Commit() touches the file.
  if (options_.auto_save && !tx_state_.in_transaction) {
    WriteFile();
  }
}

void JsonBackend::WriteFile() {
  const auto tmp_path = Sibling(options_.path, ".tmp");

  try {
    {
      std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw StorageError("cannot open " + tmp_path.string());
      }
      out << EncodeDataMap(data_, true);
      out.flush();
      if (!out) {
        throw StorageError("short write to " + tmp_path.string());
      }
    }

    if (fs::exists(options_.path) && options_.file_backup_count > 0) {
      RotateBackups();
    }
    fs::rename(tmp_path, options_.path);
  } catch (const StorageError& e) {
    STATESHIFT_LOG_ERROR("Failed to save JSON data", {StringField("path", options_.path.string()), StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    STATESHIFT_LOG_ERROR("Failed to save JSON data", {StringField("path", options_.path.string()), StringField("error", e.what())});
    throw StorageError("Failed to save data: " + std::string(e.what()));
  }
}

void JsonBackend::RotateBackups() {
  for (std::size_t i = options_.file_backup_count - 1; i >= 1; --i) {
    const auto older = Sibling(options_.path, ".bak" + std::to_string(i));
    const auto newer = Sibling(options_.path, ".bak" + std::to_string(i + 1));
    if (fs::exists(older)) {
      fs::remove(newer);
      fs::rename(older, newer);
    }
  }

  const auto first = Sibling(options_.path, ".bak1");
  fs::remove(first);
  fs::copy_file(options_.path, first);
  STATESHIFT_LOG_DEBUG("Rotated JSON backups", {IntField("count", static_cast<std::int64_t>(options_.file_backup_count))});
}

} // namespace stateshift::db::json
