#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace stateshift::util {

/*
  Central error types.

  ConfigurationError  rejected before any I/O
  DatabaseError       connection, backup/restore and version-compatibility failures
  StorageError        a DatabaseError raised by a backend (I/O, query, codec)
  MigrationError      apply/revert failures, unmet dependencies, duplicate versions
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DatabaseError : public std::runtime_error {
 public:
  explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public DatabaseError {
 public:
  explicit StorageError(const std::string& msg) : DatabaseError(msg) {
  }
};

class MigrationError : public std::runtime_error {
 public:
  explicit MigrationError(const std::string& msg) : std::runtime_error(msg) {
  }

  MigrationError(std::int64_t version, std::string name, const std::string& msg)
      : std::runtime_error(msg), version_(version), name_(std::move(name)) {
  }

  // 0 when the failure is not tied to a single migration.
  std::int64_t version() const {
    return version_;
  }

  const std::string& name() const {
    return name_;
  }

 private:
  std::int64_t version_ = 0;
  std::string  name_;
};

class DependencyError : public MigrationError {
 public:
  using MigrationError::MigrationError;
};

class MigrationInProgressError : public MigrationError {
 public:
  using MigrationError::MigrationError;
};

} // namespace stateshift::util
