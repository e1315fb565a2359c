#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/backend.hpp"

namespace stateshift::db {

/*
  CreateBackend

  Builds an uninitialized backend for `config.backend()`.

  NOTE:
  This is the ONLY place allowed to know concrete backend types.
  Throws util::ConfigurationError for unknown names and for backends not
  compiled into this build.
*/
std::unique_ptr<Backend> CreateBackend(const stateshift::runtime::config::DatabaseConfig& config);

} // namespace stateshift::db
