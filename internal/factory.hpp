#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/backup/history_query.hpp"
#include "internal/backup/system_table.hpp"
#include "internal/store/api/connection.hpp"

namespace backupmeta::factory {

/*
  Runtime

  Owns the process-wide store connection and the accessors built on it.
  Close() the connection at shutdown; accessors must not be used afterwards.
*/
struct Runtime {
  std::shared_ptr<store::Connection>         connection;
  std::shared_ptr<backup::BackupSystemTable> system_table;
  std::shared_ptr<backup::HistoryQuery>      history;
};

std::shared_ptr<store::Connection> BuildConnection(const backupmeta::runtime::config::RuntimeConfig& config);

backup::SystemTableOptions OptionsFromConfig(const backupmeta::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete store engines.
  Provisions the system table before returning.
*/
Runtime Build(const backupmeta::runtime::config::RuntimeConfig& config);

} // namespace backupmeta::factory
