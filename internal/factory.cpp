#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#if BACKUPMETA_DB_SQLITE
#include "internal/store/sqlite/sqlite_store.hpp"
#endif

namespace backupmeta::factory {

std::shared_ptr<store::Connection> BuildConnection(const backupmeta::runtime::config::RuntimeConfig& config) {
  const auto& engine = config.store();
  if (engine.has_sqlite()) {
#if BACKUPMETA_DB_SQLITE
    BACKUPMETA_LOG_INFO("opening sqlite store", {observability::StringField("path", engine.sqlite().path()),
                                                 observability::BoolField("wal_mode", engine.sqlite().wal_mode())});
    return std::make_shared<store::sqlite::SqliteConnection>(engine.sqlite().path(), engine.sqlite().wal_mode());
#else
    throw std::runtime_error("sqlite store requested but not enabled at build time");
#endif
  }

  BACKUPMETA_LOG_INFO("opening in-memory store");
  return std::make_shared<store::memory::MemoryConnection>();
}

backup::SystemTableOptions OptionsFromConfig(const backupmeta::runtime::config::RuntimeConfig& config) {
  auto resolved = config;
  backupmeta::config::ConfigLoader::ApplyDefaults(resolved);
  const auto& table = resolved.system_table();

  backup::SystemTableOptions options;
  options.table_name           = table.name();
  options.session_ttl_seconds  = table.session_ttl_seconds();
  options.availability_timeout = std::chrono::milliseconds(table.availability_timeout_ms());
  options.poll_interval        = std::chrono::milliseconds(table.availability_poll_interval_ms());
  return options;
}

/*
    Build full runtime dependency graph
*/
Runtime Build(const backupmeta::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  runtime.connection   = BuildConnection(config);
  runtime.system_table = std::make_shared<backup::BackupSystemTable>(runtime.connection, OptionsFromConfig(config));
  runtime.history      = std::make_shared<backup::HistoryQuery>(*runtime.system_table);

  return runtime;
}

} // namespace backupmeta::factory
