#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "internal/store/api/connection.hpp"
#include "sqlite_db.hpp"

namespace backupmeta::store::sqlite {

/*
  Sorted store on a single SQLite file.

  Layout:
    kv_tables   (name)                                   - table registry
    kv_families (table_name, family, max_versions, ttl)  - column families
    kv_cells    (table_name, row_key, family, qualifier, value, written_at_ms)

  row_key and qualifier are BLOBs: SQLite compares BLOBs with memcmp, which
  gives the unsigned byte ordering the key schema relies on.
*/
class SqliteConnection final : public store::Connection {
 public:
  using ClockFn = std::function<int64_t()>;

  SqliteConnection(std::string path, bool wal_mode);
  SqliteConnection(std::string path, bool wal_mode, ClockFn clock_ms);

  std::unique_ptr<Admin> GetAdmin() override;
  std::unique_ptr<Table> GetTable(const std::string& name) override;

  bool IsClosed() const override;
  void Close() override;

 private:
  void BootstrapSchema();
  std::shared_ptr<SqliteDB> RequireOpen() const;

  mutable std::mutex        mutex_;
  std::shared_ptr<SqliteDB> db_;
  ClockFn                   clock_;
};

} // namespace backupmeta::store::sqlite
