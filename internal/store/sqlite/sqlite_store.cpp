#include "sqlite_store.hpp"

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace backupmeta::store::sqlite {

namespace {

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS kv_tables (name TEXT PRIMARY KEY, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS kv_families (table_name TEXT NOT NULL, family TEXT NOT NULL, max_versions INTEGER NOT NULL, ttl_seconds INTEGER NOT NULL, PRIMARY KEY (table_name, family));",
    "CREATE TABLE IF NOT EXISTS kv_cells (table_name TEXT NOT NULL, row_key BLOB NOT NULL, family TEXT NOT NULL, qualifier BLOB NOT NULL, value BLOB NOT NULL, written_at_ms INTEGER NOT NULL, PRIMARY KEY (table_name, row_key, family, qualifier)) WITHOUT ROWID;"};

using TtlByFamily = std::map<std::string, int64_t>;

struct CellRow {
  std::string key;
  Cell        cell;
  int64_t     written_at_ms = 0;
};

bool IsExpired(const TtlByFamily& ttl, const CellRow& row, int64_t now_ms) {
  auto it = ttl.find(row.cell.family);
  if (it == ttl.end() || it->second <= 0) {
    return false;
  }
  return now_ms - row.written_at_ms > it->second;
}

// columns: row_key, family, qualifier, value, written_at_ms
CellRow ReadCellRow(sqlite3_stmt* st) {
  CellRow row;
  row.key            = ColBlob(st, 0);
  row.cell.family    = ColText(st, 1);
  row.cell.qualifier = ColBlob(st, 2);
  row.cell.value     = ColBlob(st, 3);
  row.written_at_ms  = ColI64(st, 4);
  return row;
}

bool TableExistsIn(SqliteDB& db, const std::string& name) {
  auto st = db.Prepare("SELECT 1 FROM kv_tables WHERE name=?;");
  BindText(st.get(), 1, name);
  int rc = sqlite3_step(st.get());
  db.Check(rc, "sqlite table lookup");
  return rc == SQLITE_ROW;
}

TtlByFamily LoadFamilies(SqliteDB& db, const std::string& table) {
  auto st = db.Prepare("SELECT family, ttl_seconds FROM kv_families WHERE table_name=?;");
  BindText(st.get(), 1, table);

  TtlByFamily families;
  int         rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    families[ColText(st.get(), 0)] = ColI64(st.get(), 1) * 1000;
  }
  db.Check(rc, "sqlite load families");
  return families;
}

class SqliteScanner final : public Scanner {
 public:
  SqliteScanner(std::shared_ptr<SqliteDB> db, Statement st, TtlByFamily ttl, SqliteConnection::ClockFn clock)
      : db_(std::move(db)), st_(std::move(st)), ttl_(std::move(ttl)), clock_(std::move(clock)) {
  }

  ~SqliteScanner() override {
    Close();
  }

  std::optional<Row> Next() override {
    if (!st_) {
      throw StoreError(ErrorCode::Closed, "scanner is closed");
    }

    const auto now = clock_();
    while (!done_ || pending_) {
      std::optional<CellRow> first = std::move(pending_);
      pending_.reset();
      if (!first) {
        first = Step();
        if (!first) {
          return std::nullopt;
        }
      }

      Row row;
      row.key = first->key;
      if (!IsExpired(ttl_, *first, now)) {
        row.cells.push_back(std::move(first->cell));
      }

      while (auto next = Step()) {
        if (next->key != row.key) {
          pending_ = std::move(next);
          break;
        }
        if (!IsExpired(ttl_, *next, now)) {
          row.cells.push_back(std::move(next->cell));
        }
      }

      if (!row.Empty()) {
        return row;
      }
    }
    return std::nullopt;
  }

  void Close() override {
    st_.reset();
  }

 private:
  std::optional<CellRow> Step() {
    if (done_) {
      return std::nullopt;
    }
    int rc = sqlite3_step(st_.get());
    if (rc == SQLITE_ROW) {
      return ReadCellRow(st_.get());
    }
    done_ = true;
    db_->Check(rc, "sqlite scan");
    return std::nullopt;
  }

  std::shared_ptr<SqliteDB> db_;
  Statement                 st_;
  TtlByFamily               ttl_;
  SqliteConnection::ClockFn clock_;
  std::optional<CellRow>    pending_;
  bool                      done_ = false;
};

class SqliteTable final : public Table {
 public:
  SqliteTable(std::shared_ptr<SqliteDB> db, std::string name, TtlByFamily ttl, SqliteConnection::ClockFn clock)
      : db_(std::move(db)), name_(std::move(name)), ttl_(std::move(ttl)), clock_(std::move(clock)) {
  }

  ~SqliteTable() override {
    Close();
  }

  const std::string& Name() const override {
    return name_;
  }

  Result Put(const Mutation& mutation) override {
    if (!db_) return Result::Err(ErrorCode::Closed, "table handle is closed");
    if (mutation.cells.empty()) return Result::Err(ErrorCode::InvalidArgument, "mutation has no cells");
    for (const auto& cell : mutation.cells) {
      if (ttl_.count(cell.family) == 0) {
        return Result::Err(ErrorCode::InvalidArgument, "unknown column family: " + cell.family);
      }
    }

    try {
      SqliteTransaction tx(db_);
      auto st = db_->Prepare(
          "INSERT INTO kv_cells(table_name,row_key,family,qualifier,value,written_at_ms) VALUES(?,?,?,?,?,?) "
          "ON CONFLICT(table_name,row_key,family,qualifier) DO UPDATE SET value=excluded.value, written_at_ms=excluded.written_at_ms;");

      const auto now = clock_();
      for (const auto& cell : mutation.cells) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, name_);
        BindBlob(st.get(), 2, mutation.row);
        BindText(st.get(), 3, cell.family);
        BindBlob(st.get(), 4, cell.qualifier);
        BindBlob(st.get(), 5, cell.value);
        BindI64(st.get(), 6, now);
        db_->Check(sqlite3_step(st.get()), "sqlite put");
      }
      st.reset();
      tx.Commit();
    } catch (const StoreError& ex) {
      return Result::Err(ex.code(), ex.what());
    }
    return Result::Ok();
  }

  Result Put(const std::vector<Mutation>& mutations) override {
    for (const auto& mutation : mutations) {
      auto result = Put(mutation);
      if (!result) {
        return result;
      }
    }
    return Result::Ok();
  }

  Result Delete(const DeleteRequest& request) override {
    if (!db_) return Result::Err(ErrorCode::Closed, "table handle is closed");
    if (request.family && ttl_.count(*request.family) == 0) {
      return Result::Err(ErrorCode::InvalidArgument, "unknown column family: " + *request.family);
    }

    try {
      SqliteTransaction tx(db_);
      auto st = db_->Prepare(request.family ? "DELETE FROM kv_cells WHERE table_name=? AND row_key=? AND family=?;"
                                            : "DELETE FROM kv_cells WHERE table_name=? AND row_key=?;");
      BindText(st.get(), 1, name_);
      BindBlob(st.get(), 2, request.row);
      if (request.family) {
        BindText(st.get(), 3, *request.family);
      }
      db_->Check(sqlite3_step(st.get()), "sqlite delete");
      st.reset();
      tx.Commit();
    } catch (const StoreError& ex) {
      return Result::Err(ex.code(), ex.what());
    }
    return Result::Ok();
  }

  Row Get(const GetRequest& request) override {
    RequireOpen();
    if (request.max_versions < 1) {
      throw StoreError(ErrorCode::InvalidArgument, "max_versions must be at least 1");
    }
    RequireFamily(request.family);

    auto st = db_->Prepare(request.family ? "SELECT row_key,family,qualifier,value,written_at_ms FROM kv_cells "
                                            "WHERE table_name=? AND row_key=? AND family=? ORDER BY family, qualifier;"
                                          : "SELECT row_key,family,qualifier,value,written_at_ms FROM kv_cells "
                                            "WHERE table_name=? AND row_key=? ORDER BY family, qualifier;");
    BindText(st.get(), 1, name_);
    BindBlob(st.get(), 2, request.row);
    if (request.family) {
      BindText(st.get(), 3, *request.family);
    }

    Row row;
    row.key        = request.row;
    const auto now = clock_();
    int        rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      auto cell_row = ReadCellRow(st.get());
      if (!IsExpired(ttl_, cell_row, now)) {
        row.cells.push_back(std::move(cell_row.cell));
      }
    }
    db_->Check(rc, "sqlite get");
    return row;
  }

  std::unique_ptr<Scanner> GetScanner(const ScanSpec& spec) override {
    RequireOpen();
    if (spec.max_versions < 1 || spec.caching < 1) {
      throw StoreError(ErrorCode::InvalidArgument, "max_versions and caching must be at least 1");
    }
    RequireFamily(spec.family);

    std::string sql = "SELECT row_key,family,qualifier,value,written_at_ms FROM kv_cells WHERE table_name=? AND row_key>=?";
    if (!spec.stop_row.empty()) sql += " AND row_key<?";
    if (spec.family) sql += " AND family=?";
    sql += " ORDER BY row_key, family, qualifier;";

    auto st  = db_->Prepare(sql);
    int  idx = 1;
    BindText(st.get(), idx++, name_);
    BindBlob(st.get(), idx++, spec.start_row);
    if (!spec.stop_row.empty()) BindBlob(st.get(), idx++, spec.stop_row);
    if (spec.family) BindText(st.get(), idx++, *spec.family);

    return std::make_unique<SqliteScanner>(db_, std::move(st), ttl_, clock_);
  }

  void Close() override {
    db_.reset();
  }

 private:
  void RequireOpen() const {
    if (!db_) {
      throw StoreError(ErrorCode::Closed, "table handle is closed");
    }
  }

  void RequireFamily(const std::optional<std::string>& family) const {
    if (family && ttl_.count(*family) == 0) {
      throw StoreError(ErrorCode::InvalidArgument, "unknown column family: " + *family);
    }
  }

  std::shared_ptr<SqliteDB> db_;
  std::string               name_;
  TtlByFamily               ttl_;
  SqliteConnection::ClockFn clock_;
};

class SqliteAdmin final : public Admin {
 public:
  explicit SqliteAdmin(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  }

  bool TableExists(const std::string& name) override {
    return TableExistsIn(*db_, name);
  }

  Result CreateTable(const TableDescriptor& descriptor) override {
    if (descriptor.name.empty()) return Result::Err(ErrorCode::InvalidArgument, "table name is empty");
    if (descriptor.families.empty()) return Result::Err(ErrorCode::InvalidArgument, "table has no column families");
    for (const auto& family : descriptor.families) {
      if (family.max_versions != 1) {
        return Result::Err(ErrorCode::Unsupported, "only one version per cell is retained");
      }
    }

    try {
      SqliteTransaction tx(db_);
      if (TableExistsIn(*db_, descriptor.name)) {
        return Result::Err(ErrorCode::AlreadyExists, "table exists: " + descriptor.name);
      }

      auto table_st = db_->Prepare("INSERT INTO kv_tables(name, created_at_ms) VALUES(?,?);");
      BindText(table_st.get(), 1, descriptor.name);
      BindI64(table_st.get(), 2, util::NowMillis());
      db_->Check(sqlite3_step(table_st.get()), "sqlite create table");
      table_st.reset();

      auto family_st = db_->Prepare("INSERT INTO kv_families(table_name, family, max_versions, ttl_seconds) VALUES(?,?,?,?);");
      for (const auto& family : descriptor.families) {
        sqlite3_reset(family_st.get());
        BindText(family_st.get(), 1, descriptor.name);
        BindText(family_st.get(), 2, family.name);
        BindI64(family_st.get(), 3, family.max_versions);
        BindI64(family_st.get(), 4, family.ttl_seconds);
        db_->Check(sqlite3_step(family_st.get()), "sqlite create family");
      }
      family_st.reset();
      tx.Commit();
    } catch (const StoreError& ex) {
      return Result::Err(ex.code(), ex.what());
    }

    BACKUPMETA_LOG_INFO("sqlite table created", {observability::StringField("table", descriptor.name)});
    return Result::Ok();
  }

  bool IsTableAvailable(const std::string& name) override {
    return TableExistsIn(*db_, name);
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace

SqliteConnection::SqliteConnection(std::string path, bool wal_mode) : SqliteConnection(std::move(path), wal_mode, &util::NowMillis) {
}

SqliteConnection::SqliteConnection(std::string path, bool wal_mode, ClockFn clock_ms)
    : db_(std::make_shared<SqliteDB>(std::move(path), wal_mode)), clock_(std::move(clock_ms)) {
  BootstrapSchema();
}

void SqliteConnection::BootstrapSchema() {
  for (const auto& sql : kBootstrapSql) {
    db_->Exec(sql);
  }
}

std::shared_ptr<SqliteDB> SqliteConnection::RequireOpen() const {
  std::scoped_lock lock(mutex_);
  if (!db_) {
    throw StoreError(ErrorCode::Closed, "connection is closed");
  }
  return db_;
}

std::unique_ptr<Admin> SqliteConnection::GetAdmin() {
  return std::make_unique<SqliteAdmin>(RequireOpen());
}

std::unique_ptr<Table> SqliteConnection::GetTable(const std::string& name) {
  auto db = RequireOpen();
  if (!TableExistsIn(*db, name)) {
    throw StoreError(ErrorCode::NotFound, "table not found: " + name);
  }
  auto families = LoadFamilies(*db, name);
  return std::make_unique<SqliteTable>(std::move(db), name, std::move(families), clock_);
}

bool SqliteConnection::IsClosed() const {
  std::scoped_lock lock(mutex_);
  return db_ == nullptr;
}

void SqliteConnection::Close() {
  std::scoped_lock lock(mutex_);
  db_.reset();
}

} // namespace backupmeta::store::sqlite
