#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace backupmeta::store::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  Failures are raised as store::StoreError with the sqlite code translated.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Serializes write transactions issued through this handle.
  std::mutex& WriteMutex() {
    return write_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Throws StoreError unless rc is one of the success codes.
  void Check(int rc, const char* what) const;

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  write_mutex_;
};

void BindText(sqlite3_stmt* st, int idx, std::string_view s);
void BindBlob(sqlite3_stmt* st, int idx, std::string_view s);
void BindI64(sqlite3_stmt* st, int idx, int64_t v);

std::string ColText(sqlite3_stmt* st, int col);
std::string ColBlob(sqlite3_stmt* st, int col);
int64_t     ColI64(sqlite3_stmt* st, int col);

} // namespace backupmeta::store::sqlite
