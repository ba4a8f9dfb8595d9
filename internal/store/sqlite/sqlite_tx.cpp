#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace backupmeta::store::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->WriteMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    BACKUPMETA_LOG_ERROR("sqlite rollback failed",
                         {observability::StringField("path", db_->Path()), observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

} // namespace backupmeta::store::sqlite
