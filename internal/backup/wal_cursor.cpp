#include "internal/backup/wal_cursor.hpp"

#include <stdexcept>
#include <utility>

#include "internal/backup/key_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backupmeta::backup {

namespace {

const std::string& RequireColumn(const store::Row& row, std::string_view qualifier) {
  const auto* cell = row.Find(kMetaFamily, qualifier);
  if (cell == nullptr) {
    throw util::MalformedData("WAL registry row is missing column '" + std::string(qualifier) + "'");
  }
  return cell->value;
}

WalItem DecodeWalRow(const store::Row& row) {
  WalItem item;
  item.backup_id   = RequireColumn(row, kWalBackupIdQualifier);
  item.wal_file    = RequireColumn(row, kWalFileQualifier);
  item.backup_root = RequireColumn(row, kWalRootQualifier);
  return item;
}

} // namespace

std::string WalItem::ToString() const {
  return "/" + backup_root + "/" + backup_id + "/" + wal_file;
}

WalCursor::WalCursor(std::unique_ptr<store::Table> table, std::unique_ptr<store::Scanner> scanner, std::string root_filter)
    : table_(std::move(table)), scanner_(std::move(scanner)), root_filter_(std::move(root_filter)) {
}

WalCursor::~WalCursor() {
  Release();
}

WalCursor::WalCursor(WalCursor&& other) noexcept
    : table_(std::move(other.table_)),
      scanner_(std::move(other.scanner_)),
      root_filter_(std::move(other.root_filter_)),
      pending_(std::move(other.pending_)),
      exhausted_(other.exhausted_) {
  other.pending_.reset();
  other.exhausted_ = true;
}

WalCursor& WalCursor::operator=(WalCursor&& other) noexcept {
  if (this != &other) {
    Release();
    table_           = std::move(other.table_);
    scanner_         = std::move(other.scanner_);
    root_filter_     = std::move(other.root_filter_);
    pending_         = std::move(other.pending_);
    exhausted_       = other.exhausted_;
    other.pending_.reset();
    other.exhausted_ = true;
  }
  return *this;
}

bool WalCursor::HasNext() {
  if (pending_) {
    return true;
  }
  if (exhausted_) {
    return false;
  }

  while (auto row = scanner_->Next()) {
    auto item = DecodeWalRow(*row);
    if (!root_filter_.empty() && item.backup_root != root_filter_) {
      continue;
    }
    pending_ = std::move(item);
    return true;
  }

  exhausted_ = true;
  Release();
  BACKUPMETA_LOG_TRACE("WAL cursor exhausted");
  return false;
}

WalItem WalCursor::Next() {
  if (!HasNext()) {
    throw std::out_of_range("WAL cursor is exhausted");
  }
  WalItem item = std::move(*pending_);
  pending_.reset();
  return item;
}

void WalCursor::Remove() {
  throw util::Unsupported("remove is not supported by the WAL cursor");
}

void WalCursor::Close() {
  pending_.reset();
  exhausted_ = true;
  Release();
}

void WalCursor::Release() {
  if (scanner_) {
    scanner_->Close();
    scanner_.reset();
  }
  if (table_) {
    table_->Close();
    table_.reset();
  }
}

} // namespace backupmeta::backup
