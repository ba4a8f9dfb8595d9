#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/store/api/table.hpp"

namespace backupmeta::backup {

struct WalItem {
  std::string backup_id;
  std::string wal_file;
  std::string backup_root;

  // "/<root>/<backupId>/<file>"
  std::string ToString() const;
};

/*
  Lazy, forward-only iterator over the WAL registry.

  Owns the table handle and scanner it reads from. The first HasNext() that
  finds no more rows releases both, exactly once; afterwards HasNext() keeps
  returning false without touching the store. Destroying or Close()-ing the
  cursor before exhaustion releases them as well.

  Rows are decoded by column name. When a root filter is set, rows registered
  for other roots are skipped.
*/
class WalCursor {
 public:
  WalCursor(std::unique_ptr<store::Table> table, std::unique_ptr<store::Scanner> scanner, std::string root_filter = {});
  ~WalCursor();

  WalCursor(WalCursor&& other) noexcept;
  WalCursor& operator=(WalCursor&& other) noexcept;

  WalCursor(const WalCursor&)            = delete;
  WalCursor& operator=(const WalCursor&) = delete;

  bool HasNext();

  // throws std::out_of_range once exhausted
  WalItem Next();

  // always throws util::Unsupported
  void Remove();

  void Close();

  bool IsExhausted() const {
    return exhausted_;
  }

 private:
  void Release();

  std::unique_ptr<store::Table>   table_;
  std::unique_ptr<store::Scanner> scanner_;
  std::string                     root_filter_;
  std::optional<WalItem>          pending_;
  bool                            exhausted_ = false;
};

} // namespace backupmeta::backup
