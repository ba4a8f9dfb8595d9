#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "backupmeta/v1.hpp"
#include "internal/backup/system_table.hpp"

namespace backupmeta::backup {

using BackupInfoFilter = std::function<bool(const v1::BackupInfo&)>;

BackupInfoFilter ByState(v1::BackupState state);
BackupInfoFilter ByRoot(std::string root);
BackupInfoFilter ByTable(std::string table);
BackupInfoFilter ByType(v1::BackupType type);

// Newest first: descending start time, then descending backup id.
void SortHistoryListDesc(std::vector<v1::BackupInfo>& history);

/*
  Read-only views over the session family.

  Every query rescans the session rows; nothing is cached between calls.
*/
class HistoryQuery {
 public:
  explicit HistoryQuery(const BackupSystemTable& table) : table_(table) {
  }

  std::vector<v1::BackupInfo> GetBackupHistory(bool only_completed = false) const;

  // first n entries of the full history
  std::vector<v1::BackupInfo> GetHistory(std::size_t n) const;

  // Entries passing every filter, at most n. Filters run in order and stop at
  // the first rejection.
  std::vector<v1::BackupInfo> GetBackupHistory(std::size_t n, const std::vector<BackupInfoFilter>& filters) const;

  std::vector<v1::BackupInfo> GetBackupHistory(const std::string& root) const;

  // keeps string literals away from the bool overload
  std::vector<v1::BackupInfo> GetBackupHistory(const char* root) const {
    return GetBackupHistory(std::string(root));
  }

  std::vector<v1::BackupInfo> GetBackupHistoryForTable(const std::string& table) const;

  // sessions written to `root`, grouped under each member of `tables` they cover
  std::map<std::string, std::vector<v1::BackupInfo>> GetBackupHistoryForTableSet(const std::set<std::string>& tables,
                                                                                 const std::string& root) const;

 private:
  const BackupSystemTable& table_;
};

} // namespace backupmeta::backup
