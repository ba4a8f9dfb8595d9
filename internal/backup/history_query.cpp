#include "internal/backup/history_query.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"

namespace backupmeta::backup {

namespace {

bool ContainsTable(const v1::BackupInfo& info, const std::string& table) {
  return std::find(info.tables().begin(), info.tables().end(), table) != info.tables().end();
}

} // namespace

BackupInfoFilter ByState(v1::BackupState state) {
  return [state](const v1::BackupInfo& info) { return info.state() == state; };
}

BackupInfoFilter ByRoot(std::string root) {
  return [root = std::move(root)](const v1::BackupInfo& info) { return info.backup_root_dir() == root; };
}

BackupInfoFilter ByTable(std::string table) {
  return [table = std::move(table)](const v1::BackupInfo& info) { return ContainsTable(info, table); };
}

BackupInfoFilter ByType(v1::BackupType type) {
  return [type](const v1::BackupInfo& info) { return info.type() == type; };
}

void SortHistoryListDesc(std::vector<v1::BackupInfo>& history) {
  std::stable_sort(history.begin(), history.end(), [](const v1::BackupInfo& a, const v1::BackupInfo& b) {
    if (a.start_ts_ms() != b.start_ts_ms()) {
      return a.start_ts_ms() > b.start_ts_ms();
    }
    return a.backup_id() > b.backup_id();
  });
}

std::vector<v1::BackupInfo> HistoryQuery::GetBackupHistory(bool only_completed) const {
  BACKUPMETA_LOG_TRACE("get backup history", {observability::BoolField("only_completed", only_completed)});

  auto history = only_completed ? table_.GetBackupInfos(v1::BACKUP_STATE_COMPLETE) : table_.GetBackupInfos();
  SortHistoryListDesc(history);
  return history;
}

std::vector<v1::BackupInfo> HistoryQuery::GetHistory(std::size_t n) const {
  auto history = GetBackupHistory();
  if (history.size() > n) {
    history.resize(n);
  }
  return history;
}

std::vector<v1::BackupInfo> HistoryQuery::GetBackupHistory(std::size_t n,
                                                           const std::vector<BackupInfoFilter>& filters) const {
  if (filters.empty()) {
    return GetHistory(n);
  }

  std::vector<v1::BackupInfo> result;
  for (auto& info : GetBackupHistory()) {
    if (result.size() >= n) {
      break;
    }
    const bool passed =
        std::all_of(filters.begin(), filters.end(), [&info](const BackupInfoFilter& filter) { return filter(info); });
    if (passed) {
      result.push_back(std::move(info));
    }
  }
  return result;
}

std::vector<v1::BackupInfo> HistoryQuery::GetBackupHistory(const std::string& root) const {
  auto history = GetBackupHistory();
  history.erase(std::remove_if(history.begin(), history.end(),
                               [&root](const v1::BackupInfo& info) { return info.backup_root_dir() != root; }),
                history.end());
  return history;
}

std::vector<v1::BackupInfo> HistoryQuery::GetBackupHistoryForTable(const std::string& table) const {
  std::vector<v1::BackupInfo> result;
  for (auto& info : GetBackupHistory()) {
    if (ContainsTable(info, table)) {
      result.push_back(std::move(info));
    }
  }
  return result;
}

std::map<std::string, std::vector<v1::BackupInfo>>
HistoryQuery::GetBackupHistoryForTableSet(const std::set<std::string>& tables, const std::string& root) const {
  std::map<std::string, std::vector<v1::BackupInfo>> by_table;
  for (const auto& info : GetBackupHistory(root)) {
    for (const auto& table : info.tables()) {
      if (tables.contains(table)) {
        by_table[table].push_back(info);
      }
    }
  }
  return by_table;
}

} // namespace backupmeta::backup
