#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "backupmeta/v1.hpp"
#include "internal/backup/descriptor_codec.hpp"
#include "internal/backup/wal_cursor.hpp"
#include "internal/store/api/connection.hpp"

namespace backupmeta::backup {

struct SystemTableOptions {
  std::string               table_name = "backup:system";
  // 0 keeps session rows forever
  int64_t                   session_ttl_seconds = 0;
  std::chrono::milliseconds availability_timeout{60000};
  std::chrono::milliseconds poll_interval{100};
};

/*
  Typed accessors for the backup system table.

  Seven record families live in one physical table (see key_codec.hpp).
  Every call opens its own table handle from the shared connection and
  releases it before returning, on success and on error.

  ERRORS:

  - absent records come back as std::nullopt or an empty container
  - store failures surface as store::StoreError
  - undecodable stored values raise util::MalformedData
  - roots, tables and servers containing the key delimiter raise
    util::InvalidArgument

  Backup-set mutations are read-modify-write without concurrency control:
  two concurrent mutators of the same set race and the last write wins.
*/
class BackupSystemTable {
 public:
  // Creates the table if missing and waits until it is available; throws
  // util::StoreUnavailable when that takes longer than the configured timeout.
  BackupSystemTable(std::shared_ptr<store::Connection> connection, SystemTableOptions options = {});

  BackupSystemTable(const BackupSystemTable&)            = delete;
  BackupSystemTable& operator=(const BackupSystemTable&) = delete;

  static store::TableDescriptor SystemTableDescriptor(const SystemTableOptions& options);

  const std::string& TableName() const {
    return options_.table_name;
  }

  // ------------------------------------------------------------
  // Backup sessions
  // ------------------------------------------------------------

  void                          UpdateBackupInfo(const v1::BackupInfo& info);
  std::optional<v1::BackupInfo> ReadBackupInfo(const std::string& backup_id) const;
  void                          DeleteBackupInfo(const std::string& backup_id);

  // all sessions in key order, optionally only those in `state`
  std::vector<v1::BackupInfo> GetBackupInfos(std::optional<v1::BackupState> state = std::nullopt) const;

  bool HasBackupSessions() const;

  // ------------------------------------------------------------
  // Start codes
  // ------------------------------------------------------------

  // std::nullopt when the root was never backed up or was reset
  std::optional<std::string> ReadBackupStartCode(const std::string& root) const;
  void                       WriteBackupStartCode(const std::string& start_code, const std::string& root);
  void                       WriteBackupStartCode(const std::string& root);

  // ------------------------------------------------------------
  // Log timestamps
  // ------------------------------------------------------------

  void             WriteRegionServerLastLogRollResult(const std::string& server, int64_t timestamp, const std::string& root);
  ServerTimestamps ReadRegionServerLastLogRollResult(const std::string& root) const;

  // one independent row per table; no atomicity across tables
  void WriteRegionServerLogTimestamp(const std::set<std::string>& tables, const ServerTimestamps& timestamps,
                                     const std::string& root);

  std::map<std::string, ServerTimestamps> ReadLogTimestampMap(const std::string& root) const;

  // ------------------------------------------------------------
  // Incremental table set
  // ------------------------------------------------------------

  std::set<std::string> GetIncrementalBackupTableSet(const std::string& root) const;
  void                  AddIncrementalBackupTableSet(const std::set<std::string>& tables, const std::string& root);
  void                  DeleteIncrementalBackupTableSet(const std::string& root);

  // ------------------------------------------------------------
  // WAL registry
  // ------------------------------------------------------------

  void AddWALFiles(const std::vector<std::string>& files, const std::string& backup_id, const std::string& root);

  // empty root iterates every registered file
  WalCursor GetWALFilesIterator(const std::string& root = {}) const;

  bool IsWALFileDeletable(const std::string& file) const;
  void DeleteWALFiles(const std::vector<std::string>& files);

  // ------------------------------------------------------------
  // Backup sets
  // ------------------------------------------------------------

  std::vector<std::string>                ListBackupSets() const;
  std::optional<std::vector<std::string>> DescribeBackupSet(const std::string& name) const;
  void                                    AddToBackupSet(const std::string& name, const std::vector<std::string>& tables);
  void RemoveFromBackupSet(const std::string& name, const std::vector<std::string>& tables);
  void DeleteBackupSet(const std::string& name);

 private:
  void CheckSystemTable();
  void WaitForSystemTable(store::Admin& admin) const;

  std::unique_ptr<store::Table> OpenTable() const;

  template <typename Fn>
  void ScanPrefix(const std::string& prefix, std::string_view family, int caching, Fn&& fn) const;

  void Put(const store::Mutation& mutation, const char* what);
  void DeleteRow(const std::string& row, std::string_view family, const char* what);

  std::shared_ptr<store::Connection> connection_;
  SystemTableOptions                 options_;
};

} // namespace backupmeta::backup
