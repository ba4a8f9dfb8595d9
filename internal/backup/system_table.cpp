#include "internal/backup/system_table.hpp"

#include <thread>
#include <utility>

#include "internal/backup/key_codec.hpp"
#include "internal/backup/set_algebra.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backupmeta::backup {

namespace {

using observability::IntField;
using observability::StringField;

std::string Joined(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) out += ' ';
    out += value;
  }
  return out;
}

std::string Joined(const std::set<std::string>& values) {
  return Joined(std::vector<std::string>(values.begin(), values.end()));
}

void RequireValidTableNames(const std::vector<std::string>& tables) {
  for (const auto& table : tables) {
    if (table.empty()) {
      throw util::InvalidArgument("table name must not be empty");
    }
    RequireValidKeyComponent("table", table);
    if (table.find(',') != std::string::npos) {
      throw util::InvalidArgument("table name must not contain ',': " + table);
    }
  }
}

std::string SessionRow(const std::string& backup_id) {
  return Encode(kBackupInfoPrefix, {backup_id});
}

std::string StartCodeRow(const std::string& root) {
  return Encode(kStartCodePrefix, {root});
}

std::string IncrementalSetRow(const std::string& root) {
  return Encode(kIncrBackupSetPrefix, {root});
}

std::string WalRow(const std::string& file) {
  return Encode(kWalsPrefix, {UniqueWalFileName(file)});
}

std::string BackupSetRow(const std::string& name) {
  return Encode(kBackupSetPrefix, {name});
}

store::GetRequest MetaGet(std::string row) {
  store::GetRequest get;
  get.row    = std::move(row);
  get.family = std::string(kMetaFamily);
  return get;
}

} // namespace

BackupSystemTable::BackupSystemTable(std::shared_ptr<store::Connection> connection, SystemTableOptions options)
    : connection_(std::move(connection)), options_(std::move(options)) {
  if (!connection_) {
    throw util::InvalidArgument("backup system table requires a store connection");
  }
  CheckSystemTable();
}

store::TableDescriptor BackupSystemTable::SystemTableDescriptor(const SystemTableOptions& options) {
  store::TableDescriptor descriptor;
  descriptor.name = options.table_name;

  store::ColumnFamilyDescriptor sessions;
  sessions.name         = std::string(kSessionsFamily);
  sessions.max_versions = 1;
  sessions.ttl_seconds  = options.session_ttl_seconds;
  descriptor.families.push_back(std::move(sessions));

  store::ColumnFamilyDescriptor meta;
  meta.name = std::string(kMetaFamily);
  descriptor.families.push_back(std::move(meta));

  return descriptor;
}

// ------------------------------------------------------------
// Provisioning
// ------------------------------------------------------------

void BackupSystemTable::CheckSystemTable() {
  auto admin = connection_->GetAdmin();

  if (!admin->TableExists(options_.table_name)) {
    BACKUPMETA_LOG_INFO("creating backup system table", {StringField("table", options_.table_name),
                                                         IntField("session_ttl_seconds", options_.session_ttl_seconds)});
    auto result = admin->CreateTable(SystemTableDescriptor(options_));
    // another process may have won the race
    if (result.code != store::ErrorCode::AlreadyExists) {
      store::ThrowIfError(result, "create backup system table");
    }
  }

  WaitForSystemTable(*admin);
}

void BackupSystemTable::WaitForSystemTable(store::Admin& admin) const {
  const auto start = std::chrono::steady_clock::now();

  while (!admin.TableExists(options_.table_name) || !admin.IsTableAvailable(options_.table_name)) {
    std::this_thread::sleep_for(options_.poll_interval);
    if (std::chrono::steady_clock::now() - start > options_.availability_timeout) {
      throw util::StoreUnavailable("backup system table '" + options_.table_name + "' not available after " +
                                   std::to_string(options_.availability_timeout.count()) + "ms");
    }
  }

  BACKUPMETA_LOG_DEBUG("backup system table exists and is available", {StringField("table", options_.table_name)});
}

// ------------------------------------------------------------
// Store helpers
// ------------------------------------------------------------

std::unique_ptr<store::Table> BackupSystemTable::OpenTable() const {
  return connection_->GetTable(options_.table_name);
}

template <typename Fn>
void BackupSystemTable::ScanPrefix(const std::string& prefix, std::string_view family, int caching, Fn&& fn) const {
  const auto range = PrefixRangeBound(prefix);

  store::ScanSpec spec;
  spec.start_row = range.start;
  spec.stop_row  = range.stop;
  spec.family    = std::string(family);
  spec.caching   = caching;

  auto table   = OpenTable();
  auto scanner = table->GetScanner(spec);
  while (auto row = scanner->Next()) {
    if (!fn(*row)) {
      break;
    }
  }
  scanner->Close();
  table->Close();
}

void BackupSystemTable::Put(const store::Mutation& mutation, const char* what) {
  auto table = OpenTable();
  store::ThrowIfError(table->Put(mutation), what);
}

void BackupSystemTable::DeleteRow(const std::string& row, std::string_view family, const char* what) {
  auto table = OpenTable();
  store::ThrowIfError(table->Delete(store::DeleteRequest{row, std::string(family)}), what);
}

// ------------------------------------------------------------
// Backup sessions
// ------------------------------------------------------------

void BackupSystemTable::UpdateBackupInfo(const v1::BackupInfo& info) {
  BACKUPMETA_LOG_TRACE("update backup status", {StringField("backup_id", info.backup_id()),
                                                StringField("state", v1::BackupState_Name(info.state()))});

  store::Mutation put;
  put.row = SessionRow(info.backup_id());
  put.AddColumn(std::string(kSessionsFamily), std::string(kContextQualifier), SerializeBackupInfo(info));
  Put(put, "update backup info");
}

std::optional<v1::BackupInfo> BackupSystemTable::ReadBackupInfo(const std::string& backup_id) const {
  BACKUPMETA_LOG_TRACE("read backup status", {StringField("backup_id", backup_id)});

  store::GetRequest get;
  get.row    = SessionRow(backup_id);
  get.family = std::string(kSessionsFamily);

  auto table = OpenTable();
  auto row   = table->Get(get);
  if (row.Empty()) {
    return std::nullopt;
  }
  const auto* cell = row.Find(kSessionsFamily, kContextQualifier);
  if (cell == nullptr) {
    return std::nullopt;
  }
  return ParseBackupInfo(cell->value);
}

void BackupSystemTable::DeleteBackupInfo(const std::string& backup_id) {
  BACKUPMETA_LOG_TRACE("delete backup status", {StringField("backup_id", backup_id)});
  DeleteRow(SessionRow(backup_id), kSessionsFamily, "delete backup info");
}

std::vector<v1::BackupInfo> BackupSystemTable::GetBackupInfos(std::optional<v1::BackupState> state) const {
  BACKUPMETA_LOG_TRACE("get backup infos",
                       {StringField("state", state ? v1::BackupState_Name(*state) : std::string("ANY"))});

  std::vector<v1::BackupInfo> infos;
  ScanPrefix(std::string(kBackupInfoPrefix), kSessionsFamily, store::ScanSpec{}.caching, [&](const store::Row& row) {
    const auto* cell = row.Find(kSessionsFamily, kContextQualifier);
    if (cell == nullptr) {
      return true;
    }
    auto info = ParseBackupInfo(cell->value);
    if (!state || info.state() == *state) {
      infos.push_back(std::move(info));
    }
    return true;
  });
  return infos;
}

bool BackupSystemTable::HasBackupSessions() const {
  BACKUPMETA_LOG_TRACE("has backup sessions");

  bool found = false;
  ScanPrefix(std::string(kBackupInfoPrefix), kSessionsFamily, 1, [&](const store::Row&) {
    found = true;
    return false;
  });
  return found;
}

// ------------------------------------------------------------
// Start codes
// ------------------------------------------------------------

std::optional<std::string> BackupSystemTable::ReadBackupStartCode(const std::string& root) const {
  BACKUPMETA_LOG_TRACE("read backup start code", {StringField("root", root)});
  RequireValidKeyComponent("backup root", root);

  auto table = OpenTable();
  auto row   = table->Get(MetaGet(StartCodeRow(root)));
  const auto* cell = row.Find(kMetaFamily, kStartCodeQualifier);
  if (cell == nullptr || cell->value.empty()) {
    return std::nullopt;
  }
  return cell->value;
}

void BackupSystemTable::WriteBackupStartCode(const std::string& start_code, const std::string& root) {
  BACKUPMETA_LOG_TRACE("write backup start code", {StringField("root", root), StringField("start_code", start_code)});
  RequireValidKeyComponent("backup root", root);

  store::Mutation put;
  put.row = StartCodeRow(root);
  put.AddColumn(std::string(kMetaFamily), std::string(kStartCodeQualifier), start_code);
  Put(put, "write backup start code");
}

void BackupSystemTable::WriteBackupStartCode(const std::string& root) {
  WriteBackupStartCode(std::string(), root);
}

// ------------------------------------------------------------
// Log timestamps
// ------------------------------------------------------------

void BackupSystemTable::WriteRegionServerLastLogRollResult(const std::string& server, int64_t timestamp,
                                                           const std::string& root) {
  BACKUPMETA_LOG_TRACE("write server last log roll result",
                       {StringField("root", root), StringField("server", server), IntField("timestamp", timestamp)});
  RequireValidKeyComponent("backup root", root);
  RequireValidKeyComponent("server", server);

  store::Mutation put;
  put.row = Encode(kRsLogTimestampPrefix, {root, kDelimiter, server});
  put.AddColumn(std::string(kMetaFamily), std::string(kRsLogTsQualifier), EncodeLong(timestamp));
  Put(put, "write server last log roll result");
}

ServerTimestamps BackupSystemTable::ReadRegionServerLastLogRollResult(const std::string& root) const {
  BACKUPMETA_LOG_TRACE("read server last log roll results", {StringField("root", root)});
  RequireValidKeyComponent("backup root", root);

  ServerTimestamps timestamps;
  ScanPrefix(Encode(kRsLogTimestampPrefix, {root, kDelimiter}), kMetaFamily, store::ScanSpec{}.caching,
             [&](const store::Row& row) {
               const auto* cell = row.Find(kMetaFamily, kRsLogTsQualifier);
               if (cell == nullptr) {
                 throw util::MalformedData("log roll row has no timestamp column");
               }
               timestamps[DecodeSuffix(row.key)] = DecodeLong(cell->value);
               return true;
             });
  return timestamps;
}

void BackupSystemTable::WriteRegionServerLogTimestamp(const std::set<std::string>& tables,
                                                      const ServerTimestamps& timestamps, const std::string& root) {
  BACKUPMETA_LOG_TRACE("write server log timestamps",
                       {StringField("root", root), StringField("tables", Joined(tables)),
                        IntField("servers", static_cast<int64_t>(timestamps.size()))});
  RequireValidKeyComponent("backup root", root);

  std::vector<store::Mutation> puts;
  puts.reserve(tables.size());
  for (const auto& table : tables) {
    if (table.empty()) {
      throw util::InvalidArgument("table name must not be empty");
    }
    RequireValidKeyComponent("table", table);

    store::Mutation put;
    put.row = Encode(kTableRsLogMapPrefix, {root, kDelimiter, table});
    put.AddColumn(std::string(kMetaFamily), std::string(kLogRollMapQualifier),
                  EncodeTableServerTimestamps(table, timestamps));
    puts.push_back(std::move(put));
  }
  if (puts.empty()) {
    return;
  }

  auto handle = OpenTable();
  store::ThrowIfError(handle->Put(puts), "write server log timestamps");
}

std::map<std::string, ServerTimestamps> BackupSystemTable::ReadLogTimestampMap(const std::string& root) const {
  BACKUPMETA_LOG_TRACE("read server log timestamp map", {StringField("root", root)});
  RequireValidKeyComponent("backup root", root);

  std::map<std::string, ServerTimestamps> result;
  ScanPrefix(Encode(kTableRsLogMapPrefix, {root, kDelimiter}), kMetaFamily, store::ScanSpec{}.caching,
             [&](const store::Row& row) {
               const auto* cell = row.Find(kMetaFamily, kLogRollMapQualifier);
               if (cell == nullptr || cell->value.empty()) {
                 throw util::MalformedData("empty log timestamp map for row '" + DecodeSuffix(row.key) + "'");
               }
               result[DecodeSuffix(row.key)] = DecodeTableServerTimestamps(cell->value);
               return true;
             });
  return result;
}

// ------------------------------------------------------------
// Incremental table set
// ------------------------------------------------------------

std::set<std::string> BackupSystemTable::GetIncrementalBackupTableSet(const std::string& root) const {
  BACKUPMETA_LOG_TRACE("get incremental backup table set", {StringField("root", root)});
  RequireValidKeyComponent("backup root", root);

  auto table = OpenTable();
  auto row   = table->Get(MetaGet(IncrementalSetRow(root)));

  std::set<std::string> tables;
  for (const auto& cell : row.cells) {
    // table names are the qualifiers
    tables.insert(cell.qualifier);
  }
  return tables;
}

void BackupSystemTable::AddIncrementalBackupTableSet(const std::set<std::string>& tables, const std::string& root) {
  BACKUPMETA_LOG_TRACE("add incremental backup table set", {StringField("root", root), StringField("tables", Joined(tables))});
  RequireValidKeyComponent("backup root", root);
  if (tables.empty()) {
    return;
  }

  store::Mutation put;
  put.row = IncrementalSetRow(root);
  for (const auto& table : tables) {
    put.AddColumn(std::string(kMetaFamily), table, std::string());
  }
  Put(put, "add incremental backup table set");
}

void BackupSystemTable::DeleteIncrementalBackupTableSet(const std::string& root) {
  BACKUPMETA_LOG_TRACE("delete incremental backup table set", {StringField("root", root)});
  RequireValidKeyComponent("backup root", root);
  DeleteRow(IncrementalSetRow(root), kMetaFamily, "delete incremental backup table set");
}

// ------------------------------------------------------------
// WAL registry
// ------------------------------------------------------------

void BackupSystemTable::AddWALFiles(const std::vector<std::string>& files, const std::string& backup_id,
                                    const std::string& root) {
  BACKUPMETA_LOG_TRACE("add WAL files", {StringField("backup_id", backup_id), StringField("root", root),
                                         IntField("files", static_cast<int64_t>(files.size()))});
  if (files.empty()) {
    return;
  }

  std::vector<store::Mutation> puts;
  puts.reserve(files.size());
  for (const auto& file : files) {
    BACKUPMETA_LOG_DEBUG("add WAL file", {StringField("file", file)});

    store::Mutation put;
    put.row = WalRow(file);
    put.AddColumn(std::string(kMetaFamily), std::string(kWalBackupIdQualifier), backup_id);
    put.AddColumn(std::string(kMetaFamily), std::string(kWalFileQualifier), file);
    put.AddColumn(std::string(kMetaFamily), std::string(kWalRootQualifier), root);
    puts.push_back(std::move(put));
  }

  auto table = OpenTable();
  store::ThrowIfError(table->Put(puts), "add WAL files");
}

WalCursor BackupSystemTable::GetWALFilesIterator(const std::string& root) const {
  BACKUPMETA_LOG_TRACE("get WAL files iterator", {StringField("root", root)});

  const auto range = PrefixRangeBound(kWalsPrefix);

  store::ScanSpec spec;
  spec.start_row = range.start;
  spec.stop_row  = range.stop;
  spec.family    = std::string(kMetaFamily);

  auto table   = OpenTable();
  auto scanner = table->GetScanner(spec);
  return WalCursor(std::move(table), std::move(scanner), root);
}

bool BackupSystemTable::IsWALFileDeletable(const std::string& file) const {
  BACKUPMETA_LOG_TRACE("check if WAL file is backed up", {StringField("file", file)});

  auto table = OpenTable();
  return !table->Get(MetaGet(WalRow(file))).Empty();
}

void BackupSystemTable::DeleteWALFiles(const std::vector<std::string>& files) {
  BACKUPMETA_LOG_TRACE("delete WAL files", {IntField("files", static_cast<int64_t>(files.size()))});

  auto table = OpenTable();
  for (const auto& file : files) {
    store::ThrowIfError(table->Delete(store::DeleteRequest{WalRow(file), std::string(kMetaFamily)}), "delete WAL file " + file);
  }
}

// ------------------------------------------------------------
// Backup sets
// ------------------------------------------------------------

std::vector<std::string> BackupSystemTable::ListBackupSets() const {
  BACKUPMETA_LOG_TRACE("list backup sets");

  std::vector<std::string> names;
  ScanPrefix(std::string(kBackupSetPrefix), kMetaFamily, store::ScanSpec{}.caching, [&](const store::Row& row) {
    names.push_back(StripPrefix(row.key, kBackupSetPrefix));
    return true;
  });
  return names;
}

std::optional<std::vector<std::string>> BackupSystemTable::DescribeBackupSet(const std::string& name) const {
  BACKUPMETA_LOG_TRACE("describe backup set", {StringField("name", name)});

  auto table = OpenTable();
  auto row   = table->Get(MetaGet(BackupSetRow(name)));
  const auto* cell = row.Find(kMetaFamily, kBackupSetTablesColumn);
  if (cell == nullptr) {
    return std::nullopt;
  }
  return DecodeTableList(cell->value);
}

void BackupSystemTable::AddToBackupSet(const std::string& name, const std::vector<std::string>& tables) {
  BACKUPMETA_LOG_TRACE("backup set add", {StringField("name", name), StringField("tables", Joined(tables))});
  RequireValidKeyComponent("backup set", name);
  RequireValidTableNames(tables);

  auto existing = DescribeBackupSet(name).value_or(std::vector<std::string>{});
  auto merged   = Union(existing, tables);
  // an empty set has no row
  if (merged.empty()) {
    BACKUPMETA_LOG_WARN("backup set add with no tables", {StringField("name", name)});
    return;
  }

  store::Mutation put;
  put.row = BackupSetRow(name);
  put.AddColumn(std::string(kMetaFamily), std::string(kBackupSetTablesColumn), EncodeTableList(merged));
  Put(put, "add to backup set");
}

void BackupSystemTable::RemoveFromBackupSet(const std::string& name, const std::vector<std::string>& tables) {
  BACKUPMETA_LOG_TRACE("backup set remove", {StringField("name", name), StringField("tables", Joined(tables))});
  RequireValidKeyComponent("backup set", name);
  RequireValidTableNames(tables);

  auto existing = DescribeBackupSet(name);
  if (!existing) {
    BACKUPMETA_LOG_WARN("backup set not found", {StringField("name", name)});
    return;
  }

  auto remaining = Difference(*existing, tables);
  if (remaining.size() == existing->size()) {
    BACKUPMETA_LOG_WARN("backup set does not contain tables",
                        {StringField("name", name), StringField("tables", Joined(tables))});
    return;
  }

  if (remaining.empty()) {
    BACKUPMETA_LOG_INFO("backup set is empty, deleting", {StringField("name", name)});
    DeleteRow(BackupSetRow(name), kMetaFamily, "delete empty backup set");
    return;
  }

  store::Mutation put;
  put.row = BackupSetRow(name);
  put.AddColumn(std::string(kMetaFamily), std::string(kBackupSetTablesColumn), EncodeTableList(remaining));
  Put(put, "remove from backup set");
}

void BackupSystemTable::DeleteBackupSet(const std::string& name) {
  BACKUPMETA_LOG_TRACE("backup set delete", {StringField("name", name)});
  DeleteRow(BackupSetRow(name), kMetaFamily, "delete backup set");
}

} // namespace backupmeta::backup
