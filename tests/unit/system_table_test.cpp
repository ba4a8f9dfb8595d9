#include "internal/backup/system_table.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/backup/key_codec.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace backupmeta;
using backup::BackupSystemTable;
using backup::SystemTableOptions;
using store::memory::MemoryConnection;

const std::string kRoot = "hdfs://nn/backup";

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

v1::BackupInfo MakeInfo(const std::string& id, v1::BackupState state) {
  v1::BackupInfo info;
  info.set_backup_id(id);
  info.set_state(state);
  info.set_type(v1::BACKUP_TYPE_FULL);
  info.set_backup_root_dir(kRoot);
  info.add_tables("ns:orders");
  return info;
}

// Writes a raw cell into the system table, bypassing the accessors.
void PutRaw(MemoryConnection& conn, const std::string& row, std::string_view qualifier, const std::string& value) {
  auto            table = conn.GetTable("backup:system");
  store::Mutation put;
  put.row = row;
  put.AddColumn(std::string(backup::kMetaFamily), std::string(qualifier), value);
  assert(table->Put(put));
}

/*
  Admin that reports the table as present but never available.
*/
class NeverAvailableAdmin final : public store::Admin {
 public:
  bool TableExists(const std::string&) override {
    return true;
  }
  store::Result CreateTable(const store::TableDescriptor&) override {
    return store::Result::Ok();
  }
  bool IsTableAvailable(const std::string&) override {
    ++probes;
    return false;
  }

  int probes = 0;
};

class NeverAvailableConnection final : public store::Connection {
 public:
  std::unique_ptr<store::Admin> GetAdmin() override {
    return std::make_unique<NeverAvailableAdmin>();
  }
  std::unique_ptr<store::Table> GetTable(const std::string& name) override {
    throw store::StoreError(store::ErrorCode::NotFound, "table not found: " + name);
  }
  bool IsClosed() const override {
    return false;
  }
  void Close() override {
  }
};

void TestProvisioningCreatesTableOnce() {
  auto conn = std::make_shared<MemoryConnection>();

  SystemTableOptions options;
  options.session_ttl_seconds = 3600;
  BackupSystemTable first(conn, options);
  assert(conn->GetAdmin()->TableExists("backup:system"));

  // a second instance finds the table and leaves its data alone
  first.WriteBackupStartCode("42", kRoot);
  BackupSystemTable second(conn, options);
  assert(second.ReadBackupStartCode(kRoot) == std::optional<std::string>("42"));

  const auto descriptor = BackupSystemTable::SystemTableDescriptor(options);
  assert(descriptor.families.size() == 2);
  assert(descriptor.families[0].name == "session");
  assert(descriptor.families[0].ttl_seconds == 3600);
  assert(descriptor.families[1].name == "meta");
  assert(descriptor.families[1].ttl_seconds == 0);
}

void TestProvisioningTimesOut() {
  SystemTableOptions options;
  options.availability_timeout = std::chrono::milliseconds(30);
  options.poll_interval        = std::chrono::milliseconds(5);

  const auto start = std::chrono::steady_clock::now();
  assert(Throws<util::StoreUnavailable>(
      [&] { BackupSystemTable table(std::make_shared<NeverAvailableConnection>(), options); }));
  assert(std::chrono::steady_clock::now() - start >= options.availability_timeout);
}

void TestSessions() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  assert(!table.ReadBackupInfo("backup_1").has_value());
  assert(!table.HasBackupSessions());

  table.UpdateBackupInfo(MakeInfo("backup_1", v1::BACKUP_STATE_RUNNING));
  assert(table.HasBackupSessions());

  auto info = table.ReadBackupInfo("backup_1");
  assert(info.has_value());
  assert(info->state() == v1::BACKUP_STATE_RUNNING);

  // update overwrites in place
  table.UpdateBackupInfo(MakeInfo("backup_1", v1::BACKUP_STATE_COMPLETE));
  assert(table.ReadBackupInfo("backup_1")->state() == v1::BACKUP_STATE_COMPLETE);

  table.UpdateBackupInfo(MakeInfo("backup_2", v1::BACKUP_STATE_FAILED));
  assert(table.GetBackupInfos().size() == 2);
  assert(table.GetBackupInfos(v1::BACKUP_STATE_FAILED).size() == 1);
  assert(table.GetBackupInfos(v1::BACKUP_STATE_FAILED)[0].backup_id() == "backup_2");
  assert(table.GetBackupInfos(v1::BACKUP_STATE_CANCELLED).empty());

  table.DeleteBackupInfo("backup_1");
  assert(!table.ReadBackupInfo("backup_1").has_value());
  table.DeleteBackupInfo("backup_1");

  assert(Throws<util::InvalidArgument>([&] { table.UpdateBackupInfo(v1::BackupInfo{}); }));

  assert(conn->OpenTableHandles() == 0);
  assert(conn->OpenScanners() == 0);
}

void TestSessionsExpireWithTtl() {
  int64_t           now  = 5000000;
  auto              conn = std::make_shared<MemoryConnection>([&now] { return now; });
  SystemTableOptions options;
  options.session_ttl_seconds = 60;
  BackupSystemTable table(conn, options);

  table.UpdateBackupInfo(MakeInfo("backup_1", v1::BACKUP_STATE_COMPLETE));
  table.WriteBackupStartCode("7", kRoot);

  now += 61 * 1000;
  assert(!table.ReadBackupInfo("backup_1").has_value());
  assert(!table.HasBackupSessions());
  // meta rows never expire
  assert(table.ReadBackupStartCode(kRoot) == std::optional<std::string>("7"));
}

void TestStartCode() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  assert(!table.ReadBackupStartCode(kRoot).has_value());

  table.WriteBackupStartCode("1700000000000", kRoot);
  assert(table.ReadBackupStartCode(kRoot) == std::optional<std::string>("1700000000000"));
  assert(!table.ReadBackupStartCode("/other").has_value());

  // resetting writes an empty value, which reads back as absent
  table.WriteBackupStartCode(kRoot);
  assert(!table.ReadBackupStartCode(kRoot).has_value());

  const std::string bad_root = "a" + std::string(backup::kDelimiter) + "b";
  assert(Throws<util::InvalidArgument>([&] { table.WriteBackupStartCode("1", bad_root); }));
  assert(Throws<util::InvalidArgument>([&] { table.ReadBackupStartCode(bad_root); }));
}

void TestLastLogRollResults() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  table.WriteRegionServerLastLogRollResult("rs1:16020", 100, "root");
  table.WriteRegionServerLastLogRollResult("rs2:16020", 200, "root");
  table.WriteRegionServerLastLogRollResult("rs1:16020", 999, "root2");
  // overwrite
  table.WriteRegionServerLastLogRollResult("rs1:16020", 150, "root");

  auto result = table.ReadRegionServerLastLogRollResult("root");
  assert(result.size() == 2);
  assert(result.at("rs1:16020") == 150);
  assert(result.at("rs2:16020") == 200);

  // "root" is a prefix of "root2" but their rows stay apart
  auto other = table.ReadRegionServerLastLogRollResult("root2");
  assert(other.size() == 1);
  assert(other.at("rs1:16020") == 999);

  assert(table.ReadRegionServerLastLogRollResult("absent").empty());

  const std::string row = backup::Encode(backup::kRsLogTimestampPrefix, {"broken", backup::kDelimiter, "rs9:1"});
  PutRaw(*conn, row, backup::kRsLogTsQualifier, "1234567");
  assert(Throws<util::MalformedData>([&] { table.ReadRegionServerLastLogRollResult("broken"); }));

  assert(conn->OpenTableHandles() == 0);
  assert(conn->OpenScanners() == 0);
}

void TestLogTimestampMap() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  backup::ServerTimestamps timestamps = {{"rs1:16020", 10}, {"rs2:16020", 20}};
  table.WriteRegionServerLogTimestamp({"ns:orders", "ns:customers"}, timestamps, "root");
  table.WriteRegionServerLogTimestamp({"ns:orders"}, {{"rs1:16020", 99}}, "root2");

  auto map = table.ReadLogTimestampMap("root");
  assert(map.size() == 2);
  assert(map.at("ns:orders") == timestamps);
  assert(map.at("ns:customers") == timestamps);

  auto other = table.ReadLogTimestampMap("root2");
  assert(other.size() == 1);
  assert(other.at("ns:orders").at("rs1:16020") == 99);

  assert(table.ReadLogTimestampMap("absent").empty());

  assert(Throws<util::InvalidArgument>([&] { table.WriteRegionServerLogTimestamp({"t"}, {{"not-a-server", 1}}, "root"); }));

  const std::string row = backup::Encode(backup::kTableRsLogMapPrefix, {"broken", backup::kDelimiter, "t"});
  PutRaw(*conn, row, backup::kLogRollMapQualifier, "");
  assert(Throws<util::MalformedData>([&] { table.ReadLogTimestampMap("broken"); }));

  assert(conn->OpenTableHandles() == 0);
  assert(conn->OpenScanners() == 0);
}

void TestIncrementalTableSet() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  assert(table.GetIncrementalBackupTableSet(kRoot).empty());

  table.AddIncrementalBackupTableSet({"ns:b", "ns:a"}, kRoot);
  table.AddIncrementalBackupTableSet({"ns:c", "ns:a"}, kRoot);

  auto tables = table.GetIncrementalBackupTableSet(kRoot);
  assert((tables == std::set<std::string>{"ns:a", "ns:b", "ns:c"}));
  assert(table.GetIncrementalBackupTableSet("/other").empty());

  table.DeleteIncrementalBackupTableSet(kRoot);
  assert(table.GetIncrementalBackupTableSet(kRoot).empty());

  assert(conn->OpenTableHandles() == 0);
}

void TestDeletesKeepOtherFamilies() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  auto HasMetaCell = [&](const std::string& row) {
    auto              handle = conn->GetTable(table.TableName());
    store::GetRequest get;
    get.row    = row;
    get.family = std::string(backup::kMetaFamily);
    return !handle->Get(get).Empty();
  };

  const auto session_row = backup::Encode(backup::kBackupInfoPrefix, {"backup_1"});
  table.UpdateBackupInfo(MakeInfo("backup_1", v1::BACKUP_STATE_COMPLETE));
  PutRaw(*conn, session_row, "note", "kept");

  table.DeleteBackupInfo("backup_1");
  assert(!table.ReadBackupInfo("backup_1").has_value());
  assert(HasMetaCell(session_row));

  // a sessions-family cell on a meta row survives meta deletes
  const auto set_row = backup::Encode(backup::kBackupSetPrefix, {"s"});
  table.AddToBackupSet("s", {"t1"});
  {
    auto            handle = conn->GetTable(table.TableName());
    store::Mutation put;
    put.row = set_row;
    put.AddColumn(std::string(backup::kSessionsFamily), "note", "kept");
    assert(handle->Put(put));
  }
  table.DeleteBackupSet("s");
  assert(!table.DescribeBackupSet("s").has_value());
  {
    auto              handle = conn->GetTable(table.TableName());
    store::GetRequest get;
    get.row    = set_row;
    get.family = std::string(backup::kSessionsFamily);
    assert(!handle->Get(get).Empty());
  }

  assert(conn->OpenTableHandles() == 0);
}

void TestStoreFailuresPropagate() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  conn->Close();
  assert(Throws<store::StoreError>([&] { table.ReadBackupInfo("backup_1"); }));
  assert(Throws<store::StoreError>([&] { table.WriteBackupStartCode("1", kRoot); }));
}

} // namespace

int main() {
  TestProvisioningCreatesTableOnce();
  TestProvisioningTimesOut();
  TestSessions();
  TestSessionsExpireWithTtl();
  TestStartCode();
  TestLastLogRollResults();
  TestLogTimestampMap();
  TestIncrementalTableSet();
  TestDeletesKeepOtherFamilies();
  TestStoreFailuresPropagate();

  std::cout << "backupmeta_unit_system_table: pass\n";
  return 0;
}
