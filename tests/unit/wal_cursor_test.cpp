#include "internal/backup/wal_cursor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/backup/key_codec.hpp"
#include "internal/backup/system_table.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace backupmeta;
using backup::BackupSystemTable;
using backup::WalCursor;
using backup::WalItem;
using store::memory::MemoryConnection;

struct StoreCalls {
  int scanner_next  = 0;
  int scanner_close = 0;
  int table_close   = 0;
};

/*
  Decorators recording how often the cursor touches its scanner and table.
*/
class SpyScanner final : public store::Scanner {
 public:
  SpyScanner(std::unique_ptr<store::Scanner> inner, StoreCalls& calls) : inner_(std::move(inner)), calls_(calls) {
  }
  std::optional<store::Row> Next() override {
    ++calls_.scanner_next;
    return inner_->Next();
  }
  void Close() override {
    ++calls_.scanner_close;
    inner_->Close();
  }

 private:
  std::unique_ptr<store::Scanner> inner_;
  StoreCalls&                     calls_;
};

class SpyTable final : public store::Table {
 public:
  SpyTable(std::unique_ptr<store::Table> inner, StoreCalls& calls) : inner_(std::move(inner)), calls_(calls) {
  }
  const std::string& Name() const override {
    return inner_->Name();
  }
  store::Result Put(const store::Mutation& mutation) override {
    return inner_->Put(mutation);
  }
  store::Result Put(const std::vector<store::Mutation>& mutations) override {
    return inner_->Put(mutations);
  }
  store::Result Delete(const store::DeleteRequest& request) override {
    return inner_->Delete(request);
  }
  store::Row Get(const store::GetRequest& request) override {
    return inner_->Get(request);
  }
  std::unique_ptr<store::Scanner> GetScanner(const store::ScanSpec& spec) override {
    return std::make_unique<SpyScanner>(inner_->GetScanner(spec), calls_);
  }
  void Close() override {
    ++calls_.table_close;
    inner_->Close();
  }

 private:
  std::unique_ptr<store::Table> inner_;
  StoreCalls&                   calls_;
};

class SpyConnection final : public store::Connection {
 public:
  std::unique_ptr<store::Admin> GetAdmin() override {
    return inner_.GetAdmin();
  }
  std::unique_ptr<store::Table> GetTable(const std::string& name) override {
    return std::make_unique<SpyTable>(inner_.GetTable(name), calls);
  }
  bool IsClosed() const override {
    return inner_.IsClosed();
  }
  void Close() override {
    inner_.Close();
  }

  MemoryConnection& Inner() {
    return inner_;
  }

  StoreCalls calls;

 private:
  MemoryConnection inner_;
};

std::vector<WalItem> Drain(WalCursor& cursor) {
  std::vector<WalItem> items;
  while (cursor.HasNext()) {
    items.push_back(cursor.Next());
  }
  return items;
}

void TestIterationAndIdempotentExhaustion() {
  auto              conn = std::make_shared<SpyConnection>();
  BackupSystemTable table(conn);

  table.AddWALFiles({"hdfs://nn/WALs/rs1/wal.1", "hdfs://nn/WALs/rs1/wal.2"}, "backup_1", "/root");
  conn->calls = {};

  auto cursor = table.GetWALFilesIterator("/root");
  auto items  = Drain(cursor);
  assert(items.size() == 2);
  assert(items[0].backup_id == "backup_1");
  assert(items[0].wal_file == "hdfs://nn/WALs/rs1/wal.1");
  assert(items[0].backup_root == "/root");
  assert(items[1].wal_file == "hdfs://nn/WALs/rs1/wal.2");
  assert(items[0].ToString() == "//root/backup_1/hdfs://nn/WALs/rs1/wal.1");

  assert(cursor.IsExhausted());
  assert(conn->calls.scanner_close == 1);
  assert(conn->calls.table_close == 1);
  assert(conn->Inner().OpenTableHandles() == 0);
  assert(conn->Inner().OpenScanners() == 0);

  // later probes do not touch the store
  const int probes = conn->calls.scanner_next;
  assert(!cursor.HasNext());
  assert(!cursor.HasNext());
  assert(conn->calls.scanner_next == probes);
  assert(conn->calls.scanner_close == 1);
  assert(conn->calls.table_close == 1);

  bool threw = false;
  try {
    (void)cursor.Next();
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

void TestHasNextDoesNotAdvance() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);
  table.AddWALFiles({"/wals/a", "/wals/b"}, "backup_1", "/root");

  auto cursor = table.GetWALFilesIterator();
  assert(cursor.HasNext());
  assert(cursor.HasNext());
  assert(cursor.Next().wal_file == "/wals/a");
  assert(cursor.Next().wal_file == "/wals/b");
  assert(!cursor.HasNext());
}

void TestRootFilter() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  table.AddWALFiles({"/wals/a"}, "backup_1", "/root1");
  table.AddWALFiles({"/wals/b"}, "backup_2", "/root2");
  table.AddWALFiles({"/wals/c"}, "backup_3", "/root1");

  auto only_root1 = table.GetWALFilesIterator("/root1");
  auto items      = Drain(only_root1);
  assert(items.size() == 2);
  assert(items[0].backup_id == "backup_1");
  assert(items[1].backup_id == "backup_3");

  auto all = table.GetWALFilesIterator();
  assert(Drain(all).size() == 3);

  auto none = table.GetWALFilesIterator("/absent");
  assert(!none.HasNext());
  assert(conn->OpenTableHandles() == 0);
}

void TestEmptyRegistry() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  auto cursor = table.GetWALFilesIterator();
  assert(!cursor.HasNext());
  assert(conn->OpenTableHandles() == 0);
  assert(conn->OpenScanners() == 0);
}

void TestEarlyAbandonmentReleases() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);
  table.AddWALFiles({"/wals/a", "/wals/b"}, "backup_1", "/root");

  {
    auto cursor = table.GetWALFilesIterator();
    assert(cursor.HasNext());
    (void)cursor.Next();
    assert(conn->OpenTableHandles() == 1);
    assert(conn->OpenScanners() == 1);
  }
  assert(conn->OpenTableHandles() == 0);
  assert(conn->OpenScanners() == 0);

  auto cursor = table.GetWALFilesIterator();
  cursor.Close();
  assert(conn->OpenTableHandles() == 0);
  assert(!cursor.HasNext());
}

void TestMoveTransfersOwnership() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);
  table.AddWALFiles({"/wals/a"}, "backup_1", "/root");

  auto      source = table.GetWALFilesIterator();
  WalCursor moved(std::move(source));
  assert(conn->OpenTableHandles() == 1);
  assert(moved.HasNext());
  assert(moved.Next().wal_file == "/wals/a");
  assert(!moved.HasNext());
  assert(conn->OpenTableHandles() == 0);
}

void TestMovedFromCursorIsEmpty() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);
  table.AddWALFiles({"/wals/a", "/wals/b"}, "backup_1", "/root");

  // peeked item travels with the move
  auto source = table.GetWALFilesIterator();
  assert(source.HasNext());
  WalCursor moved(std::move(source));
  assert(source.IsExhausted());
  assert(!source.HasNext());
  assert(moved.Next().wal_file == "/wals/a");

  auto other = table.GetWALFilesIterator();
  assert(other.HasNext());
  moved = std::move(other);
  assert(other.IsExhausted());
  assert(!other.HasNext());
  assert(conn->OpenTableHandles() == 1);

  auto items = Drain(moved);
  assert(items.size() == 2);
  assert(items[0].wal_file == "/wals/a");
  assert(conn->OpenTableHandles() == 0);
}

void TestRemoveIsUnsupported() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  auto cursor = table.GetWALFilesIterator();
  bool threw  = false;
  try {
    cursor.Remove();
  } catch (const util::Unsupported&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingColumnIsMalformed() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  {
    auto            handle = conn->GetTable(table.TableName());
    store::Mutation put;
    put.row = backup::Encode(backup::kWalsPrefix, {"wal.broken"});
    put.AddColumn(std::string(backup::kMetaFamily), std::string(backup::kWalFileQualifier), "/wals/wal.broken");
    put.AddColumn(std::string(backup::kMetaFamily), std::string(backup::kWalRootQualifier), "/root");
    assert(handle->Put(put));
  }

  auto cursor = table.GetWALFilesIterator();
  bool threw  = false;
  try {
    (void)cursor.HasNext();
  } catch (const util::MalformedData&) {
    threw = true;
  }
  assert(threw);
}

void TestDeletableAndDelete() {
  auto              conn = std::make_shared<MemoryConnection>();
  BackupSystemTable table(conn);

  table.AddWALFiles({"hdfs://nn/WALs/rs1/wal.1", "hdfs://nn/WALs/rs1/wal.2"}, "backup_1", "/root");

  assert(table.IsWALFileDeletable("hdfs://nn/WALs/rs1/wal.1"));
  // rows are keyed by the final path component
  assert(table.IsWALFileDeletable("/oldWALs/wal.1"));
  assert(!table.IsWALFileDeletable("hdfs://nn/WALs/rs1/wal.3"));

  table.DeleteWALFiles({"hdfs://nn/WALs/rs1/wal.1"});
  assert(!table.IsWALFileDeletable("hdfs://nn/WALs/rs1/wal.1"));
  assert(table.IsWALFileDeletable("hdfs://nn/WALs/rs1/wal.2"));
  assert(conn->OpenTableHandles() == 0);
}

} // namespace

int main() {
  TestIterationAndIdempotentExhaustion();
  TestHasNextDoesNotAdvance();
  TestRootFilter();
  TestEmptyRegistry();
  TestEarlyAbandonmentReleases();
  TestMoveTransfersOwnership();
  TestMovedFromCursorIsEmpty();
  TestRemoveIsUnsupported();
  TestMissingColumnIsMalformed();
  TestDeletableAndDelete();

  std::cout << "backupmeta_unit_wal_cursor: pass\n";
  return 0;
}
