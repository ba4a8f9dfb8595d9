#include "internal/backup/key_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace backupmeta::backup;
using backupmeta::util::InvalidArgument;
using backupmeta::util::MalformedData;

const std::string kDelim(kDelimiter);

void TestEncodeConcatenatesWithoutSeparators() {
  assert(Encode(kBackupInfoPrefix, {"backup_1"}) == "session:backup_1");
  assert(Encode(kStartCodePrefix) == "startcode:");

  const auto key = Encode(kRsLogTimestampPrefix, {"hdfs://nn/backup", kDelimiter, "rs1:16020"});
  assert(key.size() == std::string("rslogts:hdfs://nn/backup").size() + 1 + std::string("rs1:16020").size());
  assert(key == "rslogts:hdfs://nn/backup" + kDelim + "rs1:16020");
}

void TestDecodeSuffixRecoversLastComponent() {
  for (const std::string root : {"r", "/backup/root", "hdfs://nn:8020/b"}) {
    for (const std::string table : {"t", "ns:orders", "a.b.c"}) {
      const auto key = Encode(kTableRsLogMapPrefix, {root, kDelimiter, table});
      assert(DecodeSuffix(key) == table);
    }
  }

  // no delimiter: the whole key
  assert(DecodeSuffix("session:backup_1") == "session:backup_1");
  // trailing delimiter: empty suffix
  assert(DecodeSuffix("trslm:root" + kDelim).empty());
}

void TestStripPrefix() {
  assert(StripPrefix("backupset:nightly", kBackupSetPrefix) == "nightly");
  assert(StripPrefix("backupset:", kBackupSetPrefix).empty());

  bool threw = false;
  try {
    (void)StripPrefix("session:x", kBackupSetPrefix);
  } catch (const MalformedData&) {
    threw = true;
  }
  assert(threw);
}

void TestPrefixRangeBound() {
  const auto range = PrefixRangeBound(kBackupSetPrefix);
  assert(range.start == "backupset:");
  assert(range.stop == "backupset;");

  // keys of the family fall inside [start, stop), neighbours do not
  const std::string inside = Encode(kBackupSetPrefix, {"\xff\xff"});
  assert(range.start <= inside && inside < range.stop);
  const std::string neighbour = "backupsets";
  assert(!(range.start <= neighbour && neighbour < range.stop));
  assert(std::string("backupset") < range.start);

  // a delimiter-terminated prefix bounds exactly one root
  const auto root_range = PrefixRangeBound(Encode(kRsLogTimestampPrefix, {"root", kDelimiter}));
  assert(root_range.stop == "rslogts:root\x01");
  const auto other_root = Encode(kRsLogTimestampPrefix, {"root2", kDelimiter, "rs1:1"});
  assert(!(root_range.start <= other_root && other_root < root_range.stop));

  bool threw = false;
  try {
    (void)PrefixRangeBound("");
  } catch (const InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestUniqueWalFileName() {
  assert(UniqueWalFileName("hdfs://nn/hbase/WALs/rs1/rs1%2C16020.1700000000000") == "rs1%2C16020.1700000000000");
  assert(UniqueWalFileName("plain.log") == "plain.log");
  assert(UniqueWalFileName("/dir/").empty());
}

void TestKeyComponentValidation() {
  assert(IsValidKeyComponent("ns:table"));
  assert(IsValidKeyComponent(""));
  assert(!IsValidKeyComponent("bad" + kDelim + "root"));

  RequireValidKeyComponent("root", "/backup");

  bool threw = false;
  try {
    RequireValidKeyComponent("root", "a" + kDelim);
  } catch (const InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeConcatenatesWithoutSeparators();
  TestDecodeSuffixRecoversLastComponent();
  TestStripPrefix();
  TestPrefixRangeBound();
  TestUniqueWalFileName();
  TestKeyComponentValidation();

  std::cout << "backupmeta_unit_key_codec: pass\n";
  return 0;
}
