#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/backup/system_table.hpp"
#include "internal/store/memory/memory_store.hpp"

namespace {

void PrintSet(const backupmeta::backup::BackupSystemTable& table, const std::string& name) {
  auto tables = table.DescribeBackupSet(name);
  if (!tables) {
    std::cout << name << ": <absent>\n";
    return;
  }
  std::cout << name << ":";
  for (const auto& t : *tables) {
    std::cout << ' ' << t;
  }
  std::cout << '\n';
}

} // namespace

int main(int argc, char** argv) {
  // Set name can be passed on the command line.
  const std::string name = argc > 1 ? argv[1] : "nightly";

  auto connection = std::make_shared<backupmeta::store::memory::MemoryConnection>();
  backupmeta::backup::BackupSystemTable table(connection);

  // Adding merges with what is already stored; duplicates are dropped.
  table.AddToBackupSet(name, {"orders", "customers"});
  table.AddToBackupSet(name, {"customers", "invoices"});
  PrintSet(table, name);

  // Removing a table that is not a member leaves the set untouched.
  table.RemoveFromBackupSet(name, {"shipments"});
  PrintSet(table, name);

  // Removing the last members deletes the set.
  table.RemoveFromBackupSet(name, {"orders", "customers", "invoices"});
  PrintSet(table, name);

  std::cout << "sets remaining: " << table.ListBackupSets().size() << '\n';

  connection->Close();
  return 0;
}
