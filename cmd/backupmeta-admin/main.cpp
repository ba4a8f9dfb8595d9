#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/descriptor_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using namespace backupmeta;

static void Usage() {
  std::cout << "Usage:\n"
            << "  backupmeta-admin [--config <config.yaml>] history [n]\n"
            << "  backupmeta-admin [--config <config.yaml>] describe <backup_id>\n"
            << "  backupmeta-admin [--config <config.yaml>] sets\n"
            << "  backupmeta-admin [--config <config.yaml>] set-describe <name>\n"
            << "  backupmeta-admin [--config <config.yaml>] set-add <name> <t1,t2,...>\n"
            << "  backupmeta-admin [--config <config.yaml>] set-remove <name> <t1,t2,...>\n"
            << "  backupmeta-admin [--config <config.yaml>] set-delete <name>\n"
            << "  backupmeta-admin [--config <config.yaml>] startcode <root>\n"
            << "  backupmeta-admin [--config <config.yaml>] incr-tables <root>\n"
            << "  backupmeta-admin [--config <config.yaml>] wals [root]\n"
            << "  backupmeta-admin [--config <config.yaml>] wal-deletable <file>\n"
            << "  backupmeta-admin [--config <config.yaml>] has-sessions\n";
}

static void PrintInfo(const v1::BackupInfo& info) {
  std::cout << info.backup_id() << "  " << v1::BackupType_Name(info.type()) << "  " << v1::BackupState_Name(info.state())
            << "  root=" << info.backup_root_dir() << "  start=" << info.start_ts_ms() << "  tables=";
  for (int i = 0; i < info.tables_size(); ++i) {
    std::cout << (i ? "," : "") << info.tables(i);
  }
  std::cout << "\n";
}

static void PrintTables(const std::vector<std::string>& tables) {
  for (const auto& table : tables) {
    std::cout << table << "\n";
  }
}

// Runs one command; std::nullopt means the arguments did not match it.
static std::optional<int> RunCommand(factory::Runtime& runtime, const std::string& cmd, const std::vector<std::string>& args) {
  auto& table   = *runtime.system_table;
  auto& history = *runtime.history;

  if (cmd == "history" && args.size() <= 1) {
    auto infos = args.empty() ? history.GetBackupHistory() : history.GetHistory(std::stoul(args[0]));
    for (const auto& info : infos) PrintInfo(info);
    return 0;
  }

  if (cmd == "describe" && args.size() == 1) {
    auto info = table.ReadBackupInfo(args[0]);
    if (!info) {
      std::cerr << "backup not found: " << args[0] << "\n";
      return 2;
    }
    PrintInfo(*info);
    return 0;
  }

  if (cmd == "sets" && args.empty()) {
    PrintTables(table.ListBackupSets());
    return 0;
  }

  if (cmd == "set-describe" && args.size() == 1) {
    auto tables = table.DescribeBackupSet(args[0]);
    if (!tables) {
      std::cerr << "backup set not found: " << args[0] << "\n";
      return 2;
    }
    PrintTables(*tables);
    return 0;
  }

  if (cmd == "set-add" && args.size() == 2) {
    table.AddToBackupSet(args[0], backup::DecodeTableList(args[1]));
    return 0;
  }

  if (cmd == "set-remove" && args.size() == 2) {
    table.RemoveFromBackupSet(args[0], backup::DecodeTableList(args[1]));
    return 0;
  }

  if (cmd == "set-delete" && args.size() == 1) {
    table.DeleteBackupSet(args[0]);
    return 0;
  }

  if (cmd == "startcode" && args.size() == 1) {
    auto code = table.ReadBackupStartCode(args[0]);
    std::cout << (code ? *code : std::string("<none>")) << "\n";
    return 0;
  }

  if (cmd == "incr-tables" && args.size() == 1) {
    for (const auto& name : table.GetIncrementalBackupTableSet(args[0])) {
      std::cout << name << "\n";
    }
    return 0;
  }

  if (cmd == "wals" && args.size() <= 1) {
    auto cursor = table.GetWALFilesIterator(args.empty() ? std::string() : args[0]);
    while (cursor.HasNext()) {
      auto item = cursor.Next();
      std::cout << item.backup_id << "  " << item.backup_root << "  " << item.wal_file << "\n";
    }
    return 0;
  }

  if (cmd == "wal-deletable" && args.size() == 1) {
    std::cout << (table.IsWALFileDeletable(args[0]) ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "has-sessions" && args.empty()) {
    std::cout << (table.HasBackupSessions() ? "true" : "false") << "\n";
    return 0;
  }

  return std::nullopt;
}

int main(int argc, char** argv) {
  std::vector<std::string> argv_list(argv + 1, argv + argc);

  std::string config_path;
  if (argv_list.size() >= 2 && argv_list[0] == "--config") {
    config_path = argv_list[1];
    argv_list.erase(argv_list.begin(), argv_list.begin() + 2);
  }

  if (argv_list.empty()) {
    Usage();
    return 1;
  }

  const std::string              cmd = argv_list[0];
  const std::vector<std::string> args(argv_list.begin() + 1, argv_list.end());

  std::optional<int> rc;
  try {
    auto runtime_config =
        config_path.empty() ? config::ConfigLoader::Defaults() : config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(runtime_config);

    auto runtime = factory::Build(runtime_config);
    rc           = RunCommand(runtime, cmd, args);
    runtime.connection->Close();
  } catch (const std::exception& e) {
    BACKUPMETA_LOG_ERROR("command failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }

  observability::ShutdownLogging();

  if (!rc) {
    Usage();
    return 1;
  }
  return *rc;
}
