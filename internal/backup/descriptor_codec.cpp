#include "internal/backup/descriptor_codec.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace backupmeta::backup {

std::string SerializeBackupInfo(const v1::BackupInfo& info) {
  if (info.backup_id().empty()) {
    throw util::InvalidArgument("backup info without backup id");
  }

  std::string data;
  if (!info.SerializeToString(&data)) {
    throw util::InvalidArgument("failed to serialize backup info " + info.backup_id());
  }
  return data;
}

v1::BackupInfo ParseBackupInfo(std::string_view data) {
  v1::BackupInfo info;
  if (data.empty() || !info.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
    throw util::MalformedData("stored backup session descriptor cannot be decoded");
  }
  if (info.backup_id().empty()) {
    throw util::MalformedData("stored backup session descriptor has no backup id");
  }
  return info;
}

v1::ServerName ParseServerName(std::string_view server) {
  const auto colon = server.rfind(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == server.size()) {
    throw util::InvalidArgument("server name must be host:port, got '" + std::string(server) + "'");
  }

  const auto port_text = server.substr(colon + 1);
  uint32_t   port      = 0;
  auto [end, ec]       = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc() || end != port_text.data() + port_text.size() || port > 65535) {
    throw util::InvalidArgument("invalid port in server name '" + std::string(server) + "'");
  }

  v1::ServerName name;
  name.set_host_name(std::string(server.substr(0, colon)));
  name.set_port(port);
  return name;
}

std::string FormatServerName(const v1::ServerName& server) {
  return server.host_name() + ":" + std::to_string(server.port());
}

std::string EncodeTableServerTimestamps(const std::string& table, const ServerTimestamps& timestamps) {
  v1::TableServerTimestamp proto;
  proto.set_table_name(table);
  for (const auto& [server, ts] : timestamps) {
    auto* entry = proto.add_server_timestamp();
    *entry->mutable_server_name() = ParseServerName(server);
    entry->set_timestamp(ts);
  }

  std::string data;
  if (!proto.SerializeToString(&data)) {
    throw util::InvalidArgument("failed to serialize server timestamps for " + table);
  }
  return data;
}

ServerTimestamps DecodeTableServerTimestamps(std::string_view data) {
  if (data.empty()) {
    throw util::MalformedData("log timestamp map is empty; create a backup first");
  }

  v1::TableServerTimestamp proto;
  if (!proto.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
    throw util::MalformedData("log timestamp map cannot be decoded");
  }

  ServerTimestamps timestamps;
  for (const auto& entry : proto.server_timestamp()) {
    timestamps[FormatServerName(entry.server_name())] = entry.timestamp();
  }
  return timestamps;
}

std::string EncodeLong(int64_t value) {
  const auto  bits = static_cast<uint64_t>(value);
  std::string out(8, '\0');
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<char>((bits >> (56 - 8 * i)) & 0xFF);
  }
  return out;
}

int64_t DecodeLong(std::string_view data) {
  if (data.size() != 8) {
    throw util::MalformedData("expected an 8-byte timestamp, got " + std::to_string(data.size()) + " bytes");
  }
  uint64_t bits = 0;
  for (char c : data) {
    bits = (bits << 8) | static_cast<unsigned char>(c);
  }
  return static_cast<int64_t>(bits);
}

std::string EncodeTableList(const std::vector<std::string>& tables) {
  std::string out;
  for (std::size_t i = 0; i < tables.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += tables[i];
  }
  return out;
}

std::vector<std::string> DecodeTableList(std::string_view data) {
  std::vector<std::string> tables;
  if (data.empty()) {
    return tables;
  }

  std::size_t start = 0;
  while (true) {
    const auto comma = data.find(',', start);
    if (comma == std::string_view::npos) {
      tables.emplace_back(data.substr(start));
      break;
    }
    tables.emplace_back(data.substr(start, comma - start));
    start = comma + 1;
  }
  return tables;
}

} // namespace backupmeta::backup
