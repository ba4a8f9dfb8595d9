#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "backupmeta/v1.hpp"

namespace backupmeta::backup {

/*
  Value codecs for the system table.

  Session descriptors and table->server->timestamp maps are protobuf
  messages; log timestamps are 8-byte big-endian integers; backup sets are
  comma-joined table names. Decoders throw util::MalformedData on payloads a
  writer could not have produced.
*/

using ServerTimestamps = std::map<std::string, int64_t>;

std::string    SerializeBackupInfo(const v1::BackupInfo& info);
v1::BackupInfo ParseBackupInfo(std::string_view data);

// servers are "host:port"; throws util::InvalidArgument otherwise
std::string      EncodeTableServerTimestamps(const std::string& table, const ServerTimestamps& timestamps);
ServerTimestamps DecodeTableServerTimestamps(std::string_view data);

v1::ServerName ParseServerName(std::string_view server);
std::string    FormatServerName(const v1::ServerName& server);

std::string EncodeLong(int64_t value);
int64_t     DecodeLong(std::string_view data);

std::string              EncodeTableList(const std::vector<std::string>& tables);
std::vector<std::string> DecodeTableList(std::string_view data);

} // namespace backupmeta::backup
