#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace backupmeta::backup {

/*
  Row-key schema of the backup system table.

  Seven record families share one physical table; each owns a literal key
  prefix, so every family is a contiguous block in key order. Composite keys
  join root and table/server with a NUL delimiter, which callers must never
  place inside a component.

  This layout is the on-disk contract: changing a prefix, the delimiter or a
  qualifier name is a schema migration.
*/

inline constexpr std::string_view kDelimiter{"\0", 1};

inline constexpr std::string_view kBackupInfoPrefix     = "session:";
inline constexpr std::string_view kStartCodePrefix      = "startcode:";
inline constexpr std::string_view kIncrBackupSetPrefix  = "incrbackupset:";
inline constexpr std::string_view kTableRsLogMapPrefix  = "trslm:";
inline constexpr std::string_view kRsLogTimestampPrefix = "rslogts:";
inline constexpr std::string_view kWalsPrefix           = "wals:";
inline constexpr std::string_view kBackupSetPrefix      = "backupset:";

// column families
inline constexpr std::string_view kSessionsFamily = "session";
inline constexpr std::string_view kMetaFamily     = "meta";

// qualifiers
inline constexpr std::string_view kContextQualifier      = "context";
inline constexpr std::string_view kStartCodeQualifier    = "startcode";
inline constexpr std::string_view kLogRollMapQualifier   = "log-roll-map";
inline constexpr std::string_view kRsLogTsQualifier      = "rs-log-ts";
inline constexpr std::string_view kWalBackupIdQualifier  = "backupId";
inline constexpr std::string_view kWalFileQualifier      = "file";
inline constexpr std::string_view kWalRootQualifier      = "root";
inline constexpr std::string_view kBackupSetTablesColumn = "tables";

// Half-open key range [start, stop).
struct KeyRange {
  std::string start;
  std::string stop;
};

// prefix followed by every part, nothing inserted between them
std::string Encode(std::string_view prefix, std::initializer_list<std::string_view> parts = {});

// Text after the last delimiter; the whole key when there is none.
std::string DecodeSuffix(std::string_view key);

// Key with `prefix` removed; throws util::MalformedData if the key does not start with it.
std::string StripPrefix(std::string_view key, std::string_view prefix);

/*
  Bounds of the block of keys starting with `prefix`: the stop key is the
  prefix with its last byte incremented.

  A trailing 0xFF byte would wrap to 0x00 and yield a wrong range. Family
  prefixes are printable ASCII and the only other trailing byte used is the
  delimiter, so this never happens here; the function is not a general
  successor computation.

  Throws util::InvalidArgument on an empty prefix.
*/
KeyRange PrefixRangeBound(std::string_view prefix);

// Final path component of a WAL path; the registry row id.
std::string UniqueWalFileName(std::string_view wal_path);

bool IsValidKeyComponent(std::string_view part);

// Throws util::InvalidArgument naming `what` if `part` contains the delimiter.
void RequireValidKeyComponent(std::string_view what, std::string_view part);

} // namespace backupmeta::backup
