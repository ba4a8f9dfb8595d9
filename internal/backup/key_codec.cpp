#include "internal/backup/key_codec.hpp"

#include "internal/util/errors.hpp"

namespace backupmeta::backup {

std::string Encode(std::string_view prefix, std::initializer_list<std::string_view> parts) {
  std::size_t size = prefix.size();
  for (auto part : parts) {
    size += part.size();
  }

  std::string key;
  key.reserve(size);
  key.append(prefix);
  for (auto part : parts) {
    key.append(part);
  }
  return key;
}

std::string DecodeSuffix(std::string_view key) {
  const auto index = key.rfind(kDelimiter);
  if (index == std::string_view::npos) {
    return std::string(key);
  }
  return std::string(key.substr(index + 1));
}

std::string StripPrefix(std::string_view key, std::string_view prefix) {
  if (key.substr(0, prefix.size()) != prefix) {
    throw util::MalformedData("row key does not belong to family '" + std::string(prefix) + "'");
  }
  return std::string(key.substr(prefix.size()));
}

KeyRange PrefixRangeBound(std::string_view prefix) {
  if (prefix.empty()) {
    throw util::InvalidArgument("prefix range of an empty prefix");
  }

  KeyRange range;
  range.start = std::string(prefix);
  range.stop  = range.start;

  auto& last = range.stop.back();
  last       = static_cast<char>(static_cast<unsigned char>(last) + 1);
  return range;
}

std::string UniqueWalFileName(std::string_view wal_path) {
  const auto index = wal_path.rfind('/');
  if (index == std::string_view::npos) {
    return std::string(wal_path);
  }
  return std::string(wal_path.substr(index + 1));
}

bool IsValidKeyComponent(std::string_view part) {
  return part.find(kDelimiter) == std::string_view::npos;
}

void RequireValidKeyComponent(std::string_view what, std::string_view part) {
  if (!IsValidKeyComponent(part)) {
    throw util::InvalidArgument(std::string(what) + " must not contain the NUL key delimiter");
  }
}

} // namespace backupmeta::backup
