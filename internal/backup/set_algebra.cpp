#include "internal/backup/set_algebra.hpp"

#include <unordered_set>

namespace backupmeta::backup {

std::vector<std::string> Union(const std::vector<std::string>& existing, const std::vector<std::string>& incoming) {
  std::vector<std::string>        merged;
  std::unordered_set<std::string> seen;
  merged.reserve(existing.size() + incoming.size());

  for (const auto& table : existing) {
    if (seen.insert(table).second) {
      merged.push_back(table);
    }
  }
  for (const auto& table : incoming) {
    if (seen.insert(table).second) {
      merged.push_back(table);
    }
  }
  return merged;
}

std::vector<std::string> Difference(const std::vector<std::string>& existing, const std::vector<std::string>& to_remove) {
  const std::unordered_set<std::string> removed(to_remove.begin(), to_remove.end());

  std::vector<std::string> remaining;
  remaining.reserve(existing.size());
  for (const auto& table : existing) {
    if (removed.count(table) == 0) {
      remaining.push_back(table);
    }
  }
  return remaining;
}

} // namespace backupmeta::backup
