#pragma once

#include <string>
#include <vector>

namespace backupmeta::backup {

/*
  Order-preserving set operations on table lists.

  Used by the backup-set read-modify-write protocol; both are pure.
*/

// `existing` in its order, then each element of `incoming` not yet present.
std::vector<std::string> Union(const std::vector<std::string>& existing, const std::vector<std::string>& incoming);

// `existing` without any element found in `to_remove`, order kept.
std::vector<std::string> Difference(const std::vector<std::string>& existing, const std::vector<std::string>& to_remove);

} // namespace backupmeta::backup
