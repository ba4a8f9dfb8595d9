#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace backupmeta::store {

/*
  Value types exchanged with a sorted, column-family key-value store.

  Row keys and qualifiers are arbitrary byte strings held in std::string and
  compare as unsigned bytes. Every engine retains a single version per cell.
*/

struct Cell {
  std::string family;
  std::string qualifier;
  std::string value;
};

// A row as returned by Get / Scan; cells ordered by (family, qualifier).
struct Row {
  std::string       key;
  std::vector<Cell> cells;

  bool Empty() const {
    return cells.empty();
  }

  const Cell* Find(std::string_view family, std::string_view qualifier) const {
    for (const auto& cell : cells) {
      if (cell.family == family && cell.qualifier == qualifier) {
        return &cell;
      }
    }
    return nullptr;
  }
};

// Single-row write; all cells land in one row atomically.
struct Mutation {
  std::string       row;
  std::vector<Cell> cells;

  Mutation& AddColumn(std::string family, std::string qualifier, std::string value) {
    cells.push_back({std::move(family), std::move(qualifier), std::move(value)});
    return *this;
  }
};

// Removes the family from the row, or the whole row when family is unset.
struct DeleteRequest {
  std::string                row;
  std::optional<std::string> family;
};

struct GetRequest {
  std::string                row;
  std::optional<std::string> family;
  int                        max_versions = 1;
};

/*
  Range read over [start_row, stop_row). An empty stop_row means "to the end
  of the table". caching is the number of rows an engine may fetch per round
  trip.
*/
struct ScanSpec {
  std::string                start_row;
  std::string                stop_row;
  std::optional<std::string> family;
  int                        max_versions = 1;
  int                        caching      = 100;
};

struct ColumnFamilyDescriptor {
  std::string name;
  int         max_versions = 1;
  // 0 keeps cells forever
  int64_t ttl_seconds = 0;
};

struct TableDescriptor {
  std::string                         name;
  std::vector<ColumnFamilyDescriptor> families;
};

} // namespace backupmeta::store
