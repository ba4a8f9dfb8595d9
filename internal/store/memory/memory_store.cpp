#include "memory_store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "internal/util/time.hpp"

namespace backupmeta::store::memory {

namespace detail {

struct StoredCell {
  std::string value;
  int64_t     written_at_ms = 0;
};

// (family, qualifier)
using CellKey  = std::pair<std::string, std::string>;
using RowCells = std::map<CellKey, StoredCell>;

struct TableState {
  TableDescriptor                 descriptor;
  std::map<std::string, int64_t>  ttl_ms_by_family;
  std::map<std::string, RowCells> rows;
};

struct MemoryState {
  std::mutex                        mutex;
  std::map<std::string, TableState> tables;
  MemoryConnection::ClockFn         clock;
  bool                              closed        = false;
  std::size_t                       open_tables   = 0;
  std::size_t                       open_scanners = 0;
};

} // namespace detail

namespace {

using detail::MemoryState;
using detail::RowCells;
using detail::TableState;

bool IsExpired(const TableState& table, const std::string& family, const detail::StoredCell& cell, int64_t now_ms) {
  auto it = table.ttl_ms_by_family.find(family);
  if (it == table.ttl_ms_by_family.end() || it->second <= 0) {
    return false;
  }
  return now_ms - cell.written_at_ms > it->second;
}

bool HasFamily(const TableState& table, const std::string& family) {
  return table.ttl_ms_by_family.count(family) > 0;
}

Row Materialize(const TableState& table, const std::string& key, const RowCells& cells, const std::optional<std::string>& family,
                int64_t now_ms) {
  Row row;
  row.key = key;
  for (const auto& [cell_key, stored] : cells) {
    if (family && cell_key.first != *family) {
      continue;
    }
    if (IsExpired(table, cell_key.first, stored, now_ms)) {
      continue;
    }
    row.cells.push_back({cell_key.first, cell_key.second, stored.value});
  }
  return row;
}

TableState& RequireTable(MemoryState& state, const std::string& name) {
  auto it = state.tables.find(name);
  if (it == state.tables.end()) {
    throw StoreError(ErrorCode::NotFound, "table not found: " + name);
  }
  return it->second;
}

class MemoryScanner final : public Scanner {
 public:
  MemoryScanner(std::shared_ptr<MemoryState> state, std::string table, ScanSpec spec)
      : state_(std::move(state)), table_(std::move(table)), spec_(std::move(spec)) {
  }

  ~MemoryScanner() override {
    Close();
  }

  std::optional<Row> Next() override {
    std::scoped_lock lock(state_->mutex);
    if (closed_) {
      throw StoreError(ErrorCode::Closed, "scanner is closed");
    }

    auto&      table = RequireTable(*state_, table_);
    const auto now   = state_->clock();

    auto it = last_key_ ? table.rows.upper_bound(*last_key_) : table.rows.lower_bound(spec_.start_row);
    for (; it != table.rows.end(); ++it) {
      if (!spec_.stop_row.empty() && it->first >= spec_.stop_row) {
        break;
      }
      last_key_ = it->first;
      auto row  = Materialize(table, it->first, it->second, spec_.family, now);
      if (!row.Empty()) {
        return row;
      }
    }
    return std::nullopt;
  }

  void Close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    std::scoped_lock lock(state_->mutex);
    --state_->open_scanners;
  }

 private:
  std::shared_ptr<MemoryState> state_;
  std::string                  table_;
  ScanSpec                     spec_;
  std::optional<std::string>   last_key_;
  bool                         closed_ = false;
};

class MemoryTable final : public Table {
 public:
  MemoryTable(std::shared_ptr<MemoryState> state, std::string name) : state_(std::move(state)), name_(std::move(name)) {
  }

  ~MemoryTable() override {
    Close();
  }

  const std::string& Name() const override {
    return name_;
  }

  Result Put(const Mutation& mutation) override {
    std::scoped_lock lock(state_->mutex);
    return PutLocked(mutation);
  }

  Result Put(const std::vector<Mutation>& mutations) override {
    std::scoped_lock lock(state_->mutex);
    for (const auto& mutation : mutations) {
      auto result = PutLocked(mutation);
      if (!result) {
        return result;
      }
    }
    return Result::Ok();
  }

  Result Delete(const DeleteRequest& request) override {
    std::scoped_lock lock(state_->mutex);
    if (closed_) return Result::Err(ErrorCode::Closed, "table handle is closed");

    auto it = state_->tables.find(name_);
    if (it == state_->tables.end()) return Result::Err(ErrorCode::NotFound, "table not found: " + name_);
    auto& table = it->second;

    if (request.family && !HasFamily(table, *request.family)) {
      return Result::Err(ErrorCode::InvalidArgument, "unknown column family: " + *request.family);
    }

    auto row_it = table.rows.find(request.row);
    if (row_it == table.rows.end()) {
      return Result::Ok();
    }

    if (!request.family) {
      table.rows.erase(row_it);
      return Result::Ok();
    }

    auto& cells = row_it->second;
    for (auto cell_it = cells.begin(); cell_it != cells.end();) {
      if (cell_it->first.first == *request.family) {
        cell_it = cells.erase(cell_it);
      } else {
        ++cell_it;
      }
    }
    if (cells.empty()) {
      table.rows.erase(row_it);
    }
    return Result::Ok();
  }

  Row Get(const GetRequest& request) override {
    std::scoped_lock lock(state_->mutex);
    RequireOpen();
    if (request.max_versions < 1) {
      throw StoreError(ErrorCode::InvalidArgument, "max_versions must be at least 1");
    }

    auto& table = RequireTable(*state_, name_);
    if (request.family && !HasFamily(table, *request.family)) {
      throw StoreError(ErrorCode::InvalidArgument, "unknown column family: " + *request.family);
    }

    auto it = table.rows.find(request.row);
    if (it == table.rows.end()) {
      Row empty;
      empty.key = request.row;
      return empty;
    }
    return Materialize(table, it->first, it->second, request.family, state_->clock());
  }

  std::unique_ptr<Scanner> GetScanner(const ScanSpec& spec) override {
    std::scoped_lock lock(state_->mutex);
    RequireOpen();
    if (spec.max_versions < 1 || spec.caching < 1) {
      throw StoreError(ErrorCode::InvalidArgument, "max_versions and caching must be at least 1");
    }

    auto& table = RequireTable(*state_, name_);
    if (spec.family && !HasFamily(table, *spec.family)) {
      throw StoreError(ErrorCode::InvalidArgument, "unknown column family: " + *spec.family);
    }

    ++state_->open_scanners;
    return std::make_unique<MemoryScanner>(state_, name_, spec);
  }

  void Close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    std::scoped_lock lock(state_->mutex);
    --state_->open_tables;
  }

 private:
  void RequireOpen() const {
    if (closed_) {
      throw StoreError(ErrorCode::Closed, "table handle is closed");
    }
  }

  Result PutLocked(const Mutation& mutation) {
    if (closed_) return Result::Err(ErrorCode::Closed, "table handle is closed");
    if (mutation.cells.empty()) return Result::Err(ErrorCode::InvalidArgument, "mutation has no cells");

    auto it = state_->tables.find(name_);
    if (it == state_->tables.end()) return Result::Err(ErrorCode::NotFound, "table not found: " + name_);
    auto& table = it->second;

    for (const auto& cell : mutation.cells) {
      if (!HasFamily(table, cell.family)) {
        return Result::Err(ErrorCode::InvalidArgument, "unknown column family: " + cell.family);
      }
    }

    const auto now   = state_->clock();
    auto&      cells = table.rows[mutation.row];
    for (const auto& cell : mutation.cells) {
      cells[{cell.family, cell.qualifier}] = detail::StoredCell{cell.value, now};
    }
    return Result::Ok();
  }

  std::shared_ptr<MemoryState> state_;
  std::string                  name_;
  bool                         closed_ = false;
};

class MemoryAdmin final : public Admin {
 public:
  explicit MemoryAdmin(std::shared_ptr<MemoryState> state) : state_(std::move(state)) {
  }

  bool TableExists(const std::string& name) override {
    std::scoped_lock lock(state_->mutex);
    return state_->tables.count(name) > 0;
  }

  Result CreateTable(const TableDescriptor& descriptor) override {
    if (descriptor.name.empty()) return Result::Err(ErrorCode::InvalidArgument, "table name is empty");
    if (descriptor.families.empty()) return Result::Err(ErrorCode::InvalidArgument, "table has no column families");

    std::scoped_lock lock(state_->mutex);
    if (state_->closed) return Result::Err(ErrorCode::Closed, "connection is closed");
    if (state_->tables.count(descriptor.name) > 0) {
      return Result::Err(ErrorCode::AlreadyExists, "table exists: " + descriptor.name);
    }

    TableState table;
    table.descriptor = descriptor;
    for (const auto& family : descriptor.families) {
      if (family.max_versions != 1) {
        return Result::Err(ErrorCode::Unsupported, "only one version per cell is retained");
      }
      table.ttl_ms_by_family[family.name] = family.ttl_seconds * 1000;
    }
    state_->tables.emplace(descriptor.name, std::move(table));
    return Result::Ok();
  }

  bool IsTableAvailable(const std::string& name) override {
    return TableExists(name);
  }

 private:
  std::shared_ptr<MemoryState> state_;
};

} // namespace

MemoryConnection::MemoryConnection() : MemoryConnection(&util::NowMillis) {
}

MemoryConnection::MemoryConnection(ClockFn clock_ms) : state_(std::make_shared<MemoryState>()) {
  state_->clock = std::move(clock_ms);
}

MemoryConnection::~MemoryConnection() {
  Close();
}

std::unique_ptr<Admin> MemoryConnection::GetAdmin() {
  std::scoped_lock lock(state_->mutex);
  if (state_->closed) {
    throw StoreError(ErrorCode::Closed, "connection is closed");
  }
  return std::make_unique<MemoryAdmin>(state_);
}

std::unique_ptr<Table> MemoryConnection::GetTable(const std::string& name) {
  std::scoped_lock lock(state_->mutex);
  if (state_->closed) {
    throw StoreError(ErrorCode::Closed, "connection is closed");
  }
  RequireTable(*state_, name);
  ++state_->open_tables;
  return std::make_unique<MemoryTable>(state_, name);
}

bool MemoryConnection::IsClosed() const {
  std::scoped_lock lock(state_->mutex);
  return state_->closed;
}

void MemoryConnection::Close() {
  std::scoped_lock lock(state_->mutex);
  state_->closed = true;
}

std::size_t MemoryConnection::OpenTableHandles() const {
  std::scoped_lock lock(state_->mutex);
  return state_->open_tables;
}

std::size_t MemoryConnection::OpenScanners() const {
  std::scoped_lock lock(state_->mutex);
  return state_->open_scanners;
}

} // namespace backupmeta::store::memory
