#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/store/api/connection.hpp"

namespace backupmeta::store::memory {

namespace detail {
struct MemoryState;
}

/*
  In-process sorted store.

  Rows live in ordered maps keyed by raw bytes, so scans see ascending key
  order exactly like a disk engine would. One mutex guards all tables; each
  call takes it once. Cells remember their write time so column families
  with a ttl expire on read.

  The clock is injectable so TTL behaviour can be tested deterministically.
*/
class MemoryConnection final : public store::Connection {
 public:
  using ClockFn = std::function<int64_t()>;

  MemoryConnection();
  explicit MemoryConnection(ClockFn clock_ms);
  ~MemoryConnection() override;

  MemoryConnection(const MemoryConnection&)            = delete;
  MemoryConnection& operator=(const MemoryConnection&) = delete;

  std::unique_ptr<Admin> GetAdmin() override;
  std::unique_ptr<Table> GetTable(const std::string& name) override;

  bool IsClosed() const override;
  void Close() override;

  // Live handle counts, used to verify that callers release what they open.
  std::size_t OpenTableHandles() const;
  std::size_t OpenScanners() const;

 private:
  std::shared_ptr<detail::MemoryState> state_;
};

} // namespace backupmeta::store::memory
