#pragma once

#include <memory>
#include <string>

#include "internal/store/api/result.hpp"
#include "internal/store/api/table.hpp"
#include "internal/store/api/types.hpp"

namespace backupmeta::store {

class Admin {
 public:
  virtual ~Admin() = default;

  virtual bool TableExists(const std::string& name) = 0;

  virtual Result CreateTable(const TableDescriptor& descriptor) = 0;

  virtual bool IsTableAvailable(const std::string& name) = 0;
};

/*
  Process-wide store connection.

  Opened once at startup and closed at shutdown. Table and Admin handles are
  cheap and meant to be opened for a single call; they must not outlive the
  connection. After Close(), GetTable/GetAdmin throw StoreError(Closed).
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual std::unique_ptr<Admin> GetAdmin() = 0;

  // throws StoreError(NotFound) if the table does not exist
  virtual std::unique_ptr<Table> GetTable(const std::string& name) = 0;

  virtual bool IsClosed() const = 0;

  virtual void Close() = 0;
};

} // namespace backupmeta::store
