#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/result.hpp"
#include "internal/store/api/types.hpp"

namespace backupmeta::store {

/*
  Forward-only cursor over a range read.

  Close() releases engine resources, is idempotent and never throws.
  Destroying an open scanner closes it.
*/
class Scanner {
 public:
  virtual ~Scanner() = default;

  // next row in ascending key order, std::nullopt once exhausted
  virtual std::optional<Row> Next() = 0;

  virtual void Close() = 0;
};

/*
  Short-lived handle to one table, obtained per call from a Connection.

  GUARANTEES:

  - Put of a single Mutation is atomic for that row
  - Put of a batch applies rows independently; on failure, rows already
    applied stay committed
  - Get / Scan throw StoreError on engine failure; an absent row is an
    empty Row, never an error
*/
class Table {
 public:
  virtual ~Table() = default;

  virtual const std::string& Name() const = 0;

  virtual Result Put(const Mutation& mutation) = 0;

  virtual Result Put(const std::vector<Mutation>& mutations) = 0;

  virtual Result Delete(const DeleteRequest& request) = 0;

  virtual Row Get(const GetRequest& request) = 0;

  virtual std::unique_ptr<Scanner> GetScanner(const ScanSpec& spec) = 0;

  // idempotent, never throws
  virtual void Close() = 0;
};

} // namespace backupmeta::store
