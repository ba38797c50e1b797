#pragma once

namespace orchestra::db {

/*
  One unit of snapshot persistence.

  Writes made through a Transaction are visible to reads through the same
  Transaction and to nobody else until Commit(). Destroying an uncommitted
  Transaction discards its writes.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace orchestra::db
