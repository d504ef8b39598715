#pragma once

namespace retest::db {

enum class TxMode {
  // consistent snapshot; write calls fail with ErrorCode::ReadOnly
  kRead,
  // exclusive writer
  kWrite
};

/*
  Unit of work against a Repository.

  Writes stay invisible to other transactions until Commit(). A
  transaction destroyed without Commit() is rolled back, so an
  exception between the first write and Commit() leaves the
  database as it was.

  Read transactions never block each other. Several workers compute
  stability from the same file at startup, and only commits contend
  for the writer lock.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;

  virtual TxMode Mode() const = 0;

  bool ReadOnly() const {
    return Mode() == TxMode::kRead;
  }
};

} // namespace retest::db
