#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace x402::db::sqlite {

/*
  Scoped write transaction.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock up front
    - read-check-write sequences inside it are atomic per database

  Rolls back on destruction unless committed.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace x402::db::sqlite
