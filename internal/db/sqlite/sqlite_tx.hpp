#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace meshgraph::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Read transactions use a deferred BEGIN on their own read-only connection;
  the first SELECT pins the WAL snapshot until Commit()/Rollback().
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Kind { kWrite, kRead };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Kind kind);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
