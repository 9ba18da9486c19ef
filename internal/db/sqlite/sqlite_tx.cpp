#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace meshgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Kind kind) : db_(std::move(db)) {
  db_->Exec(kind == Kind::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      MESHGRAPH_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace meshgraph::db::sqlite
