#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace meshgraph::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  kReadWrite opens (and creates) the database and switches it to WAL so
  readers on other connections keep working while the writer holds its lock.
  kReadOnly connections are used for snapshot reads and never create the file.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  enum class Mode { kReadWrite, kReadOnly };

  explicit SqliteDB(std::string path, Mode mode = Mode::kReadWrite);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  Mode        mode_;
};

} // namespace meshgraph::db::sqlite
