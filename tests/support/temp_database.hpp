#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace meshgraph::testing {

// Fresh database file under the system temp directory.
inline std::filesystem::path TempDatabasePath(const std::string& suite, const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / suite;
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

inline std::shared_ptr<db::Repository> OpenSqliteRepository(const std::filesystem::path& path) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string());
  db::sql::RunMigrations(*sqlite_db, db::sql::SchemaMigrations());
  return std::make_shared<db::sqlite::SqliteRepository>(sqlite_db);
}

} // namespace meshgraph::testing
