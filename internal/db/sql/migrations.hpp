#pragma once

#include <string>
#include <vector>

namespace meshgraph::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Migration N is ordered_sql[N-1].

  Every statement must be idempotent (CREATE ... IF NOT EXISTS) so the whole
  list can be replayed on each startup; applied versions are recorded in
  schema_migrations.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema used by the event store, in migration order.
const std::vector<std::string>& SchemaMigrations();

} // namespace meshgraph::db::sql
