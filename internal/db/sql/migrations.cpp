#include "migrations.hpp"

#include <chrono>

namespace meshgraph::db::sql {

namespace {

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS schema_migrations ("
      " version INTEGER PRIMARY KEY,"
      " applied_at_ms INTEGER NOT NULL);");

  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.ExecuteSQL("INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(i + 1) + ", " +
                        std::to_string(NowMs()) + ");");
  }
}

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: node directory
      "CREATE TABLE IF NOT EXISTS nodes ("
      " id INTEGER NOT NULL PRIMARY KEY,"
      " long_name TEXT,"
      " short_name TEXT,"
      " hardware INTEGER,"
      " role TEXT,"
      " last_seen INTEGER,"
      " latitude REAL,"
      " longitude REAL);",

      // 2: messages keyed by mesh packet id
      "CREATE TABLE IF NOT EXISTS messages ("
      " id INTEGER NOT NULL PRIMARY KEY,"
      " topic TEXT,"
      " sender INTEGER NOT NULL,"
      " receiver INTEGER NOT NULL,"
      " physical_sender INTEGER NOT NULL,"
      " timestamp INTEGER NOT NULL,"
      " rssi REAL,"
      " snr REAL,"
      " hop_count INTEGER,"
      " type TEXT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS messages_timestamp_idx ON messages(timestamp);",

      // 4: neighbor reports
      "CREATE TABLE IF NOT EXISTS neighbors ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " node_id INTEGER NOT NULL,"
      " neighbor_id INTEGER NOT NULL,"
      " snr REAL,"
      " timestamp INTEGER NOT NULL,"
      " UNIQUE(node_id, neighbor_id, timestamp));",

      "CREATE INDEX IF NOT EXISTS neighbors_timestamp_idx ON neighbors(timestamp);",

      // 6: traceroutes, hops stored as comma separated node numbers
      "CREATE TABLE IF NOT EXISTS traceroutes ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " packet_id INTEGER NOT NULL UNIQUE,"
      " origin INTEGER NOT NULL,"
      " hops TEXT NOT NULL,"
      " timestamp INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS traceroutes_timestamp_idx ON traceroutes(timestamp);",

      // 8: per hour message counts by type, kept across retention
      "CREATE TABLE IF NOT EXISTS hourly_message_counts ("
      " hour INTEGER NOT NULL,"
      " type TEXT NOT NULL,"
      " count INTEGER NOT NULL,"
      " PRIMARY KEY(hour, type));",

      // 9: distinct senders per hour; physical = 1 for physical_sender
      "CREATE TABLE IF NOT EXISTS hourly_senders ("
      " hour INTEGER NOT NULL,"
      " node_id INTEGER NOT NULL,"
      " physical INTEGER NOT NULL,"
      " PRIMARY KEY(hour, node_id, physical));"};

  return kMigrations;
}

} // namespace meshgraph::db::sql
