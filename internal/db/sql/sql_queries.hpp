#pragma once

namespace meshgraph::db::sql {

/*
  Canonical SQL used by the sqlite repository.

  Inserts use ON CONFLICT DO NOTHING; sqlite3_changes() == 0 after a step
  means the natural key already existed.
*/

// messages

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO messages(id,topic,sender,receiver,physical_sender,timestamp,rssi,snr,hop_count,type)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO NOTHING;";

static constexpr const char* SELECT_MESSAGES_RANGE =
    "SELECT id,topic,sender,receiver,physical_sender,timestamp,rssi,snr,hop_count,type"
    " FROM messages WHERE timestamp>=? AND timestamp<=?"
    " ORDER BY timestamp, rowid;";

// nodes

static constexpr const char* UPSERT_NODE =
    "INSERT INTO nodes(id,long_name,short_name,hardware,role,last_seen,latitude,longitude)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " long_name=COALESCE(excluded.long_name,nodes.long_name),"
    " short_name=COALESCE(excluded.short_name,nodes.short_name),"
    " hardware=COALESCE(excluded.hardware,nodes.hardware),"
    " role=COALESCE(excluded.role,nodes.role),"
    " last_seen=MAX(COALESCE(nodes.last_seen,0),excluded.last_seen),"
    " latitude=COALESCE(excluded.latitude,nodes.latitude),"
    " longitude=COALESCE(excluded.longitude,nodes.longitude);";

static constexpr const char* TOUCH_NODE =
    "INSERT INTO nodes(id,last_seen) VALUES(?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " last_seen=MAX(COALESCE(nodes.last_seen,0),excluded.last_seen);";

static constexpr const char* SELECT_NODE =
    "SELECT id,long_name,short_name,hardware,role,last_seen,latitude,longitude"
    " FROM nodes WHERE id=?;";

static constexpr const char* SELECT_NODES =
    "SELECT id,long_name,short_name,hardware,role,last_seen,latitude,longitude"
    " FROM nodes ORDER BY id;";

// neighbors

static constexpr const char* INSERT_NEIGHBOR =
    "INSERT INTO neighbors(node_id,neighbor_id,snr,timestamp) VALUES(?,?,?,?)"
    " ON CONFLICT(node_id,neighbor_id,timestamp) DO NOTHING;";

static constexpr const char* SELECT_NEIGHBORS_RANGE =
    "SELECT node_id,neighbor_id,snr,timestamp"
    " FROM neighbors WHERE timestamp>=? AND timestamp<=?"
    " ORDER BY timestamp, id;";

// traceroutes

static constexpr const char* INSERT_TRACEROUTE =
    "INSERT INTO traceroutes(packet_id,origin,hops,timestamp) VALUES(?,?,?,?)"
    " ON CONFLICT(packet_id) DO NOTHING;";

static constexpr const char* SELECT_TRACEROUTES_RANGE =
    "SELECT packet_id,origin,hops,timestamp"
    " FROM traceroutes WHERE timestamp>=? AND timestamp<=?"
    " ORDER BY timestamp, id;";

// hourly rollups

static constexpr const char* SELECT_LATEST_ROLLUP_HOUR = "SELECT MAX(hour) FROM hourly_message_counts;";

// recomputes hours already rolled up; an hour whose raw rows were partly purged never lowers its stored count
static constexpr const char* ROLLUP_MESSAGE_COUNTS =
    "INSERT INTO hourly_message_counts(hour,type,count)"
    " SELECT (timestamp/3600)*3600, CASE WHEN type='' THEN 'unknown' ELSE type END, COUNT(*)"
    " FROM messages WHERE timestamp>=?1"
    " GROUP BY 1, 2"
    " ON CONFLICT(hour,type) DO UPDATE SET count=MAX(count, excluded.count);";

static constexpr const char* ROLLUP_SENDERS =
    "INSERT OR IGNORE INTO hourly_senders(hour,node_id,physical)"
    " SELECT (timestamp/3600)*3600, sender, 0 FROM messages WHERE timestamp>=?1 AND sender<>0"
    " UNION"
    " SELECT (timestamp/3600)*3600, physical_sender, 1 FROM messages WHERE timestamp>=?1 AND physical_sender<>0;";

static constexpr const char* SELECT_HOURLY_COUNTS_RANGE =
    "SELECT hour,type,count FROM hourly_message_counts"
    " WHERE hour>=? AND hour<=? ORDER BY hour, type;";

static constexpr const char* SELECT_HOURLY_SENDERS_RANGE =
    "SELECT hour,node_id,physical FROM hourly_senders"
    " WHERE hour>=? AND hour<=? ORDER BY hour, physical, node_id;";

// retention

static constexpr const char* DELETE_MESSAGES_BEFORE    = "DELETE FROM messages WHERE timestamp<?;";
static constexpr const char* DELETE_NEIGHBORS_BEFORE   = "DELETE FROM neighbors WHERE timestamp<?;";
static constexpr const char* DELETE_TRACEROUTES_BEFORE = "DELETE FROM traceroutes WHERE timestamp<?;";

static constexpr const char* COUNT_MESSAGES_BEFORE    = "SELECT COUNT(*) FROM messages WHERE timestamp<?;";
static constexpr const char* COUNT_NEIGHBORS_BEFORE   = "SELECT COUNT(*) FROM neighbors WHERE timestamp<?;";
static constexpr const char* COUNT_TRACEROUTES_BEFORE = "SELECT COUNT(*) FROM traceroutes WHERE timestamp<?;";

static constexpr const char* VACUUM = "VACUUM;";

}
