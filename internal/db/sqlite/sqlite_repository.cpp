#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <charconv>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace meshgraph::db::sqlite {

using meshgraph::db::ErrorCode;
using meshgraph::db::Result;

namespace {

// finalizes on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            st_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }
    explicit operator bool() const { return st_ != nullptr; }

private:
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
    } else if constexpr (std::is_same_v<T, std::string>) {
        BindText(st, idx, *v);
    } else if constexpr (std::is_floating_point_v<T>) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        BindI64(st, idx, static_cast<int64_t>(*v));
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (ColNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (ColNull(st, col)) return std::nullopt;
    return sqlite3_column_double(st, col);
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (ColNull(st, col)) return std::nullopt;
    return ColI64(st, col);
}

// hops column: comma separated decimal node numbers
std::string EncodeHops(const std::vector<model::NodeNum>& hops) {
    std::string out;
    for (size_t i = 0; i < hops.size(); ++i) {
        if (i) out += ',';
        out += std::to_string(hops[i]);
    }
    return out;
}

std::vector<model::NodeNum> DecodeHops(const std::string& s) {
    std::vector<model::NodeNum> hops;
    const char* p   = s.data();
    const char* end = s.data() + s.size();
    while (p < end) {
        model::NodeNum v = 0;
        auto [next, ec] = std::from_chars(p, end, v);
        if (ec != std::errc()) {
            throw std::runtime_error("corrupt traceroute hops: " + s);
        }
        hops.push_back(v);
        p = next;
        if (p < end && *p == ',') ++p;
    }
    return hops;
}

model::Node ReadNode(sqlite3_stmt* st) {
    model::Node n;
    n.id         = static_cast<model::NodeNum>(ColI64(st, 0));
    n.long_name  = ColOptText(st, 1);
    n.short_name = ColOptText(st, 2);
    if (!ColNull(st, 3)) n.hardware = static_cast<uint32_t>(ColI64(st, 3));
    if (!ColNull(st, 4)) n.role = model::RoleFromString(ColText(st, 4));
    n.last_seen = ColOptI64(st, 5);
    n.latitude  = ColOptDouble(st, 6);
    n.longitude = ColOptDouble(st, 7);
    return n;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Kind::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    auto reader = std::make_shared<SqliteDB>(db_->Path(), SqliteDB::Mode::kReadOnly);
    return std::make_unique<SqliteTransaction>(std::move(reader), SqliteTransaction::Kind::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, const model::Message& m) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_MESSAGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, m.id);
    BindText(st.get(), 2, m.topic);
    BindI64(st.get(), 3, m.from);
    BindI64(st.get(), 4, m.to);
    BindI64(st.get(), 5, m.physical_sender);
    BindI64(st.get(), 6, m.timestamp);
    BindOptional(st.get(), 7, m.rssi);
    BindOptional(st.get(), 8, m.snr);
    BindOptional(st.get(), 9, m.hop_count);
    BindText(st.get(), 10, m.type);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::AlreadyExists, "message " + std::to_string(m.id));
    return Result::Ok();
}

std::vector<model::Message>
SqliteRepository::ListMessages(Transaction& t, int64_t start, int64_t end) {
    auto* db = TX(t).Handle();
    std::vector<model::Message> out;

    Statement st(db, sql::SELECT_MESSAGES_RANGE);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    BindI64(st.get(), 1, start);
    BindI64(st.get(), 2, end);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::Message m;
        m.id              = static_cast<uint32_t>(ColI64(st.get(), 0));
        m.topic           = ColText(st.get(), 1);
        m.from            = static_cast<model::NodeNum>(ColI64(st.get(), 2));
        m.to              = static_cast<model::NodeNum>(ColI64(st.get(), 3));
        m.physical_sender = static_cast<model::NodeNum>(ColI64(st.get(), 4));
        m.timestamp       = ColI64(st.get(), 5);
        m.rssi            = ColOptDouble(st.get(), 6);
        m.snr             = ColOptDouble(st.get(), 7);
        if (!ColNull(st.get(), 8)) m.hop_count = static_cast<int32_t>(ColI64(st.get(), 8));
        m.type = ColText(st.get(), 9);
        out.push_back(std::move(m));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNode(Transaction& t, const model::NodeInfoUpdate& u) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_NODE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, u.id);
    BindOptional(st.get(), 2, u.long_name);
    BindOptional(st.get(), 3, u.short_name);
    BindOptional(st.get(), 4, u.hardware);
    if (u.role) {
        BindText(st.get(), 5, std::string(model::ToString(*u.role)));
    } else {
        sqlite3_bind_null(st.get(), 5);
    }
    BindI64(st.get(), 6, u.timestamp);
    BindOptional(st.get(), 7, u.latitude);
    BindOptional(st.get(), 8, u.longitude);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::TouchNode(Transaction& t, model::NodeNum id, int64_t seen) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::TOUCH_NODE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, id);
    BindI64(st.get(), 2, seen);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::Node> SqliteRepository::GetNode(Transaction& t, model::NodeNum id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_NODE);
    if (!st) return std::nullopt;

    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadNode(st.get());
}

std::vector<model::Node> SqliteRepository::ListNodes(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::Node> out;

    Statement st(db, sql::SELECT_NODES);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadNode(st.get()));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

// ------------------------------------------------------------------
// Neighbor reports
// ------------------------------------------------------------------

Result SqliteRepository::InsertNeighborReport(Transaction& t, const model::NeighborReport& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_NEIGHBOR);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.reporter);
    BindI64(st.get(), 2, r.neighbor);
    BindOptional(st.get(), 3, r.snr);
    BindI64(st.get(), 4, r.timestamp);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "neighbor report");
    return Result::Ok();
}

std::vector<model::NeighborReport>
SqliteRepository::ListNeighborReports(Transaction& t, int64_t start, int64_t end) {
    auto* db = TX(t).Handle();
    std::vector<model::NeighborReport> out;

    Statement st(db, sql::SELECT_NEIGHBORS_RANGE);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    BindI64(st.get(), 1, start);
    BindI64(st.get(), 2, end);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::NeighborReport r;
        r.reporter  = static_cast<model::NodeNum>(ColI64(st.get(), 0));
        r.neighbor  = static_cast<model::NodeNum>(ColI64(st.get(), 1));
        r.snr       = ColOptDouble(st.get(), 2);
        r.timestamp = ColI64(st.get(), 3);
        out.push_back(r);
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

// ------------------------------------------------------------------
// Traceroutes
// ------------------------------------------------------------------

Result SqliteRepository::InsertTraceroute(Transaction& t, const model::TracerouteRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_TRACEROUTE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.packet_id);
    BindI64(st.get(), 2, r.origin);
    BindText(st.get(), 3, EncodeHops(r.hops));
    BindI64(st.get(), 4, r.timestamp);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::AlreadyExists, "traceroute " + std::to_string(r.packet_id));
    return Result::Ok();
}

std::vector<model::TracerouteRecord>
SqliteRepository::ListTraceroutes(Transaction& t, int64_t start, int64_t end) {
    auto* db = TX(t).Handle();
    std::vector<model::TracerouteRecord> out;

    Statement st(db, sql::SELECT_TRACEROUTES_RANGE);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    BindI64(st.get(), 1, start);
    BindI64(st.get(), 2, end);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::TracerouteRecord r;
        r.packet_id = static_cast<uint32_t>(ColI64(st.get(), 0));
        r.origin    = static_cast<model::NodeNum>(ColI64(st.get(), 1));
        r.hops      = DecodeHops(ColText(st.get(), 2));
        r.timestamp = ColI64(st.get(), 3);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

// ------------------------------------------------------------------
// Hourly rollups
// ------------------------------------------------------------------

std::optional<int64_t> SqliteRepository::LatestRollupHour(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_LATEST_ROLLUP_HOUR);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) throw std::runtime_error(sqlite3_errmsg(db));
    return ColOptI64(st.get(), 0);
}

Result SqliteRepository::RefreshRollups(Transaction& t, int64_t since) {
    auto* db = TX(t).Handle();

    for (const char* sql : {sql::ROLLUP_MESSAGE_COUNTS, sql::ROLLUP_SENDERS}) {
        Statement st(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindI64(st.get(), 1, since);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

std::vector<model::HourlyTypeCount>
SqliteRepository::ListHourlyCounts(Transaction& t, int64_t start, int64_t end) {
    auto* db = TX(t).Handle();
    std::vector<model::HourlyTypeCount> out;

    Statement st(db, sql::SELECT_HOURLY_COUNTS_RANGE);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    BindI64(st.get(), 1, start);
    BindI64(st.get(), 2, end);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::HourlyTypeCount c;
        c.hour  = ColI64(st.get(), 0);
        c.type  = ColText(st.get(), 1);
        c.count = static_cast<uint64_t>(ColI64(st.get(), 2));
        out.push_back(std::move(c));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

std::vector<model::HourlySender>
SqliteRepository::ListHourlySenders(Transaction& t, int64_t start, int64_t end) {
    auto* db = TX(t).Handle();
    std::vector<model::HourlySender> out;

    Statement st(db, sql::SELECT_HOURLY_SENDERS_RANGE);
    if (!st) throw std::runtime_error(sqlite3_errmsg(db));

    BindI64(st.get(), 1, start);
    BindI64(st.get(), 2, end);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::HourlySender s;
        s.hour     = ColI64(st.get(), 0);
        s.node     = static_cast<model::NodeNum>(ColI64(st.get(), 1));
        s.physical = ColI64(st.get(), 2) != 0;
        out.push_back(s);
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db));

    return out;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result SqliteRepository::PurgeBefore(Transaction& t, int64_t cutoff, uint64_t& deleted) {
    auto* db = TX(t).Handle();
    deleted  = 0;

    for (const char* sql : {sql::DELETE_MESSAGES_BEFORE, sql::DELETE_NEIGHBORS_BEFORE,
                            sql::DELETE_TRACEROUTES_BEFORE}) {
        Statement st(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindI64(st.get(), 1, cutoff);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
        deleted += static_cast<uint64_t>(sqlite3_changes(db));
    }
    return Result::Ok();
}

Result SqliteRepository::CountBefore(Transaction& t, int64_t cutoff, uint64_t& rows) {
    auto* db = TX(t).Handle();
    rows     = 0;

    for (const char* sql : {sql::COUNT_MESSAGES_BEFORE, sql::COUNT_NEIGHBORS_BEFORE,
                            sql::COUNT_TRACEROUTES_BEFORE}) {
        Statement st(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindI64(st.get(), 1, cutoff);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_ROW) return Translate(db, rc);
        rows += static_cast<uint64_t>(ColI64(st.get(), 0));
    }
    return Result::Ok();
}

Result SqliteRepository::Compact() {
    auto* db = db_->Handle();
    return Translate(db, sqlite3_exec(db, sql::VACUUM, nullptr, nullptr, nullptr));
}

} // namespace meshgraph::db::sqlite
