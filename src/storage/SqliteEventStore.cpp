#include "storage/SqliteEventStore.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sqlite3.h>

using namespace latmon;
using json = nlohmann::json;

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS latency_events (
    id                    INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp             TEXT    NOT NULL,
    component_class       TEXT    NOT NULL,
    source_kind           TEXT    NOT NULL,
    duration_microseconds INTEGER NOT NULL CHECK (duration_microseconds >= 0),
    description           TEXT    NOT NULL,
    metadata              TEXT
);
CREATE INDEX IF NOT EXISTS idx_latency_events_timestamp
    ON latency_events(timestamp);
CREATE INDEX IF NOT EXISTS idx_latency_events_component
    ON latency_events(component_class, timestamp);
)SQL";

const char* kColumns =
    "SELECT id, timestamp, component_class, source_kind, duration_microseconds, "
    "description, metadata FROM latency_events ";

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string msg = what;
    if (db) msg += ": " + std::string(sqlite3_errmsg(db));
    throw StoreError(msg);
}

void check(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) fail(db, what);
}

void exec(sqlite3* db, const char* sql, const char* what) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = std::string(what) + ": " + (err ? err : sqlite3_errmsg(db));
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        check(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr), db, "prepare");
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int i, const std::string& v) {
        check(sqlite3_bind_text(stmt_, i, v.c_str(), -1, SQLITE_TRANSIENT), db_, "bind text");
    }
    void bind(int i, int64_t v) {
        check(sqlite3_bind_int64(stmt_, i, v), db_, "bind int");
    }
    void bind_null(int i) {
        check(sqlite3_bind_null(stmt_, i), db_, "bind null");
    }

    // true while rows remain.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t     int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    bool        is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }

private:
    sqlite3*      db_;
    sqlite3_stmt* stmt_{nullptr};
};

sqlite3* open_db(const std::string& path, int flags, std::chrono::milliseconds busy) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = "open " + path + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        throw StoreError(msg);
    }
    sqlite3_busy_timeout(db, static_cast<int>(busy.count()));
    return db;
}

// Rows with an unknown enum or timestamp are skipped, not defaulted.
std::optional<LatencyEvent> decode(const Statement& st) {
    const int64_t id = st.int64(0);
    auto ts  = parse_iso8601(st.text(1));
    auto cls = parse_component_class(st.text(2));
    auto src = parse_source_kind(st.text(3));
    if (!ts || !cls || !src) {
        std::cerr << "[STORE] Skipping malformed row id=" << id << "\n";
        return std::nullopt;
    }

    json meta = nullptr;
    if (!st.is_null(6)) {
        std::string raw = st.text(6);
        meta = json::parse(raw, nullptr, false);
        if (meta.is_discarded()) meta = raw;
    }

    LatencyEvent ev(*ts, *cls, *src, Micros(st.int64(4)), st.text(5), std::move(meta));
    return ev.persisted_as(id);
}

void collect(Statement& st, std::vector<LatencyEvent>& out) {
    while (st.step()) {
        if (auto ev = decode(st)) out.push_back(std::move(*ev));
    }
}

} // namespace

struct SqliteEventStore::Impl {
    std::string path;
    std::mutex  write_mtx;
    std::mutex  read_mtx;
    sqlite3*    writer{nullptr};
    sqlite3*    reader{nullptr};

    ~Impl() {
        if (reader) sqlite3_close(reader);
        if (writer) sqlite3_close(writer);
    }
};

SqliteEventStore::SqliteEventStore(const std::string& path, std::chrono::milliseconds busy_timeout)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = path;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) throw StoreError("create " + p.parent_path().string() + ": " + ec.message());
    }

    impl_->writer = open_db(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, busy_timeout);
    exec(impl_->writer, "PRAGMA journal_mode=WAL;", "enable WAL");
    exec(impl_->writer, "PRAGMA synchronous=NORMAL;", "set synchronous");
    exec(impl_->writer, kSchema, "create schema");

    impl_->reader = open_db(path, SQLITE_OPEN_READONLY, busy_timeout);

    std::cout << "[STORE] Opened " << path << " (WAL)\n";
}

SqliteEventStore::~SqliteEventStore() = default;

std::string SqliteEventStore::describe() const {
    return "sqlite:" + impl_->path;
}

const std::string& SqliteEventStore::path() const {
    return impl_->path;
}

std::vector<int64_t> SqliteEventStore::append(const std::vector<LatencyEvent>& batch) {
    std::vector<int64_t> ids;
    if (batch.empty()) return ids;
    ids.reserve(batch.size());

    std::lock_guard<std::mutex> lk(impl_->write_mtx);
    sqlite3* db = impl_->writer;

    exec(db, "BEGIN IMMEDIATE;", "begin");
    try {
        Statement st(db,
            "INSERT INTO latency_events (timestamp, component_class, source_kind, "
            "duration_microseconds, description, metadata) VALUES (?, ?, ?, ?, ?, ?)");

        for (const auto& ev : batch) {
            st.bind(1, format_iso8601(ev.timestamp()));
            st.bind(2, std::string(to_string(ev.component())));
            st.bind(3, std::string(to_string(ev.source())));
            st.bind(4, ev.duration_us());
            st.bind(5, ev.description());
            if (ev.metadata().is_null()) st.bind_null(6);
            else st.bind(6, ev.metadata().dump(-1, ' ', false, json::error_handler_t::replace));
            st.step();
            ids.push_back(sqlite3_last_insert_rowid(db));
            st.reset();
        }
        exec(db, "COMMIT;", "commit");
    } catch (const std::exception&) {
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "[STORE] Rollback failed: " << sqlite3_errmsg(db) << "\n";
        }
        throw;
    }
    return ids;
}

std::vector<LatencyEvent> SqliteEventStore::recent(std::size_t limit,
                                                   std::optional<ComponentClass> component) {
    std::vector<LatencyEvent> out;
    if (limit == 0) return out;

    std::lock_guard<std::mutex> lk(impl_->read_mtx);
    std::string sql = kColumns;
    if (component) sql += "WHERE component_class = ? ";
    sql += "ORDER BY timestamp DESC, id DESC LIMIT ?";

    Statement st(impl_->reader, sql);
    int i = 1;
    if (component) st.bind(i++, std::string(to_string(*component)));
    st.bind(i, static_cast<int64_t>(limit));
    out.reserve(limit < 1024 ? limit : 1024);
    collect(st, out);
    return out;
}

std::vector<LatencyEvent> SqliteEventStore::between(Timestamp from, Timestamp to,
                                                    std::optional<ComponentClass> component) {
    std::vector<LatencyEvent> out;
    std::lock_guard<std::mutex> lk(impl_->read_mtx);

    std::string sql = kColumns;
    sql += "WHERE timestamp >= ? AND timestamp < ? ";
    if (component) sql += "AND component_class = ? ";
    sql += "ORDER BY timestamp ASC, id ASC";

    Statement st(impl_->reader, sql);
    st.bind(1, format_iso8601(from));
    st.bind(2, format_iso8601(to));
    if (component) st.bind(3, std::string(to_string(*component)));
    collect(st, out);
    return out;
}

uint64_t SqliteEventStore::purge_before(Timestamp cutoff) {
    std::lock_guard<std::mutex> lk(impl_->write_mtx);
    Statement st(impl_->writer, "DELETE FROM latency_events WHERE timestamp < ?");
    st.bind(1, format_iso8601(cutoff));
    st.step();
    return static_cast<uint64_t>(sqlite3_changes(impl_->writer));
}

uint64_t SqliteEventStore::count() {
    std::lock_guard<std::mutex> lk(impl_->read_mtx);
    Statement st(impl_->reader, "SELECT COUNT(*) FROM latency_events");
    return st.step() ? static_cast<uint64_t>(st.int64(0)) : 0;
}

std::optional<Timestamp> SqliteEventStore::last_timestamp() {
    std::lock_guard<std::mutex> lk(impl_->read_mtx);
    Statement st(impl_->reader, "SELECT MAX(timestamp) FROM latency_events");
    if (!st.step() || st.is_null(0)) return std::nullopt;
    return parse_iso8601(st.text(0));
}
