#include "persistence/event_store.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace updown {

EventStore::EventStore(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open event store: " + error);
    }

    // WAL mode so readers do not block the trading thread
    execute("PRAGMA journal_mode = WAL;");

    spdlog::info("EventStore opened: {}", db_path);
}

EventStore::~EventStore() {
    close();
}

bool EventStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void EventStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("EventStore closed");
    }
}

void EventStore::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* EventStore::prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void EventStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    execute(R"(
        CREATE TABLE IF NOT EXISTS events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL,
            ts_ms INTEGER NOT NULL,
            market_id TEXT,
            asset TEXT,
            data_json TEXT
        );
    )");
    execute("CREATE INDEX IF NOT EXISTS idx_events_market_type ON events(market_id, type);");
    spdlog::info("EventStore schema initialized");
}

void EventStore::emit(const TelemetryEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        throw std::runtime_error("EventStore is closed");
    }

    sqlite3_stmt* stmt = prepare(
        "INSERT INTO events (type, ts_ms, market_id, asset, data_json) VALUES (?, ?, ?, ?, ?);");
    std::string data = event.data.dump();
    sqlite3_bind_text(stmt, 1, event.type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, event.ts_ms);
    sqlite3_bind_text(stmt, 3, event.market_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, event.asset.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, data.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert event: " + std::string(sqlite3_errmsg(db_)));
    }
}

int64_t EventStore::count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = type.empty()
        ? prepare("SELECT COUNT(*) FROM events;")
        : prepare("SELECT COUNT(*) FROM events WHERE type = ?;");
    if (!type.empty()) {
        sqlite3_bind_text(stmt, 1, type.c_str(), -1, SQLITE_TRANSIENT);
    }

    int64_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<TelemetryEvent> EventStore::read_events(sqlite3_stmt* stmt) const {
    std::vector<TelemetryEvent> events;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        TelemetryEvent e;
        auto text = [stmt](int col) {
            const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(t ? t : "");
        };
        e.type = text(0);
        e.ts_ms = sqlite3_column_int64(stmt, 1);
        e.market_id = text(2);
        e.asset = text(3);
        e.data = nlohmann::json::parse(text(4), nullptr, false);
        if (e.data.is_discarded()) {
            e.data = nlohmann::json::object();
        }
        events.push_back(std::move(e));
    }
    sqlite3_finalize(stmt);
    return events;
}

std::vector<TelemetryEvent> EventStore::recent(int limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return {};

    sqlite3_stmt* stmt = prepare(
        "SELECT type, ts_ms, market_id, asset, data_json FROM events ORDER BY id DESC LIMIT ?;");
    sqlite3_bind_int(stmt, 1, limit);
    return read_events(stmt);
}

std::vector<TelemetryEvent> EventStore::for_market(const std::string& market_id, int limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return {};

    sqlite3_stmt* stmt = prepare(
        "SELECT type, ts_ms, market_id, asset, data_json FROM events "
        "WHERE market_id = ? ORDER BY id DESC LIMIT ?;");
    sqlite3_bind_text(stmt, 1, market_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit);
    return read_events(stmt);
}

} // namespace updown
