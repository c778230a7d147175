#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include "telemetry/event_sink.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace updown {

/**
 * SQLite-backed telemetry store.
 *
 * Every emitted event becomes one row in `events`. The payload is kept
 * as JSON text so new event types need no schema change.
 */
class EventStore : public EventSink {
public:
    explicit EventStore(const std::string& db_path);
    ~EventStore() override;

    // Non-copyable
    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    bool is_open() const;
    void close();

    void initialize_schema();

    // EventSink
    void emit(const TelemetryEvent& event) override;

    // Queries
    int64_t count(const std::string& type = "") const;
    std::vector<TelemetryEvent> recent(int limit = 100) const;
    std::vector<TelemetryEvent> for_market(const std::string& market_id, int limit = 100) const;

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    mutable std::mutex mutex_;

    void execute(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql) const;
    std::vector<TelemetryEvent> read_events(sqlite3_stmt* stmt) const;
};

} // namespace updown
