#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace updown {

/**
 * Structured engine event. Every event carries type, time and market
 * identity; the rest of the payload is type-specific.
 */
struct TelemetryEvent {
    std::string type;
    EpochMs ts_ms{0};
    std::string market_id;
    std::string asset;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * Fire-and-forget telemetry port.
 *
 * Implementations may throw; callers go through emit_event() which
 * contains the failure so trading logic never depends on telemetry.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const TelemetryEvent& event) = 0;
};

class NullEventSink : public EventSink {
public:
    void emit(const TelemetryEvent&) override {}
};

/**
 * Writes events as single log lines through spdlog.
 */
class LogEventSink : public EventSink {
public:
    void emit(const TelemetryEvent& event) override;
};

/**
 * Forwards to several sinks, isolating each one.
 */
class FanoutEventSink : public EventSink {
public:
    void add(std::shared_ptr<EventSink> sink);
    void emit(const TelemetryEvent& event) override;

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

std::shared_ptr<EventSink> make_null_sink();

// Emit without letting a sink failure escape
void emit_event(EventSink* sink, const TelemetryEvent& event) noexcept;

} // namespace updown
