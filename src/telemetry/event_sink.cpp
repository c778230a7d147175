#include "telemetry/event_sink.hpp"
#include <spdlog/spdlog.h>

namespace updown {

void LogEventSink::emit(const TelemetryEvent& event) {
    spdlog::info("[EVENT] {} {} {} {}", event.type, event.market_id, event.asset, event.data.dump());
}

void FanoutEventSink::add(std::shared_ptr<EventSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void FanoutEventSink::emit(const TelemetryEvent& event) {
    for (const auto& sink : sinks_) {
        emit_event(sink.get(), event);
    }
}

std::shared_ptr<EventSink> make_null_sink() {
    return std::make_shared<NullEventSink>();
}

void emit_event(EventSink* sink, const TelemetryEvent& event) noexcept {
    if (!sink) return;
    try {
        sink->emit(event);
    } catch (const std::exception& e) {
        try {
            spdlog::warn("Telemetry sink failed for {}: {}", event.type, e.what());
        } catch (const std::exception&) {
            // logger itself unavailable
        }
    }
}

} // namespace updown
