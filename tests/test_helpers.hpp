#pragma once

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "telemetry/event_sink.hpp"

namespace updown {
namespace testing {

// Captures every emitted event for assertions
class RecordingEventSink : public EventSink {
public:
    void emit(const TelemetryEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<TelemetryEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<TelemetryEvent> of_type(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TelemetryEvent> out;
        for (const auto& e : events_) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    size_t count(const std::string& type) const { return of_type(type).size(); }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<TelemetryEvent> events_;
};

class ThrowingEventSink : public EventSink {
public:
    void emit(const TelemetryEvent&) override { throw std::runtime_error("sink down"); }
};

inline BookSnapshot make_book(Price bid, Price ask, EpochMs fetched_at = 0) {
    BookSnapshot book;
    book.best_bid = bid;
    book.best_ask = ask;
    book.fetched_at = fetched_at;
    return book;
}

} // namespace testing
} // namespace updown
