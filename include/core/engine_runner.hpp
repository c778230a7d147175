#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/cadence_controller.hpp"
#include "core/engine_context.hpp"
#include "core/market_state_manager.hpp"
#include "execution/hedge_priority_lane.hpp"

namespace updown {

/**
 * Filled inventory of one market.
 */
struct Inventory {
    Size up_shares{0.0};
    Size down_shares{0.0};
    Notional up_cost{0.0};
    Notional down_cost{0.0};

    Size shares(Outcome o) const { return o == Outcome::UP ? up_shares : down_shares; }
    Notional cost(Outcome o) const { return o == Outcome::UP ? up_cost : down_cost; }
    Size unpaired() const { return up_shares > down_shares ? up_shares - down_shares
                                                           : down_shares - up_shares; }
};

enum class EvalOutcome {
    SKIPPED,          // Cadence said not yet
    EXPIRED,
    NO_BOOK,
    QUOTED,
    HEDGED,
    HEDGE_FAILED,
    RECOVERY,
    WAITING,
    IDLE
};

inline std::string eval_outcome_to_string(EvalOutcome o) {
    switch (o) {
        case EvalOutcome::SKIPPED: return "SKIPPED";
        case EvalOutcome::EXPIRED: return "EXPIRED";
        case EvalOutcome::NO_BOOK: return "NO_BOOK";
        case EvalOutcome::QUOTED: return "QUOTED";
        case EvalOutcome::HEDGED: return "HEDGED";
        case EvalOutcome::HEDGE_FAILED: return "HEDGE_FAILED";
        case EvalOutcome::RECOVERY: return "RECOVERY";
        case EvalOutcome::WAITING: return "WAITING";
        case EvalOutcome::IDLE: return "IDLE";
    }
    return "UNKNOWN";
}

struct EvaluationResult {
    EvalOutcome outcome{EvalOutcome::IDLE};
    PairingState state{PairingState::FLAT};
    CadenceState cadence{CadenceState::COLD};
    std::optional<HedgeAction> hedge_action;
    std::string detail;
};

/**
 * EngineRunner drives the per-market evaluation cycle.
 *
 * DESIGN:
 * - One cycle per market, paced by the cadence controller; due markets
 *   run concurrently, one task each, so no market waits on another
 * - Books are fetched fresh every cycle; nothing trades on a cached book
 * - Entry quotes are passive only; all aggressive flow goes through the
 *   hedge lane (escalator or loss recovery)
 * - Inventory is updated from fills the venue reports, at placement
 *   or later through on_order_fill()
 * - An emergency exit resolves the hedge only once it covers the whole
 *   unpaired quantity; a partial recovery order stays tracked
 */
class EngineRunner {
public:
    explicit EngineRunner(EngineContext& ctx);

    void add_market(const MarketSpec& market);
    void remove_market(const MarketKey& key);
    std::vector<MarketSpec> markets() const;

    // One cycle for one market, regardless of cadence
    EvaluationResult evaluate_market(const MarketSpec& market);

    // One pass over all markets whose cadence is due, evaluated concurrently;
    // returns cycles run
    int run_once();

    // Loop until stop() or duration_s elapses (0 = forever)
    void run(double duration_s = 0.0);
    void stop() { running_ = false; }
    bool is_running() const { return running_; }

    // Fill accounting
    void record_fill(const MarketKey& key, Outcome side, Size shares, Notional cost);
    Inventory inventory(const MarketKey& key) const;

    // Fill of a resting order reported by the venue after placement.
    // Returns false when the token belongs to no tracked market.
    bool on_order_fill(const std::string& order_id, const std::string& token_id,
                       Price price, Size size);

    // External spot feed for cadence
    void on_spot_price(const std::string& asset, Price price);

    int64_t cycles() const { return cycles_; }

private:
    EngineContext& ctx_;

    mutable std::mutex mutex_;
    std::map<MarketKey, MarketSpec> markets_;
    std::map<MarketKey, Inventory> inventories_;
    std::map<MarketKey, std::pair<Price, Price>> last_mids_;
    std::map<std::string, Price> last_spot_;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> cycles_{0};

    double seconds_remaining(const MarketSpec& market) const;
    bool fetch_books(const MarketSpec& market, BookSnapshot& up, BookSnapshot& down);
    void feed_cadence(const MarketSpec& market, const BookSnapshot& up, const BookSnapshot& down,
                      EvaluationResult& result);

    void run_hedge_lane(const MarketSpec& market, const Inventory& inv, double secs_remaining,
                        const BookSnapshot& up, const BookSnapshot& down, EvaluationResult& result);
    void run_entry_quotes(const MarketSpec& market, const Inventory& inv,
                          const BookSnapshot& up, const BookSnapshot& down, EvaluationResult& result);
};

} // namespace updown
