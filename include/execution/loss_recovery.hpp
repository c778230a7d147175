#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/order_gateway.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

namespace updown {

/**
 * Inventory and books of one market as seen at recovery time.
 * Books with a 0 price on a side count as unknown on that side.
 */
struct RecoveryInput {
    MarketKey key;
    std::string up_token_id;
    std::string down_token_id;
    Size up_qty{0.0};
    Size down_qty{0.0};
    Notional up_cost{0.0};
    Notional down_cost{0.0};
    BookSnapshot up_book;
    BookSnapshot down_book;
};

struct RecoveryAnalysis {
    bool should_recover{false};
    std::string reason;

    Notional total_cost{0.0};
    Size unpaired{0.0};
    Outcome leading_side{Outcome::UP};
    Outcome trailing_side{Outcome::DOWN};

    Price leading_price{0.0};      // Implied win probability of the leading side
    Price buy_price{0.0};          // Trailing side ask

    double current_max_loss{0.0};
    double current_max_gain{0.0};

    Size shares_to_buy{0.0};
    Notional recovery_cost{0.0};
    double locked_after{0.0};
    double loss_reduction{0.0};    // Negative means recovery improves the worst case
    Price projected_combined{0.0};
};

struct RecoveryResult {
    bool attempted{false};
    bool success{false};
    std::string reason;
    RecoveryAnalysis analysis;
    std::string order_id;
    Size filled_qty{0.0};
};

/**
 * Loss-minimization mode: when one side is far behind late in the
 * market, buy the trailing side to lock a bounded loss instead of
 * carrying an open directional position into expiry.
 */
class LossRecovery {
public:
    LossRecovery(
        const RecoveryConfig& config,
        std::shared_ptr<OrderGateway> gateway,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<EventSink> sink = nullptr
    );

    RecoveryAnalysis analyze(const RecoveryInput& input) const;

    // Rate-limited per market by cooldown_ms
    RecoveryResult check_and_recover(const RecoveryInput& input);
    bool in_cooldown(const MarketKey& key) const;

    void clear(const MarketKey& key);

private:
    RecoveryConfig config_;
    std::shared_ptr<OrderGateway> gateway_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    std::map<MarketKey, EpochMs> last_attempt_ms_;

    void emit(const std::string& type, const MarketKey& key, nlohmann::json data);
};

} // namespace updown
