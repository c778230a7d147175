#include <iostream>
#include <csignal>
#include <atomic>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <random>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "core/engine_context.hpp"
#include "core/engine_runner.hpp"
#include "market_data/paper_venue.hpp"
#include "persistence/event_store.hpp"
#include "telemetry/event_sink.hpp"
#include "utils/clock.hpp"

using namespace updown;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/updown.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("updown", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

/**
 * Random-walk books for the paper venue. Each market's UP probability
 * drifts; DOWN mirrors it with an occasional dislocation so both the
 * entry quotes and the hedge lane see realistic traffic.
 */
class PaperMarketSimulator {
public:
    PaperMarketSimulator(std::shared_ptr<PaperVenueClient> venue, uint32_t seed)
        : venue_(std::move(venue)), rng_(seed) {}

    void add(const MarketSpec& market) {
        probs_[market.market_id] = 0.5;
        spot_[market.asset] = spot_.count(market.asset) ? spot_[market.asset] : 100.0;
        step(market);
    }

    void step(const MarketSpec& market) {
        std::normal_distribution<double> drift(0.0, 0.01);
        std::uniform_real_distribution<double> coin(0.0, 1.0);

        double& p = probs_[market.market_id];
        p = std::clamp(p + drift(rng_), 0.05, 0.95);
        spot_[market.asset] *= 1.0 + drift(rng_) * 0.1;

        const double up_mid = std::round(p * 100.0) / 100.0;
        const double down_mid = 1.0 - up_mid;
        // Dislocation: one side's ask briefly drops into the other side's quotes
        const double skew = coin(rng_) < 0.15 ? -0.02 : 0.0;

        venue_->set_book(market.up_token_id,
                         std::max(0.01, up_mid - 0.02), std::min(0.99, up_mid + 0.02 + skew),
                         200.0, 200.0);
        venue_->set_book(market.down_token_id,
                         std::max(0.01, down_mid - 0.02), std::min(0.99, down_mid + 0.02),
                         200.0, 200.0);
    }

    double spot(const std::string& asset) const {
        auto it = spot_.find(asset);
        return it != spot_.end() ? it->second : 0.0;
    }

private:
    std::shared_ptr<PaperVenueClient> venue_;
    std::mt19937 rng_;
    std::map<std::string, double> probs_;
    std::map<std::string, double> spot_;
};

// Synthetic 15-minute markets used when the config lists none
std::vector<MarketSpec> demo_markets(int64_t now_s) {
    const int64_t window = 15 * 60;
    const int64_t expiry = (now_s / window + 1) * window;
    std::vector<MarketSpec> out;
    for (const std::string asset : {"BTC", "ETH"}) {
        MarketSpec m;
        m.market_id = fmt::format("{}-updown-{}", asset, expiry);
        m.asset = asset;
        m.up_token_id = m.market_id + "-UP";
        m.down_token_id = m.market_id + "-DOWN";
        m.expiry_epoch_s = expiry;
        out.push_back(m);
    }
    return out;
}

int main(int argc, char* argv[]) {
    CLI::App app{"updown-engine - paired up/down market execution engine"};

    std::string config_path = EngineConfig::get_env("UPDOWN_CONFIG", "config/default.json");
    std::string mode;
    std::string log_level;
    std::string events_db;
    double duration_s = 0.0;
    bool dump_config = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-m,--mode", mode, "Trading mode")
        ->check(CLI::IsMember({"dry-run", "paper"}));
    app.add_option("-l,--log-level", log_level, "Log level")
        ->check(CLI::IsMember({"debug", "info", "warn", "error"}));
    app.add_option("-d,--duration", duration_s, "Run time in seconds (0 = until Ctrl+C)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--events-db", events_db, "SQLite telemetry database path");
    app.add_flag("--dump-config", dump_config, "Print the effective configuration and exit");

    CLI11_PARSE(app, argc, argv);

    EngineConfig config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = EngineConfig::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (mode == "paper") {
        config.mode = TradingMode::PAPER;
    } else if (mode == "dry-run") {
        config.mode = TradingMode::DRY_RUN;
    }
    if (!log_level.empty()) config.logging.log_level = log_level;
    if (!events_db.empty()) config.telemetry.events_db_path = events_db;

    if (dump_config) {
        nlohmann::json j;
        to_json(j, config);
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    setup_logging(config.logging);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing updown-engine (mode={}, run_id={})",
                 mode_to_string(config.mode), config.run_id);

    // Telemetry
    auto fanout = std::make_shared<FanoutEventSink>();
    std::shared_ptr<EventStore> event_store;
    if (config.telemetry.enabled) {
        if (config.telemetry.log_events) {
            fanout->add(std::make_shared<LogEventSink>());
        }
        try {
            auto db_dir = std::filesystem::path(config.telemetry.events_db_path).parent_path();
            if (!db_dir.empty()) std::filesystem::create_directories(db_dir);
            event_store = std::make_shared<EventStore>(config.telemetry.events_db_path);
            event_store->initialize_schema();
            fanout->add(event_store);
        } catch (const std::exception& e) {
            spdlog::error("Event store unavailable, continuing without it: {}", e.what());
        }
    }

    auto clock = make_system_clock();

    // Dry-run acknowledges orders without fills; paper simulates fills
    PaperVenueClient::Config venue_config;
    venue_config.simulate_fills = config.mode == TradingMode::PAPER;
    auto venue = std::make_shared<PaperVenueClient>(clock, venue_config);

    if (config.markets.empty()) {
        config.markets = demo_markets(clock->now_ms() / 1000);
        spdlog::info("No markets configured, using {} synthetic 15m markets", config.markets.size());
    }

    PaperMarketSimulator simulator(venue, static_cast<uint32_t>(clock->now_ms()));
    for (const auto& m : config.markets) {
        simulator.add(m);
    }

    std::unique_ptr<EngineContext> ctx;
    try {
        ctx = EngineContext::create(config, venue, clock, fanout);
    } catch (const std::exception& e) {
        spdlog::error("Engine setup failed: {}", e.what());
        return 1;
    }
    EngineRunner runner(*ctx);

    const EpochMs start = clock->now_ms();
    int64_t last_status = start;

    while (!g_shutdown.load()) {
        const EpochMs now = clock->now_ms();
        if (duration_s > 0.0 && static_cast<double>(now - start) / 1000.0 >= duration_s) {
            break;
        }

        // Roll expired markets into the next window
        for (const auto& m : runner.markets()) {
            if (static_cast<double>(m.expiry_epoch_s) * 1000.0 + 5000.0 < static_cast<double>(now)) {
                runner.remove_market(m.key());
                spdlog::info("Market {} closed", m.key().to_string());
            }
        }
        if (runner.markets().empty()) {
            for (const auto& m : demo_markets(now / 1000)) {
                simulator.add(m);
                runner.add_market(m);
            }
        }

        for (const auto& m : runner.markets()) {
            simulator.step(m);
            runner.on_spot_price(m.asset, simulator.spot(m.asset));
        }
        for (const auto& fill : venue->drain_fills()) {
            runner.on_order_fill(fill.order_id, fill.token_id, fill.price, fill.size);
        }

        runner.run_once();

        if (now - last_status >= 10000) {
            last_status = now;
            auto cadence = ctx->cadence->stats();
            auto hedges = ctx->escalator->stats();
            spdlog::info("[Status] markets={} cold/warm/hot={}/{}/{} reserved=${:.2f} "
                         "hedges={} ok={} failed={} events={}",
                         cadence.total, cadence.cold, cadence.warm, cadence.hot,
                         ctx->ledger->total_reserved(), hedges.sequences, hedges.successes,
                         hedges.failures, event_store ? event_store->count() : 0);
        }

        clock->sleep_ms(config.quoting.loop_interval_ms);
    }

    spdlog::info("Shutting down...");
    for (const auto& m : runner.markets()) {
        ctx->order_manager->cancel_all_orders(m);
    }
    for (const auto& m : runner.markets()) {
        auto inv = runner.inventory(m.key());
        spdlog::info("  {} UP {:.1f} (${:.2f}) / DOWN {:.1f} (${:.2f})",
                     m.key().to_string(), inv.up_shares, inv.up_cost,
                     inv.down_shares, inv.down_cost);
    }
    spdlog::info("Shutdown complete after {} cycles", runner.cycles());
    return 0;
}
