#pragma once

#include <string>
#include <vector>

/*
 * BOT CONFIGURATION
 *
 * Defaults below, then config/bot_config.json, then environment variables,
 * then command-line flags; later layers win.
 */
struct BotConfig {
    // Market
    std::string symbol = "BTCUSDT";
    std::string quote_asset = "USDT";

    // Venue: "simulation", "binance" or "binance_testnet"
    std::string exchange = "simulation";
    bool simulation_mode = true;
    double simulation_initial_balance = 10000.0;
    std::string api_key;
    std::string api_secret;
    int quantity_decimals = 5;

    // Trading rules
    int max_trades_per_day = 2;
    double buy_fraction = 0.10;
    int sma_short_period = 10;
    int sma_long_period = 20;
    int rsi_period = 14;

    // Timing. A cycle waiting on the AI may run past the interval; the next
    // tick then starts as soon as it finishes.
    int cycle_interval_secs = 30;
    int cycle_deadline_secs = 150;
    int market_data_timeout_secs = 15;
    int ai_recalc_interval_secs = 300;
    int ai_timeout_secs = 120;

    // AI advisor
    bool ollama_enabled = true;
    std::string ollama_url = "http://localhost:11434";
    std::string ollama_model = "mistral";

    // Reconciliation tolerance: abs + rel * max(|ledger|, |exchange|)
    double reconcile_abs_tolerance = 1e-8;
    double reconcile_rel_tolerance = 0.005;

    // Files
    std::string report_path = "portfolio_status.txt";
    std::string trade_state_file = "trade_state.json";
    std::string trades_db = "trades.db";

    bool is_simulation() const { return simulation_mode || exchange == "simulation"; }
};

// Returns false when the file does not exist; throws std::runtime_error on malformed JSON
bool load_config_file(BotConfig& config, const std::string& path);

void apply_env_overrides(BotConfig& config);

// Value of --config if given, otherwise `default_path`
std::string find_config_path(int argc, char* argv[], const std::string& default_path);

// Throws std::invalid_argument on an unknown flag or a missing/bad value
void apply_cli_args(BotConfig& config, int argc, char* argv[]);

// Human-readable problems; empty when the configuration is usable
std::vector<std::string> validate_config(const BotConfig& config);

void print_config(const BotConfig& config);
void print_usage(const char* program);
