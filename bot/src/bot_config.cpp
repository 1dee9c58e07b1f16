#include "bot_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

bool parse_bool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return v == "true" || v == "1" || v == "yes";
}

template<typename T>
void read_key(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

}  // namespace

bool load_config_file(BotConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Error parsing config " + path + ": " + e.what());
    }

    try {
        read_key(j, "symbol", config.symbol);
        read_key(j, "quote_asset", config.quote_asset);
        read_key(j, "exchange", config.exchange);
        read_key(j, "simulation_mode", config.simulation_mode);
        read_key(j, "simulation_initial_balance", config.simulation_initial_balance);
        read_key(j, "quantity_decimals", config.quantity_decimals);
        read_key(j, "max_trades_per_day", config.max_trades_per_day);
        read_key(j, "buy_fraction", config.buy_fraction);
        read_key(j, "sma_short_period", config.sma_short_period);
        read_key(j, "sma_long_period", config.sma_long_period);
        read_key(j, "rsi_period", config.rsi_period);
        read_key(j, "cycle_interval_secs", config.cycle_interval_secs);
        read_key(j, "cycle_deadline_secs", config.cycle_deadline_secs);
        read_key(j, "market_data_timeout_secs", config.market_data_timeout_secs);
        read_key(j, "ai_recalc_interval_secs", config.ai_recalc_interval_secs);
        read_key(j, "ai_timeout_secs", config.ai_timeout_secs);
        read_key(j, "reconcile_abs_tolerance", config.reconcile_abs_tolerance);
        read_key(j, "reconcile_rel_tolerance", config.reconcile_rel_tolerance);

        if (j.contains("ollama") && j["ollama"].is_object()) {
            const json& o = j["ollama"];
            read_key(o, "enabled", config.ollama_enabled);
            read_key(o, "url", config.ollama_url);
            read_key(o, "model", config.ollama_model);
        }
        if (j.contains("paths") && j["paths"].is_object()) {
            const json& p = j["paths"];
            read_key(p, "report", config.report_path);
            read_key(p, "trade_state", config.trade_state_file);
            read_key(p, "trades_db", config.trades_db);
        }
    } catch (const json::type_error& e) {
        throw std::runtime_error("Bad value type in config " + path + ": " + e.what());
    }

    std::cout << "Loaded config from " << path << std::endl;
    return true;
}

void apply_env_overrides(BotConfig& config) {
    if (auto v = env("SYMBOL")) config.symbol = v;
    if (auto v = env("EXCHANGE")) {
        config.exchange = v;
        config.simulation_mode = config.exchange == "simulation";
    }
    if (auto v = env("SIMULATION_MODE")) config.simulation_mode = parse_bool(v);
    if (auto v = env("SIMULATION_INITIAL_BALANCE")) config.simulation_initial_balance = std::stod(v);
    if (auto v = env("OLLAMA_ENABLED")) config.ollama_enabled = parse_bool(v);
    if (auto v = env("OLLAMA_URL")) config.ollama_url = v;
    if (auto v = env("OLLAMA_MODEL")) config.ollama_model = v;
    if (auto v = env("REPORT_PATH")) config.report_path = v;
    if (auto v = env("TRADE_STATE_FILE")) config.trade_state_file = v;
    if (auto v = env("TRADES_DB")) config.trades_db = v;
    if (auto v = env("API_KEY")) config.api_key = v;
    if (auto v = env("API_SECRET")) config.api_secret = v;
}

std::string find_config_path(int argc, char* argv[], const std::string& default_path) {
    for (int i = 1; i < argc - 1; i++) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    return default_path;
}

void apply_cli_args(BotConfig& config, int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--paper") {
            config.simulation_mode = true;
            config.exchange = "simulation";
        } else if (arg == "--live") {
            config.simulation_mode = false;
            if (config.exchange == "simulation") config.exchange = "binance";
        }
        else if (arg == "--no-ai") config.ollama_enabled = false;
        else if (arg == "--symbol") config.symbol = next();
        else if (arg == "--interval") config.cycle_interval_secs = std::stoi(next());
        else if (arg == "--max-trades") config.max_trades_per_day = std::stoi(next());
        else if (arg == "--fraction") config.buy_fraction = std::stod(next());
        else if (arg == "--config") next();
        else throw std::invalid_argument("Unknown option: " + arg);
    }
}

std::vector<std::string> validate_config(const BotConfig& c) {
    std::vector<std::string> errors;

    if (c.symbol.empty()) errors.push_back("symbol is empty");
    if (c.quote_asset.empty() || c.symbol.size() <= c.quote_asset.size() ||
        c.symbol.compare(c.symbol.size() - c.quote_asset.size(), c.quote_asset.size(), c.quote_asset) != 0) {
        errors.push_back("symbol " + c.symbol + " is not quoted in " + c.quote_asset);
    }
    if (c.exchange != "simulation" && c.exchange != "binance" && c.exchange != "binance_testnet") {
        errors.push_back("unsupported exchange: " + c.exchange);
    }
    if (!c.is_simulation() && (c.api_key.empty() || c.api_secret.empty())) {
        errors.push_back("API_KEY and API_SECRET are required for " + c.exchange);
    }
    if (c.is_simulation() && c.simulation_initial_balance <= 0) {
        errors.push_back("simulation_initial_balance must be positive");
    }
    if (c.max_trades_per_day < 1) errors.push_back("max_trades_per_day must be at least 1");
    if (!(c.buy_fraction > 0.0 && c.buy_fraction <= 1.0)) errors.push_back("buy_fraction must be in (0, 1]");
    if (c.sma_short_period < 1) errors.push_back("sma_short_period must be positive");
    if (c.sma_short_period >= c.sma_long_period) errors.push_back("sma_short_period must be below sma_long_period");
    if (c.rsi_period < 2) errors.push_back("rsi_period must be at least 2");
    if (c.cycle_interval_secs < 1) errors.push_back("cycle_interval_secs must be positive");
    if (c.cycle_deadline_secs < 1) errors.push_back("cycle_deadline_secs must be positive");
    if (c.market_data_timeout_secs < 1) errors.push_back("market_data_timeout_secs must be positive");
    else if (c.market_data_timeout_secs >= c.cycle_deadline_secs) {
        errors.push_back("market_data_timeout_secs must be below cycle_deadline_secs");
    }
    if (c.ai_timeout_secs < 1) errors.push_back("ai_timeout_secs must be positive");
    else if (c.ollama_enabled && c.ai_timeout_secs + c.market_data_timeout_secs >= c.cycle_deadline_secs) {
        // The AI only gets what is left of the cycle after the market fetch
        errors.push_back("ai_timeout_secs + market_data_timeout_secs must be below cycle_deadline_secs");
    }
    if (c.ai_recalc_interval_secs < 0) errors.push_back("ai_recalc_interval_secs must not be negative");
    if (c.reconcile_abs_tolerance < 0 || c.reconcile_rel_tolerance < 0) {
        errors.push_back("reconciliation tolerances must not be negative");
    }
    if (c.quantity_decimals < 0 || c.quantity_decimals > 8) errors.push_back("quantity_decimals must be in [0, 8]");
    if (c.trade_state_file.empty()) errors.push_back("trade_state_file is empty");

    return errors;
}

void print_config(const BotConfig& c) {
    std::cout << "  Symbol: " << c.symbol << " (quote " << c.quote_asset << ")" << std::endl;
    std::cout << "  Exchange: " << (c.is_simulation() ? "SIMULATION" : c.exchange) << std::endl;
    if (c.is_simulation()) {
        std::cout << "  Starting balance: " << c.simulation_initial_balance << " " << c.quote_asset << std::endl;
    }
    std::cout << "  Max trades/day: " << c.max_trades_per_day << " | Buy fraction: " << c.buy_fraction * 100 << "%" << std::endl;
    std::cout << "  SMA: " << c.sma_short_period << "/" << c.sma_long_period << " | RSI: " << c.rsi_period << std::endl;
    std::cout << "  Cycle: " << c.cycle_interval_secs << "s (deadline " << c.cycle_deadline_secs << "s)" << std::endl;
    std::cout << "  AI: " << (c.ollama_enabled ? c.ollama_model + " @ " + c.ollama_url : "disabled")
              << " | refresh " << c.ai_recalc_interval_secs << "s, timeout " << c.ai_timeout_secs << "s" << std::endl;
    std::cout << "  Files: " << c.trade_state_file << ", " << c.trades_db << ", " << c.report_path << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --paper              Simulated exchange (default)\n"
              << "  --live               Real exchange (EXCHANGE=binance|binance_testnet)\n"
              << "  --symbol SYMBOL      Trading pair, e.g. BTCUSDT\n"
              << "  --interval SECS      Seconds between decision cycles\n"
              << "  --max-trades N       Trades allowed per UTC day\n"
              << "  --fraction F         Share of the quote balance used per buy, (0, 1]\n"
              << "  --no-ai              Always use the rule-based targets\n"
              << "  --config PATH        JSON configuration file\n";
}
