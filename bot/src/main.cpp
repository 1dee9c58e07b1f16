#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "bot_config.hpp"
#include "http_client.hpp"
#include "coingecko_client.hpp"
#include "ollama_client.hpp"
#include "paper_exchange.hpp"
#include "binance_exchange.hpp"
#include "trading_bot.hpp"
#include "background_tasks.hpp"

namespace {

TradingBot* g_bot = nullptr;

void handle_signal(int sig) {
    if (g_bot) g_bot->stop();
    // A second Ctrl-C ends the process without waiting
    std::signal(sig, SIG_DFL);
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    BotConfig config;
    std::string config_path = find_config_path(argc, argv, "config/bot_config.json");
    try {
        if (!load_config_file(config, config_path)) {
            std::cout << "No config file found at " << config_path << ", using defaults" << std::endl;
        }
        apply_env_overrides(config);
        apply_cli_args(config, argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "❌ Configuration error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> errors = validate_config(config);
    if (!errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << "❌ Invalid configuration: " << err << std::endl;
        }
        return 1;
    }

    http_global_init();
    int exit_code = 0;

    try {
        auto market = std::make_shared<CoinGeckoClient>("https://api.coingecko.com/api/v3",
                                                         config.market_data_timeout_secs);

        std::shared_ptr<LlmBackend> llm;
        if (config.ollama_enabled) {
            llm = std::make_shared<OllamaClient>(config.ollama_url);
        }

        std::shared_ptr<Exchange> exchange;
        if (config.is_simulation()) {
            exchange = std::make_shared<PaperExchange>(config.quote_asset, config.simulation_initial_balance);
        } else {
            exchange = std::make_shared<BinanceExchange>(config.api_key, config.api_secret,
                                                         config.exchange == "binance_testnet",
                                                         config.quantity_decimals, config.quote_asset);
        }

        std::cout << "Starting Pivot AI Trader..." << std::endl;
        TradingBot bot(config, market, llm, exchange);

        g_bot = &bot;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        bot.run();

        g_bot = nullptr;
    } catch (const std::exception& e) {
        std::cerr << "❌ Fatal: " << e.what() << std::endl;
        exit_code = 1;
    }

    // Requests abandoned at a cycle deadline may still be inside libcurl
    auto grace = seconds(config.ai_timeout_secs + 6 * config.market_data_timeout_secs + 10);
    if (background_tasks().in_flight() > 0) {
        std::cout << "Waiting up to " << grace.count() << "s for " << background_tasks().in_flight()
                  << " in-flight request(s)..." << std::endl;
    }
    if (background_tasks().wait_idle(grace)) {
        http_global_cleanup();
    } else {
        std::cerr << "⚠️ Requests still running after " << grace.count() << "s, skipping libcurl cleanup" << std::endl;
    }
    return exit_code;
}
