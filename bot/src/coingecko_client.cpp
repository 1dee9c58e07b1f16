#include "coingecko_client.hpp"
#include "http_client.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace {
constexpr int CHART_DAYS = 2;
constexpr size_t WINDOW_12H = 12;
constexpr size_t WINDOW_24H = 24;

std::vector<Candle> tail(const std::vector<Candle>& candles, size_t n) {
    if (candles.size() <= n) return candles;
    return std::vector<Candle>(candles.end() - n, candles.end());
}
}

CoinGeckoClient::CoinGeckoClient(const std::string& base_url, long timeout_secs)
    : base_url_(base_url), timeout_secs_(timeout_secs) {}

std::string CoinGeckoClient::symbol_to_coin_id(const std::string& symbol) {
    static const std::map<std::string, std::string> coin_ids = {
        {"BTC", "bitcoin"}, {"ETH", "ethereum"}, {"BNB", "binancecoin"},
        {"XRP", "ripple"}, {"ADA", "cardano"}, {"SOL", "solana"},
        {"DOT", "polkadot"}, {"DOGE", "dogecoin"}, {"MATIC", "matic-network"},
        {"LTC", "litecoin"}, {"AVAX", "avalanche-2"}, {"LINK", "chainlink"},
        {"ATOM", "cosmos"}, {"UNI", "uniswap"}, {"XLM", "stellar"}
    };

    std::string upper = symbol;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    for (const char* quote : {"USDT", "USDC", "BUSD", "USD"}) {
        std::string q(quote);
        if (upper.size() > q.size() && upper.compare(upper.size() - q.size(), q.size(), q) == 0) {
            upper = upper.substr(0, upper.size() - q.size());
            break;
        }
    }

    auto it = coin_ids.find(upper);
    return it != coin_ids.end() ? it->second : "bitcoin";
}

std::vector<Candle> CoinGeckoClient::prices_to_candles(const std::vector<std::pair<long long, double>>& prices) {
    std::vector<Candle> candles;
    if (prices.empty()) return candles;
    candles.reserve(prices.size());

    for (size_t i = 0; i + 1 < prices.size(); i++) {
        Candle c;
        c.timestamp = static_cast<long>(prices[i].first / 1000);
        c.open = prices[i].second;
        c.close = prices[i + 1].second;
        c.high = std::max(c.open, c.close);
        c.low = std::min(c.open, c.close);
        candles.push_back(c);
    }

    // Latest sample as a still-open candle
    Candle last;
    last.timestamp = static_cast<long>(prices.back().first / 1000);
    last.open = last.high = last.low = last.close = prices.back().second;
    candles.push_back(last);
    return candles;
}

MarketSnapshot CoinGeckoClient::fetch_snapshot(const std::string& symbol) {
    std::string coin_id = symbol_to_coin_id(symbol);
    std::cout << "📡 Fetching CoinGecko data for " << symbol << " (" << coin_id << ")" << std::endl;

    std::vector<std::string> headers = {"Accept: application/json"};

    json markets = retry_with_backoff([&]() {
        std::string url = base_url_ + "/coins/markets?vs_currency=usd&ids=" + coin_id +
                          "&order=market_cap_desc&sparkline=false";
        return parse_json_response(http_get(url, headers, timeout_secs_), "CoinGecko markets");
    }, 3, 1000);

    if (!markets.is_array() || markets.empty()) {
        throw std::runtime_error("No market data found for " + coin_id);
    }
    const json& market = markets[0];

    auto number_or = [](const json& obj, const char* key, double fallback) {
        return obj.contains(key) && obj[key].is_number() ? obj[key].get<double>() : fallback;
    };

    MarketSnapshot snap;
    snap.symbol = symbol;
    snap.current_price = number_or(market, "current_price", 0.0);
    if (snap.current_price <= 0) {
        throw std::runtime_error("CoinGecko returned no price for " + coin_id);
    }
    snap.high_24h = number_or(market, "high_24h", snap.current_price);
    snap.low_24h = number_or(market, "low_24h", snap.current_price);
    snap.change_24h_pct = number_or(market, "price_change_percentage_24h", 0.0);
    snap.volume_24h = number_or(market, "total_volume", 0.0);
    snap.candle_interval_secs = 3600;
    snap.captured_at = system_clock::now();

    // A failed chart fetch leaves the windows empty; the indicator step reports it
    try {
        json chart = retry_with_backoff([&]() {
            std::string url = base_url_ + "/coins/" + coin_id + "/market_chart?vs_currency=usd&days=" +
                              std::to_string(CHART_DAYS);
            return parse_json_response(http_get(url, headers, timeout_secs_), "CoinGecko market_chart");
        }, 3, 1000);

        std::vector<std::pair<long long, double>> prices;
        for (const auto& point : chart.at("prices")) {
            if (point.is_array() && point.size() >= 2 && point[0].is_number() && point[1].is_number()) {
                prices.emplace_back(point[0].get<long long>(), point[1].get<double>());
            }
        }

        snap.candles_48h = prices_to_candles(prices);
        snap.candles_24h = tail(snap.candles_48h, WINDOW_24H);
        snap.candles_12h = tail(snap.candles_48h, WINDOW_12H);
        std::cout << "Fetched " << snap.candles_48h.size() << " hourly data points for " << coin_id << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "⚠️ Hourly chart unavailable for " << coin_id << ": " << e.what() << std::endl;
    }

    return snap;
}
