#pragma once

#include <string>
#include <vector>
#include <utility>
#include "market_data_source.hpp"

/*
 * COINGECKO MARKET DATA
 *
 * Price and 24h stats come from /coins/markets; hourly prices for the last two
 * days come from /coins/{id}/market_chart and are turned into pseudo-candles
 * (open = one sample, close = the next). The 12h and 24h windows are the tails
 * of the 48h window.
 */
class CoinGeckoClient : public MarketDataSource {
public:
    explicit CoinGeckoClient(const std::string& base_url = "https://api.coingecko.com/api/v3",
                             long timeout_secs = 15);

    MarketSnapshot fetch_snapshot(const std::string& symbol) override;

    // "BTCUSDT" -> "bitcoin"; unknown symbols default to bitcoin
    static std::string symbol_to_coin_id(const std::string& symbol);

    // (timestamp_ms, price) samples -> pseudo-OHLC candles, oldest first
    static std::vector<Candle> prices_to_candles(const std::vector<std::pair<long long, double>>& prices);

private:
    std::string base_url_;
    long timeout_secs_;
};
