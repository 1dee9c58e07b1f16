#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <stdexcept>

using namespace std::chrono;

/*
 * SHARED TRADING MODELS
 *
 * Plain value types passed between the market data source, the indicator
 * engine, the advisor, the decision engine and the exchange.
 */

// Thrown when a window holds too few candles for an indicator
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

struct Candle {
    long timestamp = 0;   // Open time, epoch seconds
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

struct MarketSnapshot {
    std::string symbol;
    std::vector<Candle> candles_12h;
    std::vector<Candle> candles_24h;
    std::vector<Candle> candles_48h;
    double current_price = 0.0;
    double high_24h = 0.0;
    double low_24h = 0.0;
    double change_24h_pct = 0.0;
    double volume_24h = 0.0;
    int candle_interval_secs = 3600;
    system_clock::time_point captured_at;
};

struct PivotLevels {
    double pp = 0.0;
    double r1 = 0.0;
    double r2 = 0.0;
    double s1 = 0.0;
    double s2 = 0.0;
};

enum class SmaCross { NONE, UP, DOWN };

struct IndicatorSet {
    double sma_short = 0.0;
    double sma_long = 0.0;
    double rsi = 50.0;
    SmaCross sma_cross = SmaCross::NONE;  // Versus the previous candle

    bool is_bullish() const { return sma_short > sma_long; }
};

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET };

struct Order {
    OrderSide side = OrderSide::BUY;
    std::string symbol;
    double quantity = 0.0;
    OrderType type = OrderType::MARKET;
};

struct Fill {
    double price = 0.0;
    double quantity = 0.0;
    system_clock::time_point timestamp;
};

enum class RejectReason { NONE, INSUFFICIENT_BALANCE, RATE_LIMITED, CONNECTIVITY, INVALID_ORDER, UNKNOWN };

// Either a confirmed fill or the reason the exchange did not execute
struct OrderResult {
    bool filled = false;
    Fill fill;
    RejectReason reason = RejectReason::NONE;
    std::string message;

    static OrderResult executed(const Fill& f) {
        OrderResult r;
        r.filled = true;
        r.fill = f;
        return r;
    }
    static OrderResult rejected(RejectReason why, const std::string& msg) {
        OrderResult r;
        r.reason = why;
        r.message = msg;
        return r;
    }
};

std::string side_to_string(OrderSide side);
std::string reject_reason_to_string(RejectReason reason);
std::string sma_cross_to_string(SmaCross cross);

// "BTCUSDT" -> {"BTC", "USDT"}; falls back to the configured quote asset
std::pair<std::string, std::string> split_symbol(const std::string& symbol, const std::string& quote_asset);

// YYYY-MM-DD of the given instant in UTC
std::string utc_date_string(system_clock::time_point tp);

long to_epoch_seconds(system_clock::time_point tp);
