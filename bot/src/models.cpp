#include "models.hpp"
#include <ctime>

std::string side_to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

std::string reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case RejectReason::RATE_LIMITED: return "RATE_LIMITED";
        case RejectReason::CONNECTIVITY: return "CONNECTIVITY";
        case RejectReason::INVALID_ORDER: return "INVALID_ORDER";
        default: return "UNKNOWN";
    }
}

std::string sma_cross_to_string(SmaCross cross) {
    switch (cross) {
        case SmaCross::UP: return "UP";
        case SmaCross::DOWN: return "DOWN";
        default: return "NONE";
    }
}

std::pair<std::string, std::string> split_symbol(const std::string& symbol, const std::string& quote_asset) {
    if (symbol.size() > quote_asset.size() &&
        symbol.compare(symbol.size() - quote_asset.size(), quote_asset.size(), quote_asset) == 0) {
        return {symbol.substr(0, symbol.size() - quote_asset.size()), quote_asset};
    }
    // Unknown suffix: treat the last three letters as the quote
    if (symbol.size() > 3) {
        return {symbol.substr(0, symbol.size() - 3), symbol.substr(symbol.size() - 3)};
    }
    return {symbol, quote_asset};
}

std::string utc_date_string(system_clock::time_point tp) {
    std::time_t t = system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &utc);
    return buf;
}

long to_epoch_seconds(system_clock::time_point tp) {
    return static_cast<long>(duration_cast<seconds>(tp.time_since_epoch()).count());
}
