#pragma once

#include <string>
#include "models.hpp"

// Supplies candle windows (12h/24h/48h) and the current price for a symbol
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    // Throws std::runtime_error when no data could be fetched at all
    virtual MarketSnapshot fetch_snapshot(const std::string& symbol) = 0;
};
