#pragma once

#include <vector>
#include "models.hpp"

/*
 * INDICATOR ENGINE
 *
 * Stateless technical indicators over candle history (most recent candle at
 * the back). Every function is pure and safe to call from several threads.
 * Windows that are too short throw InsufficientDataError instead of returning
 * a neutral default.
 */

// High/low/close of a fully closed period
struct PeriodRange {
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
};

class IndicatorEngine {
public:
    static constexpr int DEFAULT_RSI_PERIOD = 14;

    // Mean of the last `period` closes
    static double compute_sma(const std::vector<Candle>& candles, int period);

    // Relative Strength Index with Wilder smoothing, in [0, 100]
    static double compute_rsi(const std::vector<Candle>& candles, int period = DEFAULT_RSI_PERIOD);

    // Classic floor-trader pivots from a prior period's high/low/close
    static PivotLevels compute_pivot_levels(double high, double low, double close);

    // Direction of the short/long SMA crossing between the previous and the last candle
    static SmaCross compute_sma_cross(const std::vector<Candle>& candles, int short_period, int long_period);

    // Range of the candles whose period ended at or before `now`
    static PeriodRange closed_period(const std::vector<Candle>& candles,
                                     system_clock::time_point now,
                                     int interval_secs);

    static IndicatorSet compute_indicators(const std::vector<Candle>& candles,
                                           int short_period,
                                           int long_period,
                                           int rsi_period = DEFAULT_RSI_PERIOD);
};
