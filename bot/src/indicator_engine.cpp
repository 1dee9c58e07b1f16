#include "indicator_engine.hpp"
#include <algorithm>
#include <string>

double IndicatorEngine::compute_sma(const std::vector<Candle>& candles, int period) {
    if (period <= 0) {
        throw InsufficientDataError("SMA period must be positive");
    }
    if (candles.size() < static_cast<size_t>(period)) {
        throw InsufficientDataError("SMA(" + std::to_string(period) + ") needs " + std::to_string(period) +
                                    " candles, have " + std::to_string(candles.size()));
    }

    double sum = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); i++) {
        sum += candles[i].close;
    }
    return sum / period;
}

double IndicatorEngine::compute_rsi(const std::vector<Candle>& candles, int period) {
    if (period <= 0) {
        throw InsufficientDataError("RSI period must be positive");
    }
    if (candles.size() < static_cast<size_t>(period + 1)) {
        throw InsufficientDataError("RSI(" + std::to_string(period) + ") needs " + std::to_string(period + 1) +
                                    " candles, have " + std::to_string(candles.size()));
    }

    double avg_gain = 0.0, avg_loss = 0.0;

    // Seed with the simple average of the first `period` changes
    for (int i = 1; i <= period; i++) {
        double change = candles[i].close - candles[i - 1].close;
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= period;
    avg_loss /= period;

    // Wilder smoothing over the remaining changes
    for (size_t i = period + 1; i < candles.size(); i++) {
        double change = candles[i].close - candles[i - 1].close;
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;

        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }

    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    double rsi = 100.0 - (100.0 / (1.0 + rs));
    return std::max(0.0, std::min(100.0, rsi));
}

PivotLevels IndicatorEngine::compute_pivot_levels(double high, double low, double close) {
    PivotLevels levels;
    double range = high - low;
    levels.pp = (high + low + close) / 3.0;
    levels.r1 = 2.0 * levels.pp - low;
    levels.r2 = levels.pp + range;
    levels.s1 = 2.0 * levels.pp - high;
    levels.s2 = levels.pp - range;
    return levels;
}

SmaCross IndicatorEngine::compute_sma_cross(const std::vector<Candle>& candles, int short_period, int long_period) {
    if (candles.size() < static_cast<size_t>(long_period + 1)) {
        throw InsufficientDataError("SMA crossover needs " + std::to_string(long_period + 1) +
                                    " candles, have " + std::to_string(candles.size()));
    }

    std::vector<Candle> previous(candles.begin(), candles.end() - 1);
    double prev_short = compute_sma(previous, short_period);
    double prev_long = compute_sma(previous, long_period);
    double cur_short = compute_sma(candles, short_period);
    double cur_long = compute_sma(candles, long_period);

    if (prev_short <= prev_long && cur_short > cur_long) return SmaCross::UP;
    if (prev_short >= prev_long && cur_short < cur_long) return SmaCross::DOWN;
    return SmaCross::NONE;
}

PeriodRange IndicatorEngine::closed_period(const std::vector<Candle>& candles,
                                           system_clock::time_point now,
                                           int interval_secs) {
    long now_secs = to_epoch_seconds(now);
    PeriodRange range;
    bool found = false;

    for (const auto& candle : candles) {
        // A candle still forming must not feed the pivots
        if (candle.timestamp + interval_secs > now_secs) continue;

        if (!found) {
            range.high = candle.high;
            range.low = candle.low;
            found = true;
        } else {
            range.high = std::max(range.high, candle.high);
            range.low = std::min(range.low, candle.low);
        }
        range.close = candle.close;
    }

    if (!found) {
        throw InsufficientDataError("No fully closed candle in the pivot window");
    }
    return range;
}

IndicatorSet IndicatorEngine::compute_indicators(const std::vector<Candle>& candles,
                                                 int short_period,
                                                 int long_period,
                                                 int rsi_period) {
    IndicatorSet set;
    set.sma_short = compute_sma(candles, short_period);
    set.sma_long = compute_sma(candles, long_period);
    set.rsi = compute_rsi(candles, rsi_period);
    set.sma_cross = compute_sma_cross(candles, short_period, long_period);
    return set;
}
