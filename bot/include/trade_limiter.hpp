#pragma once

#include <string>
#include <chrono>
#include "models.hpp"

/*
 * DAILY TRADE LIMITER
 *
 * Caps the number of executed trades per UTC calendar day. The state is owned
 * by this class alone and written to disk after every change through a
 * temporary file that is renamed over the real one, so a crash mid-write
 * leaves either the old or the new state on disk, never a torn one.
 *
 * On-disk format: {"date": "YYYY-MM-DD", "count": N, "last_reset_date": "YYYY-MM-DD"}
 */

struct DailyTradeState {
    std::string utc_date;
    int count = 0;
    std::string last_reset_date;
};

struct TradeLimitStatus {
    std::string date;
    int trades_executed = 0;
    int trades_remaining = 0;
    int max_trades_per_day = 0;
    bool can_trade = false;
};

class TradeLimiter {
public:
    TradeLimiter(const std::string& state_file, int max_trades_per_day,
                 system_clock::time_point now = system_clock::now());

    // True iff another trade fits under today's cap (rolls the day over first)
    bool can_trade(system_clock::time_point now);

    // Resets the count when the UTC date has advanced; returns true if it did
    bool reset_if_new_day(system_clock::time_point now);

    // Counts an executed trade; returns false if the new state could not be persisted
    bool record_trade(OrderSide side, system_clock::time_point now);

    // Atomically rewrites the current state; false on any I/O failure
    bool persist() const;

    TradeLimitStatus get_status(system_clock::time_point now);

    const DailyTradeState& state() const { return state_; }
    int max_trades_per_day() const { return max_trades_per_day_; }
    const std::string& state_file() const { return state_file_; }

private:
    void load_state(system_clock::time_point now);

    std::string state_file_;
    int max_trades_per_day_;
    DailyTradeState state_;
};
