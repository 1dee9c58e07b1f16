#include "trade_limiter.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

TradeLimiter::TradeLimiter(const std::string& state_file, int max_trades_per_day,
                           system_clock::time_point now)
    : state_file_(state_file), max_trades_per_day_(max_trades_per_day) {
    if (max_trades_per_day_ < 0) {
        throw std::invalid_argument("max_trades_per_day must not be negative");
    }
    load_state(now);
}

void TradeLimiter::load_state(system_clock::time_point now) {
    std::string today = utc_date_string(now);

    std::ifstream f(state_file_);
    if (!f.good()) {
        // First run: nothing traded yet today
        state_ = DailyTradeState{today, 0, today};
        std::cout << "No trade state at " << state_file_ << ", starting fresh for " << today << std::endl;
        if (!persist()) {
            std::cerr << "⚠️ Could not write initial trade state to " << state_file_ << std::endl;
        }
        return;
    }

    try {
        json j;
        f >> j;
        DailyTradeState loaded;
        loaded.utc_date = j.at("date").get<std::string>();
        loaded.count = j.at("count").get<int>();
        loaded.last_reset_date = j.value("last_reset_date", loaded.utc_date);
        if (loaded.count < 0 || loaded.utc_date.size() != 10) {
            throw std::runtime_error("invalid trade state values");
        }
        if (loaded.count > max_trades_per_day_) {
            loaded.count = max_trades_per_day_;
        }
        state_ = loaded;
        std::cout << "Loaded trade state for " << state_.utc_date << ": "
                  << state_.count << "/" << max_trades_per_day_ << " trades" << std::endl;
    } catch (const std::exception& e) {
        // Unknown history: assume today's cap is already used rather than risk exceeding it
        std::cerr << "❌ Corrupt trade state in " << state_file_ << " (" << e.what()
                  << ") - blocking trades for " << today << std::endl;
        state_ = DailyTradeState{today, max_trades_per_day_, today};
    }
}

bool TradeLimiter::persist() const {
    json j = {
        {"date", state_.utc_date},
        {"count", state_.count},
        {"last_reset_date", state_.last_reset_date}
    };

    std::string tmp_path = state_file_ + ".tmp";
    try {
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                std::cerr << "❌ Cannot open " << tmp_path << " for writing" << std::endl;
                return false;
            }
            out << j.dump(2) << std::endl;
            out.flush();
            if (!out.good()) {
                std::cerr << "❌ Failed writing " << tmp_path << std::endl;
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, state_file_, ec);
        if (ec) {
            std::cerr << "❌ Failed to replace " << state_file_ << ": " << ec.message() << std::endl;
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Failed to persist trade state: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool TradeLimiter::reset_if_new_day(system_clock::time_point now) {
    std::string today = utc_date_string(now);

    // ISO dates compare lexicographically; a clock stepping backwards never resets
    if (today <= state_.last_reset_date) {
        return false;
    }

    std::cout << "New UTC trading day " << today << " (previous: " << state_.utc_date
              << ", " << state_.count << " trades) - resetting limiter" << std::endl;
    state_.utc_date = today;
    state_.last_reset_date = today;
    state_.count = 0;
    if (!persist()) {
        std::cerr << "⚠️ Day rollover could not be persisted" << std::endl;
    }
    return true;
}

bool TradeLimiter::can_trade(system_clock::time_point now) {
    reset_if_new_day(now);
    return state_.count < max_trades_per_day_;
}

bool TradeLimiter::record_trade(OrderSide side, system_clock::time_point now) {
    reset_if_new_day(now);

    if (state_.count >= max_trades_per_day_) {
        throw std::logic_error("record_trade called with the daily cap already reached");
    }

    state_.count++;
    bool saved = persist();

    std::cout << "📒 Trade recorded: " << side_to_string(side) << ". Trades today: "
              << state_.count << "/" << max_trades_per_day_ << std::endl;
    if (!saved) {
        std::cerr << "❌ Trade count " << state_.count << " is NOT on disk" << std::endl;
    }
    return saved;
}

TradeLimitStatus TradeLimiter::get_status(system_clock::time_point now) {
    reset_if_new_day(now);

    TradeLimitStatus status;
    status.date = state_.utc_date;
    status.trades_executed = state_.count;
    status.max_trades_per_day = max_trades_per_day_;
    status.trades_remaining = std::max(0, max_trades_per_day_ - state_.count);
    status.can_trade = state_.count < max_trades_per_day_;
    return status;
}
