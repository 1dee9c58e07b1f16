#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include "models.hpp"

class TradeJournal;

class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

struct Position {
    double entry_price = 0.0;
    double quantity = 0.0;
    OrderSide side = OrderSide::BUY;
    system_clock::time_point opened_at;

    double unrealized_pnl(double price) const {
        double sign = side == OrderSide::BUY ? 1.0 : -1.0;
        return (price - entry_price) * quantity * sign;
    }
};

// One fill as booked by the ledger; never modified once appended
struct TradeRecord {
    system_clock::time_point timestamp;
    OrderSide side = OrderSide::BUY;
    double price = 0.0;
    double quantity = 0.0;
    double realized_pnl = 0.0;
    bool closing = false;
};

struct BalanceDrift {
    std::string asset;
    double ledger_amount = 0.0;
    double exchange_amount = 0.0;

    double difference() const { return exchange_amount - ledger_amount; }
};

struct PortfolioState {
    std::string symbol;
    std::map<std::string, double> balances;
    std::optional<Position> position;
    double realized_pnl = 0.0;
    std::vector<TradeRecord> trade_history;
    int winning_trades = 0;
    int losing_trades = 0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    std::vector<BalanceDrift> drifts;  // From the latest reconciliation

    double win_rate() const {
        int closed = winning_trades + losing_trades;
        return closed > 0 ? static_cast<double>(winning_trades) / closed : 0.0;
    }
};

/*
 * PORTFOLIO LEDGER
 *
 * Authoritative in-memory book of balances, the single open position and the
 * realized P&L. Fills are applied only after the exchange confirmed them.
 * Exchange balances are compared against the book each cycle; differences are
 * reported, never written back.
 */
class PortfolioLedger {
public:
    PortfolioLedger(const std::string& symbol, const std::string& quote_asset,
                    const std::map<std::string, double>& initial_balances,
                    double abs_tolerance = 1e-8, double rel_tolerance = 0.005);

    // Optional append-only journal that mirrors every booked fill
    void attach_journal(TradeJournal* journal) { journal_ = journal; }

    // Books a confirmed fill. Throws LedgerError (book untouched) if the fill
    // would open a second position, open a short, or drive a balance negative.
    // A sell closes the position even when the exchange filled less than its size.
    const TradeRecord& apply_fill(const Order& order, double fill_price, double fill_qty,
                                  system_clock::time_point when = system_clock::now());

    // Flags assets whose exchange balance differs beyond tolerance
    std::vector<BalanceDrift> reconcile(const std::map<std::string, double>& exchange_balances);

    // Rebuilds history, P&L and any still-open position from journaled fills
    void restore_history(const std::vector<TradeRecord>& records);

    PortfolioState snapshot() const { return state_; }

    bool has_position() const { return state_.position.has_value(); }
    const std::optional<Position>& position() const { return state_.position; }
    double balance(const std::string& asset) const;
    double realized_pnl() const { return state_.realized_pnl; }
    const std::string& base_asset() const { return base_asset_; }
    const std::string& quote_asset() const { return quote_asset_; }

private:
    void book_close_stats(double pnl);

    PortfolioState state_;
    std::string base_asset_;
    std::string quote_asset_;
    double abs_tolerance_;
    double rel_tolerance_;
    TradeJournal* journal_ = nullptr;

    static constexpr double QTY_EPSILON = 1e-12;
};
