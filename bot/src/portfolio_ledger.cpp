#include "portfolio_ledger.hpp"
#include "trade_journal.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>

PortfolioLedger::PortfolioLedger(const std::string& symbol, const std::string& quote_asset,
                                 const std::map<std::string, double>& initial_balances,
                                 double abs_tolerance, double rel_tolerance)
    : abs_tolerance_(abs_tolerance), rel_tolerance_(rel_tolerance) {
    auto [base, quote] = split_symbol(symbol, quote_asset);
    base_asset_ = base;
    quote_asset_ = quote;

    state_.symbol = symbol;
    for (const auto& [asset, amount] : initial_balances) {
        if (amount < 0) {
            throw LedgerError("Initial balance for " + asset + " is negative");
        }
        state_.balances[asset] = amount;
    }
    state_.balances.emplace(base_asset_, 0.0);
    state_.balances.emplace(quote_asset_, 0.0);
}

double PortfolioLedger::balance(const std::string& asset) const {
    auto it = state_.balances.find(asset);
    return it != state_.balances.end() ? it->second : 0.0;
}

const TradeRecord& PortfolioLedger::apply_fill(const Order& order, double fill_price, double fill_qty,
                                               system_clock::time_point when) {
    if (fill_price <= 0 || fill_qty <= 0) {
        throw LedgerError("Fill must have positive price and quantity");
    }
    if (order.symbol != state_.symbol) {
        throw LedgerError("Fill for " + order.symbol + " does not belong to " + state_.symbol);
    }

    double notional = fill_price * fill_qty;
    double& base = state_.balances[base_asset_];
    double& quote = state_.balances[quote_asset_];

    TradeRecord record;
    record.timestamp = when;
    record.side = order.side;
    record.price = fill_price;
    record.quantity = fill_qty;

    if (!state_.position) {
        if (order.side != OrderSide::BUY) {
            throw LedgerError("Cannot open a short position (no margin trading)");
        }
        if (quote - notional < -QTY_EPSILON) {
            throw LedgerError("Buy of " + std::to_string(notional) + " " + quote_asset_ +
                              " exceeds balance " + std::to_string(quote));
        }

        quote = std::max(0.0, quote - notional);
        base += fill_qty;

        Position pos;
        pos.entry_price = fill_price;
        pos.quantity = fill_qty;
        pos.side = order.side;
        pos.opened_at = when;
        state_.position = pos;
    } else {
        Position& pos = *state_.position;
        if (order.side == pos.side) {
            throw LedgerError("Position already open; averaging is not allowed");
        }
        if (fill_qty > pos.quantity + QTY_EPSILON) {
            throw LedgerError("Closing fill of " + std::to_string(fill_qty) +
                              " exceeds open quantity " + std::to_string(pos.quantity));
        }
        if (base - fill_qty < -QTY_EPSILON) {
            throw LedgerError("Sell of " + std::to_string(fill_qty) + " " + base_asset_ +
                              " exceeds balance " + std::to_string(base));
        }

        double sign = pos.side == OrderSide::BUY ? 1.0 : -1.0;
        record.realized_pnl = (fill_price - pos.entry_price) * fill_qty * sign;
        record.closing = true;

        base = std::max(0.0, base - fill_qty);
        quote += notional;
        state_.realized_pnl += record.realized_pnl;
        book_close_stats(record.realized_pnl);

        // A sell always closes; whatever the exchange left unsold stays in the balance
        double leftover = pos.quantity - fill_qty;
        if (leftover > QTY_EPSILON) {
            std::cerr << "⚠️ Exit filled " << std::fixed << std::setprecision(8) << fill_qty << " of "
                      << pos.quantity << " " << base_asset_ << "; closing the position, "
                      << leftover << " left in the balance" << std::endl;
        }
        state_.position.reset();
    }

    state_.trade_history.push_back(record);

    if (journal_ && !journal_->append(state_.symbol, record)) {
        std::cerr << "⚠️ Fill booked in memory but missing from the journal" << std::endl;
    }

    std::cout << "📘 Ledger: " << side_to_string(record.side) << " " << std::fixed << std::setprecision(6)
              << fill_qty << " @ $" << std::setprecision(2) << fill_price;
    if (record.closing) {
        std::cout << " | realized P&L: $" << record.realized_pnl
                  << " | total: $" << state_.realized_pnl;
    }
    std::cout << std::endl;

    return state_.trade_history.back();
}

void PortfolioLedger::book_close_stats(double pnl) {
    if (pnl > 0) {
        state_.winning_trades++;
        state_.largest_win = std::max(state_.largest_win, pnl);
    } else {
        state_.losing_trades++;
        state_.largest_loss = std::min(state_.largest_loss, pnl);
    }
}

std::vector<BalanceDrift> PortfolioLedger::reconcile(const std::map<std::string, double>& exchange_balances) {
    std::set<std::string> assets = {base_asset_, quote_asset_};
    for (const auto& [asset, _] : exchange_balances) {
        if (state_.balances.count(asset)) assets.insert(asset);
    }

    std::vector<BalanceDrift> drifts;
    for (const auto& asset : assets) {
        auto it = exchange_balances.find(asset);
        double exchange_amount = it != exchange_balances.end() ? it->second : 0.0;
        double ledger_amount = balance(asset);

        double tolerance = abs_tolerance_ + rel_tolerance_ * std::max(std::abs(ledger_amount), std::abs(exchange_amount));
        if (std::abs(exchange_amount - ledger_amount) > tolerance) {
            drifts.push_back({asset, ledger_amount, exchange_amount});
        }
    }

    for (const auto& d : drifts) {
        std::cerr << "⚠️ RECONCILIATION DRIFT " << d.asset << ": ledger=" << std::fixed << std::setprecision(8)
                  << d.ledger_amount << " exchange=" << d.exchange_amount
                  << " diff=" << d.difference() << " (not corrected)" << std::endl;
    }

    state_.drifts = drifts;
    return drifts;
}

void PortfolioLedger::restore_history(const std::vector<TradeRecord>& records) {
    state_.trade_history.clear();
    state_.realized_pnl = 0.0;
    state_.winning_trades = 0;
    state_.losing_trades = 0;
    state_.largest_win = 0.0;
    state_.largest_loss = 0.0;
    state_.position.reset();

    for (const auto& r : records) {
        state_.trade_history.push_back(r);
        if (r.closing) {
            state_.realized_pnl += r.realized_pnl;
            book_close_stats(r.realized_pnl);
            state_.position.reset();
        } else {
            Position pos;
            pos.entry_price = r.price;
            pos.quantity = r.quantity;
            pos.side = r.side;
            pos.opened_at = r.timestamp;
            state_.position = pos;
        }
    }

    // Balances were seeded from the exchange; a position it does not hold cannot be closed
    if (state_.position && balance(base_asset_) + QTY_EPSILON < state_.position->quantity * (1.0 - rel_tolerance_)) {
        std::cerr << "⚠️ Journaled open position of " << state_.position->quantity << " " << base_asset_
                  << " is not held on the exchange, starting flat" << std::endl;
        state_.position.reset();
    }

    std::cout << "Restored " << records.size() << " journaled fills, realized P&L $"
              << std::fixed << std::setprecision(2) << state_.realized_pnl
              << (state_.position ? " (position still open)" : "") << std::endl;
}
