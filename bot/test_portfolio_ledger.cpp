/**
 * Portfolio ledger: fills, realized P&L, single-position rule, reconciliation
 */

#include <iostream>
#include <cmath>
#include <cassert>
#include "portfolio_ledger.hpp"
#include "test_support.hpp"

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

Order market(OrderSide side, double qty) {
    Order o;
    o.side = side;
    o.symbol = "BTCUSDT";
    o.quantity = qty;
    return o;
}

PortfolioLedger make_ledger(double usdt = 10000.0) {
    return PortfolioLedger("BTCUSDT", "USDT", {{"USDT", usdt}});
}

template<typename Func>
bool throws_ledger_error(Func f) {
    try {
        f();
    } catch (const LedgerError&) {
        return true;
    }
    return false;
}

}  // namespace

void test_round_trip_profit() {
    std::cout << "Test 1: Buy then sell books realized P&L" << std::endl;

    PortfolioLedger ledger = make_ledger();
    assert(ledger.base_asset() == "BTC");
    assert(ledger.quote_asset() == "USDT");

    ledger.apply_fill(market(OrderSide::BUY, 0.1), 50000.0, 0.1);
    assert(ledger.has_position());
    assert(near(ledger.balance("USDT"), 5000.0));
    assert(near(ledger.balance("BTC"), 0.1));
    assert(near(ledger.position()->entry_price, 50000.0));

    const TradeRecord& close = ledger.apply_fill(market(OrderSide::SELL, 0.1), 55000.0, 0.1);
    std::cout << "  Realized: $" << close.realized_pnl << std::endl;
    assert(close.closing);
    assert(near(close.realized_pnl, 500.0));
    assert(!ledger.has_position());
    assert(near(ledger.balance("USDT"), 10500.0));
    assert(near(ledger.balance("BTC"), 0.0));
    assert(near(ledger.realized_pnl(), 500.0));

    PortfolioState s = ledger.snapshot();
    assert(s.trade_history.size() == 2);
    assert(s.winning_trades == 1 && s.losing_trades == 0);
    assert(near(s.win_rate(), 1.0));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_losing_trade() {
    std::cout << "Test 2: Losing exit books negative P&L" << std::endl;

    PortfolioLedger ledger = make_ledger();
    ledger.apply_fill(market(OrderSide::BUY, 0.2), 40000.0, 0.2);
    const TradeRecord& close = ledger.apply_fill(market(OrderSide::SELL, 0.2), 38000.0, 0.2);

    assert(near(close.realized_pnl, -400.0));
    PortfolioState s = ledger.snapshot();
    assert(s.losing_trades == 1);
    assert(near(s.largest_loss, -400.0));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_no_second_position() {
    std::cout << "Test 3: A second entry while a position is open is refused untouched" << std::endl;

    PortfolioLedger ledger = make_ledger();
    ledger.apply_fill(market(OrderSide::BUY, 0.05), 50000.0, 0.05);
    PortfolioState before = ledger.snapshot();

    assert(throws_ledger_error([&]() { ledger.apply_fill(market(OrderSide::BUY, 0.01), 50000.0, 0.01); }));

    PortfolioState after = ledger.snapshot();
    assert(near(after.balances["USDT"], before.balances["USDT"]));
    assert(near(after.position->quantity, 0.05));
    assert(after.trade_history.size() == 1);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_no_short_and_no_negative_balance() {
    std::cout << "Test 4: Shorts and overdrafts are refused" << std::endl;

    PortfolioLedger ledger = make_ledger(1000.0);
    assert(throws_ledger_error([&]() { ledger.apply_fill(market(OrderSide::SELL, 0.01), 50000.0, 0.01); }));
    assert(throws_ledger_error([&]() { ledger.apply_fill(market(OrderSide::BUY, 1.0), 50000.0, 1.0); }));
    assert(near(ledger.balance("USDT"), 1000.0));
    assert(!ledger.has_position());

    ledger.apply_fill(market(OrderSide::BUY, 0.01), 50000.0, 0.01);
    assert(throws_ledger_error([&]() { ledger.apply_fill(market(OrderSide::SELL, 0.02), 50000.0, 0.02); }));
    assert(near(ledger.balance("BTC"), 0.01));

    assert(throws_ledger_error([&]() { ledger.apply_fill(market(OrderSide::SELL, 0.01), 0.0, 0.01); }));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_reconcile_flags_without_correcting() {
    std::cout << "Test 5: Reconciliation flags drift beyond tolerance and leaves the book alone" << std::endl;

    PortfolioLedger ledger = make_ledger();
    ledger.apply_fill(market(OrderSide::BUY, 0.1), 50000.0, 0.1);

    // Exchange fees shave a little off: within tolerance
    auto drifts = ledger.reconcile({{"USDT", 5000.0}, {"BTC", 0.0999}});
    assert(drifts.empty());

    drifts = ledger.reconcile({{"USDT", 4000.0}, {"BTC", 0.1}});
    assert(drifts.size() == 1);
    assert(drifts[0].asset == "USDT");
    assert(near(drifts[0].difference(), -1000.0));
    assert(near(ledger.balance("USDT"), 5000.0));
    assert(ledger.snapshot().drifts.size() == 1);

    // Asset missing on the exchange counts as zero
    drifts = ledger.reconcile({{"USDT", 5000.0}});
    assert(drifts.size() == 1 && drifts[0].asset == "BTC");

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_snapshot_is_a_copy() {
    std::cout << "Test 6: Snapshots do not alias the ledger" << std::endl;

    PortfolioLedger ledger = make_ledger();
    PortfolioState s = ledger.snapshot();
    s.balances["USDT"] = 0.0;
    s.realized_pnl = 99.0;
    assert(near(ledger.balance("USDT"), 10000.0));
    assert(near(ledger.realized_pnl(), 0.0));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_restore_history() {
    std::cout << "Test 7: Journaled fills rebuild P&L and an open position the exchange still holds" << std::endl;

    auto t = utc_time(2024, 3, 10);
    std::vector<TradeRecord> records(3);
    records[0] = {t, OrderSide::BUY, 100.0, 2.0, 0.0, false};
    records[1] = {t, OrderSide::SELL, 110.0, 2.0, 20.0, true};
    records[2] = {t, OrderSide::BUY, 105.0, 1.5, 0.0, false};

    PortfolioLedger held("BTCUSDT", "USDT", {{"USDT", 500.0}, {"BTC", 1.5}});
    held.restore_history(records);
    assert(near(held.realized_pnl(), 20.0));
    assert(held.has_position());
    assert(near(held.position()->entry_price, 105.0));
    assert(held.snapshot().trade_history.size() == 3);

    PortfolioLedger not_held("BTCUSDT", "USDT", {{"USDT", 10000.0}});
    not_held.restore_history(records);
    assert(near(not_held.realized_pnl(), 20.0));
    assert(!not_held.has_position());

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_short_exit_fill_closes_position() {
    std::cout << "Test 8: A sell filled short of the position still closes it" << std::endl;

    PortfolioLedger ledger = make_ledger();
    ledger.apply_fill(market(OrderSide::BUY, 10.0), 100.0, 10.0);

    // Venue rounded the lot down and sold 9.5 of 10
    const TradeRecord& close = ledger.apply_fill(market(OrderSide::SELL, 10.0), 120.0, 9.5);
    assert(close.closing);
    assert(near(close.realized_pnl, 190.0));
    assert(!ledger.has_position());
    assert(near(ledger.balance("BTC"), 0.5));
    assert(near(ledger.balance("USDT"), 9000.0 + 1140.0));

    // The unsold remainder is not a position, so the next entry is allowed
    ledger.apply_fill(market(OrderSide::BUY, 1.0), 110.0, 1.0);
    assert(ledger.has_position());
    assert(near(ledger.position()->quantity, 1.0));

    auto t = utc_time(2024, 3, 10);
    std::vector<TradeRecord> records(2);
    records[0] = {t, OrderSide::BUY, 100.0, 2.0, 0.0, false};
    records[1] = {t, OrderSide::SELL, 110.0, 1.9, 19.0, true};
    PortfolioLedger restored("BTCUSDT", "USDT", {{"USDT", 500.0}, {"BTC", 0.1}});
    restored.restore_history(records);
    assert(!restored.has_position());
    assert(near(restored.realized_pnl(), 19.0));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Portfolio Ledger Tests ===\n" << std::endl;

    test_round_trip_profit();
    test_losing_trade();
    test_no_second_position();
    test_no_short_and_no_negative_balance();
    test_reconcile_flags_without_correcting();
    test_snapshot_is_a_copy();
    test_restore_history();
    test_short_exit_fill_closes_position();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
