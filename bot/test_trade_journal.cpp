/**
 * SQLite trade journal: append, reload in order, survive reopen
 */

#include <iostream>
#include <cmath>
#include <cassert>
#include "trade_journal.hpp"
#include "test_support.hpp"

void test_append_and_load() {
    std::cout << "Test 1: Appended fills load back in booking order" << std::endl;

    std::string dir = scratch_dir("journal_append");
    TradeJournal journal(dir + "/trades.db");
    assert(journal.is_open());

    auto t1 = utc_time(2024, 3, 10, 9);
    auto t2 = utc_time(2024, 3, 10, 15);
    assert(journal.append("BTCUSDT", {t1, OrderSide::BUY, 50000.0, 0.1, 0.0, false}));
    assert(journal.append("BTCUSDT", {t2, OrderSide::SELL, 51000.0, 0.1, 100.0, true}));
    assert(journal.append("ETHUSDT", {t2, OrderSide::BUY, 3000.0, 1.0, 0.0, false}));

    auto records = journal.load("BTCUSDT");
    assert(records.size() == 2);
    assert(records[0].side == OrderSide::BUY);
    assert(records[1].side == OrderSide::SELL);
    assert(records[1].closing);
    assert(std::fabs(records[1].realized_pnl - 100.0) < 1e-9);
    assert(records[0].timestamp == t1);
    assert(journal.count("ETHUSDT") == 1);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_survives_reopen() {
    std::cout << "Test 2: Journal contents survive closing and reopening the database" << std::endl;

    std::string dir = scratch_dir("journal_reopen");
    std::string db = dir + "/trades.db";
    {
        TradeJournal journal(db);
        journal.append("BTCUSDT", {utc_time(2024, 3, 10), OrderSide::BUY, 42000.0, 0.25, 0.0, false});
    }

    TradeJournal reopened(db);
    auto records = reopened.load("BTCUSDT");
    assert(records.size() == 1);
    assert(std::fabs(records[0].quantity - 0.25) < 1e-12);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_ledger_writes_through() {
    std::cout << "Test 3: Ledger fills are mirrored into the journal" << std::endl;

    std::string dir = scratch_dir("journal_ledger");
    TradeJournal journal(dir + "/trades.db");
    PortfolioLedger ledger("BTCUSDT", "USDT", {{"USDT", 10000.0}});
    ledger.attach_journal(&journal);

    Order buy{OrderSide::BUY, "BTCUSDT", 0.1, OrderType::MARKET};
    Order sell{OrderSide::SELL, "BTCUSDT", 0.1, OrderType::MARKET};
    ledger.apply_fill(buy, 50000.0, 0.1);
    ledger.apply_fill(sell, 49000.0, 0.1);

    auto records = journal.load("BTCUSDT");
    assert(records.size() == 2);
    assert(std::fabs(records[1].realized_pnl + 100.0) < 1e-9);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_unopenable_database() {
    std::cout << "Test 4: An unopenable database is reported, not fatal" << std::endl;

    std::string dir = scratch_dir("journal_bad");
    TradeJournal journal(dir + "/missing_dir/trades.db");
    assert(!journal.is_open());
    assert(!journal.append("BTCUSDT", {utc_time(2024, 3, 10), OrderSide::BUY, 1.0, 1.0, 0.0, false}));
    assert(journal.load("BTCUSDT").empty());

    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Trade Journal Tests ===\n" << std::endl;

    test_append_and_load();
    test_survives_reopen();
    test_ledger_writes_through();
    test_unopenable_database();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
