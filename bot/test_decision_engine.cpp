/**
 * Decision engine: the pure state machine and the order pipeline around it
 */

#include <iostream>
#include <cmath>
#include <filesystem>
#include <cassert>
#include "decision_engine.hpp"
#include "test_support.hpp"

namespace {

AdvisorRecommendation advice(AdvisorAction action, double stop = 90.0, double take = 120.0) {
    AdvisorRecommendation a;
    a.action = action;
    a.stop_loss = stop;
    a.take_profit = take;
    a.buy_target = 95.0;
    a.sell_target = 115.0;
    return a;
}

DecisionInputs inputs(double price, AdvisorAction action, double rsi = 50.0,
                      SmaCross cross = SmaCross::NONE, bool can_trade = true) {
    DecisionInputs in;
    in.price = price;
    in.indicators.rsi = rsi;
    in.indicators.sma_cross = cross;
    in.advisor = advice(action);
    in.can_trade = can_trade;
    return in;
}

struct Rig {
    explicit Rig(const std::string& name, int max_trades = 2)
        : dir(scratch_dir(name)),
          exchange(100.0),
          limiter(dir + "/trade_state.json", max_trades, utc_time(2024, 3, 10)),
          ledger("BTCUSDT", "USDT", {{"USDT", 10000.0}}),
          engine(exchange, limiter, ledger, "BTCUSDT", 0.10) {}

    std::string dir;
    FakeExchange exchange;
    TradeLimiter limiter;
    PortfolioLedger ledger;
    DecisionEngine engine;
};

}  // namespace

void test_idle_buy_triggers() {
    std::cout << "Test 1: IDLE buys on advisor buy, RSI oversold or SMA cross up" << std::endl;

    Decision d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::BUY));
    assert(d.action == DecisionAction::BUY && d.reason == DecisionReason::ADVISOR_BUY);

    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::STRONG_BUY));
    assert(d.action == DecisionAction::BUY && d.reason == DecisionReason::ADVISOR_BUY);

    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::HOLD, 25.0));
    assert(d.action == DecisionAction::BUY && d.reason == DecisionReason::RSI_OVERSOLD);

    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::HOLD, 50.0, SmaCross::UP));
    assert(d.action == DecisionAction::BUY && d.reason == DecisionReason::SMA_CROSS_UP);

    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::HOLD, 50.0, SmaCross::DOWN));
    assert(d.action == DecisionAction::HOLD && d.reason == DecisionReason::NONE);

    // Exits never apply without a position
    d = DecisionEngine::decide(EngineState::IDLE, inputs(50, AdvisorAction::HOLD));
    assert(d.action == DecisionAction::HOLD);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_advisor_sell_vetoes_indicator_buy() {
    std::cout << "Test 2: An advisor sell call blocks indicator buys" << std::endl;

    Decision d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::SELL, 20.0, SmaCross::UP));
    assert(d.action == DecisionAction::HOLD);
    assert(d.reason == DecisionReason::ADVISOR_CONFLICT);

    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::STRONG_SELL, 20.0));
    assert(d.action == DecisionAction::HOLD);
    assert(d.reason == DecisionReason::ADVISOR_CONFLICT);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_position_exits() {
    std::cout << "Test 3: POSITION_OPEN sells on stop-loss, take-profit or advisor sell" << std::endl;

    Decision d = DecisionEngine::decide(EngineState::POSITION_OPEN, inputs(90, AdvisorAction::HOLD));
    assert(d.action == DecisionAction::SELL && d.reason == DecisionReason::STOP_LOSS);

    d = DecisionEngine::decide(EngineState::POSITION_OPEN, inputs(120, AdvisorAction::HOLD));
    assert(d.action == DecisionAction::SELL && d.reason == DecisionReason::TAKE_PROFIT);

    d = DecisionEngine::decide(EngineState::POSITION_OPEN, inputs(105, AdvisorAction::STRONG_SELL));
    assert(d.action == DecisionAction::SELL && d.reason == DecisionReason::ADVISOR_SELL);

    // Buy signals mean nothing while holding
    d = DecisionEngine::decide(EngineState::POSITION_OPEN, inputs(105, AdvisorAction::STRONG_BUY, 10.0, SmaCross::UP));
    assert(d.action == DecisionAction::HOLD && d.reason == DecisionReason::NONE);

    // Both exits crossed at once: stop-loss wins
    DecisionInputs crossed = inputs(100, AdvisorAction::HOLD);
    crossed.advisor.stop_loss = 110.0;
    crossed.advisor.take_profit = 95.0;
    d = DecisionEngine::decide(EngineState::POSITION_OPEN, crossed);
    assert(d.action == DecisionAction::SELL && d.reason == DecisionReason::STOP_LOSS);

    // Unset exits never fire
    DecisionInputs unset = inputs(0.5, AdvisorAction::HOLD);
    unset.advisor.stop_loss = 0.0;
    unset.advisor.take_profit = 0.0;
    d = DecisionEngine::decide(EngineState::POSITION_OPEN, unset);
    assert(d.action == DecisionAction::HOLD);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_daily_limit_suppresses() {
    std::cout << "Test 4: Signals are held back once the cap is reached" << std::endl;

    Decision d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::BUY, 50.0, SmaCross::NONE, false));
    assert(d.action == DecisionAction::HOLD);
    assert(d.reason == DecisionReason::DAILY_LIMIT);
    assert(d.suppressed == DecisionReason::ADVISOR_BUY);

    d = DecisionEngine::decide(EngineState::POSITION_OPEN, inputs(80, AdvisorAction::HOLD, 50.0, SmaCross::NONE, false));
    assert(d.action == DecisionAction::HOLD);
    assert(d.reason == DecisionReason::DAILY_LIMIT);
    assert(d.suppressed == DecisionReason::STOP_LOSS);

    // Nothing to suppress
    d = DecisionEngine::decide(EngineState::IDLE, inputs(100, AdvisorAction::HOLD, 50.0, SmaCross::NONE, false));
    assert(d.reason == DecisionReason::NONE);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_buy_then_sell_cycle() {
    std::cout << "Test 5: Buy sizes from the quote balance, sell closes the whole position" << std::endl;

    Rig rig("engine_round_trip");
    auto now = utc_time(2024, 3, 10, 13);
    assert(rig.engine.state() == EngineState::IDLE);

    CycleResult r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), now);
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(r.order && r.order->side == OrderSide::BUY);
    assert(std::fabs(r.order->quantity - 10.0) < 1e-9);
    assert(rig.engine.state() == EngineState::POSITION_OPEN);
    assert(rig.limiter.state().count == 1);
    assert(std::fabs(rig.ledger.balance("USDT") - 9000.0) < 1e-6);

    rig.exchange.set_price(125.0);
    r = rig.engine.run_cycle(inputs(125, AdvisorAction::HOLD), now + minutes(5));
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(r.decision.reason == DecisionReason::TAKE_PROFIT);
    assert(r.order->side == OrderSide::SELL);
    assert(std::fabs(r.order->quantity - 10.0) < 1e-9);
    assert(rig.engine.state() == EngineState::IDLE);
    assert(rig.limiter.state().count == 2);
    assert(std::fabs(rig.ledger.snapshot().realized_pnl - 250.0) < 1e-6);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_never_a_third_trade() {
    std::cout << "Test 6: At most two orders reach the exchange per UTC day" << std::endl;

    Rig rig("engine_cap");
    auto now = utc_time(2024, 3, 10, 9);

    for (int i = 0; i < 50; i++) {
        // Alternating signals would trade every cycle without the cap
        AdvisorAction action = (i % 2 == 0) ? AdvisorAction::STRONG_BUY : AdvisorAction::STRONG_SELL;
        CycleResult r = rig.engine.run_cycle(inputs(100, action), now + minutes(i));
        if (i >= 2) {
            assert(r.outcome == CycleOutcome::DAILY_LIMIT || r.outcome == CycleOutcome::NO_ACTION);
        }
    }
    assert(rig.exchange.orders.size() == 2);
    assert(rig.limiter.state().count == 2);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_rejected_order_changes_nothing() {
    std::cout << "Test 7: A rejected order leaves the count, state and book untouched" << std::endl;

    Rig rig("engine_reject");
    auto now = utc_time(2024, 3, 10, 14);
    rig.exchange.reject_next = 1;

    CycleResult r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), now);
    assert(r.outcome == CycleOutcome::EXCHANGE_REJECTED);
    assert(!r.fill);
    assert(rig.exchange.orders.size() == 1);
    assert(rig.limiter.state().count == 0);
    assert(rig.engine.state() == EngineState::IDLE);
    assert(!rig.ledger.has_position());
    assert(std::fabs(rig.ledger.balance("USDT") - 10000.0) < 1e-9);

    // The next signal goes through normally
    r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), now + minutes(1));
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(rig.limiter.state().count == 1);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_unwritable_state_blocks_orders() {
    std::cout << "Test 8: No order is sent when the trade count cannot be saved" << std::endl;

    Rig rig("engine_persist");
    std::filesystem::remove_all(rig.dir);

    CycleResult r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), utc_time(2024, 3, 10, 15));
    assert(r.outcome == CycleOutcome::PERSISTENCE_FAILURE);
    assert(rig.exchange.orders.empty());
    assert(rig.limiter.state().count == 0);
    assert(rig.engine.state() == EngineState::IDLE);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_restart_with_one_trade_used() {
    std::cout << "Test 9: After a restart with one trade recorded, exactly one more is allowed" << std::endl;

    std::string dir = scratch_dir("engine_restart");
    std::string state_file = dir + "/trade_state.json";
    write_file(state_file, R"({"date": "2024-03-10", "count": 1, "last_reset_date": "2024-03-10"})");

    FakeExchange exchange(100.0);
    TradeLimiter limiter(state_file, 2, utc_time(2024, 3, 10, 16));
    PortfolioLedger ledger("BTCUSDT", "USDT", {{"USDT", 10000.0}});
    DecisionEngine engine(exchange, limiter, ledger, "BTCUSDT", 0.10);

    auto now = utc_time(2024, 3, 10, 16, 5);
    CycleResult r = engine.run_cycle(inputs(100, AdvisorAction::BUY), now);
    assert(r.outcome == CycleOutcome::EXECUTED);

    r = engine.run_cycle(inputs(100, AdvisorAction::SELL), now + minutes(1));
    assert(r.outcome == CycleOutcome::DAILY_LIMIT);
    assert(r.decision.suppressed == DecisionReason::ADVISOR_SELL);
    assert(exchange.orders.size() == 1);
    assert(engine.state() == EngineState::POSITION_OPEN);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_next_day_allows_trading_again() {
    std::cout << "Test 10: The cap resets at the UTC date change" << std::endl;

    Rig rig("engine_rollover");
    auto late = utc_time(2024, 3, 10, 23, 50);
    assert(rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), late).outcome == CycleOutcome::EXECUTED);
    assert(rig.engine.run_cycle(inputs(100, AdvisorAction::SELL), late + minutes(1)).outcome == CycleOutcome::EXECUTED);
    assert(rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), late + minutes(2)).outcome == CycleOutcome::DAILY_LIMIT);

    auto next_day = utc_time(2024, 3, 11, 0, 1);
    CycleResult r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), next_day);
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(rig.limiter.state().utc_date == "2024-03-11");
    assert(rig.limiter.state().count == 1);
    assert(rig.exchange.orders.size() == 3);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_no_funds() {
    std::cout << "Test 11: A buy with an empty quote balance is not sent" << std::endl;

    std::string dir = scratch_dir("engine_no_funds");
    FakeExchange exchange(100.0);
    TradeLimiter limiter(dir + "/trade_state.json", 2, utc_time(2024, 3, 10));
    PortfolioLedger ledger("BTCUSDT", "USDT", {{"USDT", 0.0}});
    DecisionEngine engine(exchange, limiter, ledger, "BTCUSDT", 0.10);

    CycleResult r = engine.run_cycle(inputs(100, AdvisorAction::BUY), utc_time(2024, 3, 10, 12, 30));
    assert(r.outcome == CycleOutcome::NO_FUNDS);
    assert(exchange.orders.empty());
    assert(limiter.state().count == 0);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_short_sell_fill_returns_to_idle() {
    std::cout << "Test 12: An exit the venue fills only in part still returns the engine to IDLE" << std::endl;

    Rig rig("engine_short_exit");
    auto now = utc_time(2024, 3, 10, 13);

    CycleResult r = rig.engine.run_cycle(inputs(100, AdvisorAction::BUY), now);
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(rig.engine.state() == EngineState::POSITION_OPEN);

    rig.exchange.sell_fill_ratio = 0.95;
    rig.exchange.set_price(125.0);
    r = rig.engine.run_cycle(inputs(125, AdvisorAction::HOLD), now + minutes(5));
    assert(r.outcome == CycleOutcome::EXECUTED);
    assert(r.decision.reason == DecisionReason::TAKE_PROFIT);
    assert(rig.engine.state() == EngineState::IDLE);
    assert(!rig.ledger.has_position());
    assert(std::fabs(rig.ledger.balance("BTC") - 0.5) < 1e-9);
    assert(rig.limiter.state().count == 2);

    // No further sell is attempted against the leftover
    r = rig.engine.run_cycle(inputs(80, AdvisorAction::STRONG_SELL), now + minutes(10));
    assert(r.outcome != CycleOutcome::EXECUTED);
    assert(rig.exchange.orders.size() == 2);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Decision Engine Tests ===\n" << std::endl;

    test_idle_buy_triggers();
    test_advisor_sell_vetoes_indicator_buy();
    test_position_exits();
    test_daily_limit_suppresses();
    test_buy_then_sell_cycle();
    test_never_a_third_trade();
    test_rejected_order_changes_nothing();
    test_unwritable_state_blocks_orders();
    test_restart_with_one_trade_used();
    test_next_day_allows_trading_again();
    test_no_funds();
    test_short_sell_fill_returns_to_idle();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
