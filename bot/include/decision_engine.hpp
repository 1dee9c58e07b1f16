#pragma once

#include <string>
#include <optional>
#include "models.hpp"
#include "advisor_bridge.hpp"
#include "exchange.hpp"
#include "trade_limiter.hpp"
#include "portfolio_ledger.hpp"

enum class EngineState { IDLE, POSITION_OPEN };
enum class DecisionAction { HOLD, BUY, SELL };

enum class DecisionReason {
    NONE,
    ADVISOR_BUY,
    RSI_OVERSOLD,
    SMA_CROSS_UP,
    STOP_LOSS,
    TAKE_PROFIT,
    ADVISOR_SELL,
    ADVISOR_CONFLICT,   // Indicators said buy, advisor said sell
    DAILY_LIMIT
};

enum class CycleOutcome {
    NO_ACTION,
    EXECUTED,
    DAILY_LIMIT,
    NO_FUNDS,
    PERSISTENCE_FAILURE,
    EXCHANGE_REJECTED,
    LEDGER_REJECTED
};

struct DecisionInputs {
    double price = 0.0;
    IndicatorSet indicators;
    AdvisorRecommendation advisor;
    bool can_trade = false;
};

struct Decision {
    DecisionAction action = DecisionAction::HOLD;
    DecisionReason reason = DecisionReason::NONE;
    DecisionReason suppressed = DecisionReason::NONE;  // Signal held back by the daily cap
};

struct CycleResult {
    CycleOutcome outcome = CycleOutcome::NO_ACTION;
    Decision decision;
    std::optional<Order> order;
    std::optional<Fill> fill;
    std::string message;
};

std::string state_to_string(EngineState state);
std::string decision_action_to_string(DecisionAction action);
std::string reason_to_string(DecisionReason reason);
std::string outcome_to_string(CycleOutcome outcome);

/*
 * DECISION ENGINE
 *
 * Two-state machine (IDLE <-> POSITION_OPEN). decide() is the pure transition
 * function; run_cycle() turns its answer into at most one market order and
 * applies the side effects in a fixed order:
 *
 *   can_trade -> decide -> persist -> submit -> record_trade -> apply_fill
 *
 * Nothing is charged or booked unless the exchange confirmed a fill.
 */
class DecisionEngine {
public:
    DecisionEngine(Exchange& exchange, TradeLimiter& limiter, PortfolioLedger& ledger,
                   const std::string& symbol, double buy_fraction);

    static Decision decide(EngineState state, const DecisionInputs& inputs);

    // can_trade in `inputs` is ignored; the limiter is asked directly
    CycleResult run_cycle(const DecisionInputs& inputs, system_clock::time_point now = system_clock::now());

    EngineState state() const { return state_; }

private:
    Exchange& exchange_;
    TradeLimiter& limiter_;
    PortfolioLedger& ledger_;
    std::string symbol_;
    double buy_fraction_;
    EngineState state_;
};
