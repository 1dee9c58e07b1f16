#include "decision_engine.hpp"
#include <iomanip>
#include <iostream>

std::string state_to_string(EngineState state) {
    return state == EngineState::IDLE ? "IDLE" : "POSITION_OPEN";
}

std::string decision_action_to_string(DecisionAction action) {
    switch (action) {
        case DecisionAction::BUY: return "BUY";
        case DecisionAction::SELL: return "SELL";
        default: return "HOLD";
    }
}

std::string reason_to_string(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::ADVISOR_BUY: return "advisor_buy";
        case DecisionReason::RSI_OVERSOLD: return "rsi_oversold";
        case DecisionReason::SMA_CROSS_UP: return "sma_cross_up";
        case DecisionReason::STOP_LOSS: return "stop_loss";
        case DecisionReason::TAKE_PROFIT: return "take_profit";
        case DecisionReason::ADVISOR_SELL: return "advisor_sell";
        case DecisionReason::ADVISOR_CONFLICT: return "advisor_conflict";
        case DecisionReason::DAILY_LIMIT: return "daily_limit";
        default: return "none";
    }
}

std::string outcome_to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::EXECUTED: return "EXECUTED";
        case CycleOutcome::DAILY_LIMIT: return "DAILY_LIMIT";
        case CycleOutcome::NO_FUNDS: return "NO_FUNDS";
        case CycleOutcome::PERSISTENCE_FAILURE: return "PERSISTENCE_FAILURE";
        case CycleOutcome::EXCHANGE_REJECTED: return "EXCHANGE_REJECTED";
        case CycleOutcome::LEDGER_REJECTED: return "LEDGER_REJECTED";
        default: return "NO_ACTION";
    }
}

DecisionEngine::DecisionEngine(Exchange& exchange, TradeLimiter& limiter, PortfolioLedger& ledger,
                               const std::string& symbol, double buy_fraction)
    : exchange_(exchange),
      limiter_(limiter),
      ledger_(ledger),
      symbol_(symbol),
      buy_fraction_(buy_fraction),
      state_(ledger.has_position() ? EngineState::POSITION_OPEN : EngineState::IDLE) {}

Decision DecisionEngine::decide(EngineState state, const DecisionInputs& in) {
    Decision d;
    DecisionAction wanted = DecisionAction::HOLD;
    DecisionReason why = DecisionReason::NONE;

    if (state == EngineState::IDLE) {
        if (in.advisor.is_buy()) {
            why = DecisionReason::ADVISOR_BUY;
        } else if (in.indicators.rsi < FallbackCalculator::RSI_OVERSOLD) {
            why = DecisionReason::RSI_OVERSOLD;
        } else if (in.indicators.sma_cross == SmaCross::UP) {
            why = DecisionReason::SMA_CROSS_UP;
        }

        if (why != DecisionReason::NONE && in.advisor.is_sell()) {
            // Buying into an explicit sell call would be unwound on the next cycle
            d.reason = DecisionReason::ADVISOR_CONFLICT;
            return d;
        }
        if (why != DecisionReason::NONE) wanted = DecisionAction::BUY;
    } else {
        const AdvisorRecommendation& a = in.advisor;
        // Stop-loss is checked first so it wins when both exits are crossed
        if (a.stop_loss > 0 && in.price <= a.stop_loss) {
            why = DecisionReason::STOP_LOSS;
        } else if (a.take_profit > 0 && in.price >= a.take_profit) {
            why = DecisionReason::TAKE_PROFIT;
        } else if (a.is_sell()) {
            why = DecisionReason::ADVISOR_SELL;
        }
        if (why != DecisionReason::NONE) wanted = DecisionAction::SELL;
    }

    if (wanted == DecisionAction::HOLD) {
        return d;
    }
    if (!in.can_trade) {
        d.reason = DecisionReason::DAILY_LIMIT;
        d.suppressed = why;
        return d;
    }

    d.action = wanted;
    d.reason = why;
    return d;
}

CycleResult DecisionEngine::run_cycle(const DecisionInputs& inputs, system_clock::time_point now) {
    CycleResult result;

    DecisionInputs in = inputs;
    in.can_trade = limiter_.can_trade(now);
    result.decision = decide(state_, in);

    if (result.decision.action == DecisionAction::HOLD) {
        if (result.decision.reason == DecisionReason::DAILY_LIMIT) {
            result.outcome = CycleOutcome::DAILY_LIMIT;
            result.message = "Daily trade limit reached, " + reason_to_string(result.decision.suppressed) + " signal ignored";
            std::cout << "🚫 " << result.message << std::endl;
        } else {
            result.outcome = CycleOutcome::NO_ACTION;
        }
        return result;
    }

    Order order;
    order.symbol = symbol_;
    order.type = OrderType::MARKET;
    if (result.decision.action == DecisionAction::BUY) {
        order.side = OrderSide::BUY;
        double quote = ledger_.balance(ledger_.quote_asset());
        order.quantity = in.price > 0 ? buy_fraction_ * quote / in.price : 0.0;
    } else {
        order.side = OrderSide::SELL;
        order.quantity = ledger_.position() ? ledger_.position()->quantity : 0.0;
    }
    result.order = order;

    if (order.quantity <= 0) {
        result.outcome = CycleOutcome::NO_FUNDS;
        result.message = "Nothing to " + side_to_string(order.side) + " (sized quantity is zero)";
        std::cerr << "⚠️ " << result.message << std::endl;
        return result;
    }

    // Never submit an order whose count could not be written down afterwards
    if (!limiter_.persist()) {
        result.outcome = CycleOutcome::PERSISTENCE_FAILURE;
        result.message = "Trade state file not writable, order aborted";
        std::cerr << "❌ " << result.message << std::endl;
        return result;
    }

    std::cout << "📤 " << side_to_string(order.side) << " " << std::fixed << std::setprecision(6) << order.quantity
              << " " << order.symbol << " (" << reason_to_string(result.decision.reason) << ")" << std::endl;

    OrderResult placed;
    try {
        placed = exchange_.submit_order(order);
    } catch (const std::exception& e) {
        placed = OrderResult::rejected(RejectReason::CONNECTIVITY, e.what());
    }

    if (!placed.filled) {
        result.outcome = CycleOutcome::EXCHANGE_REJECTED;
        result.message = "Order rejected (" + reject_reason_to_string(placed.reason) + "): " + placed.message;
        std::cerr << "❌ " << result.message << std::endl;
        return result;
    }
    result.fill = placed.fill;

    // The exchange executed: the trade counts against the cap whatever happens next
    if (!limiter_.record_trade(order.side, now)) {
        std::cerr << "❌ CRITICAL: trade executed but the daily count could not be saved" << std::endl;
    }

    try {
        ledger_.apply_fill(order, placed.fill.price, placed.fill.quantity, placed.fill.timestamp);
    } catch (const LedgerError& e) {
        result.outcome = CycleOutcome::LEDGER_REJECTED;
        result.message = std::string("Fill not booked: ") + e.what();
        std::cerr << "❌ " << result.message << " (next reconciliation will show the drift)" << std::endl;
        return result;
    }

    state_ = ledger_.has_position() ? EngineState::POSITION_OPEN : EngineState::IDLE;
    result.outcome = CycleOutcome::EXECUTED;
    result.message = side_to_string(order.side) + " filled, now " + state_to_string(state_);
    std::cout << "✅ " << result.message << std::endl;
    return result;
}
