#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "bot_config.hpp"
#include "models.hpp"
#include "market_data_source.hpp"
#include "llm_backend.hpp"
#include "exchange.hpp"
#include "advisor_bridge.hpp"
#include "trade_limiter.hpp"
#include "portfolio_ledger.hpp"
#include "trade_journal.hpp"
#include "decision_engine.hpp"
#include "portfolio_reporter.hpp"

enum class CycleStatus {
    COMPLETED,
    SKIPPED_BUSY,           // Previous cycle still running
    ABANDONED,              // Deadline passed or no market data; nothing mutated
    INSUFFICIENT_DATA
};

struct CycleReport {
    CycleStatus status = CycleStatus::COMPLETED;
    std::optional<CycleResult> engine;
    std::string message;
};

std::string cycle_status_to_string(CycleStatus status);

/*
 * TRADING BOT
 *
 * One decision cycle per interval:
 *   market data + AI health check (concurrent, bounded by the cycle deadline)
 *   -> indicators and pivots -> advisor (refreshed on its own cadence)
 *   -> decision engine -> reconciliation -> status report
 *
 * Cycles never overlap. A cycle that runs out of time before the decision
 * step is dropped without touching the limiter or the ledger.
 */
class TradingBot {
public:
    TradingBot(const BotConfig& config,
               std::shared_ptr<MarketDataSource> market,
               std::shared_ptr<LlmBackend> llm,
               std::shared_ptr<Exchange> exchange);

    ~TradingBot();

    void run();
    void stop() { running_ = false; }

    CycleReport run_cycle(system_clock::time_point now = system_clock::now());

    const PortfolioLedger& ledger() const { return *ledger_; }
    const TradeLimiter& limiter() const { return *limiter_; }
    EngineState engine_state() const { return engine_->state(); }
    const std::optional<AdvisorRecommendation>& last_recommendation() const { return last_recommendation_; }

private:
    void restore_from_journal();
    bool advisor_refresh_due(system_clock::time_point now) const;
    void reconcile_balances();
    void write_report(const MarketSnapshot* snapshot, system_clock::time_point now);
    void print_summary() const;

    BotConfig config_;
    std::shared_ptr<MarketDataSource> market_;
    std::shared_ptr<LlmBackend> llm_;
    std::shared_ptr<Exchange> exchange_;

    std::unique_ptr<TradeLimiter> limiter_;
    std::unique_ptr<TradeJournal> journal_;
    std::unique_ptr<PortfolioLedger> ledger_;
    std::unique_ptr<AdvisorBridge> advisor_;
    std::unique_ptr<DecisionEngine> engine_;
    PortfolioReporter reporter_;

    std::mutex cycle_mutex_;
    std::atomic<bool> running_{false};

    std::optional<AdvisorRecommendation> last_recommendation_;
    std::optional<IndicatorSet> last_indicators_;
    std::optional<PivotLevels> last_pivots_;
    std::string last_event_;
    system_clock::time_point started_at_;
    int cycles_run_ = 0;
};
