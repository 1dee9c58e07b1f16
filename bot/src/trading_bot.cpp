#include "trading_bot.hpp"
#include "indicator_engine.hpp"
#include "background_tasks.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

std::string cycle_status_to_string(CycleStatus status) {
    switch (status) {
        case CycleStatus::SKIPPED_BUSY: return "SKIPPED_BUSY";
        case CycleStatus::ABANDONED: return "ABANDONED";
        case CycleStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        default: return "COMPLETED";
    }
}

TradingBot::TradingBot(const BotConfig& config,
                       std::shared_ptr<MarketDataSource> market,
                       std::shared_ptr<LlmBackend> llm,
                       std::shared_ptr<Exchange> exchange)
    : config_(config),
      market_(std::move(market)),
      llm_(std::move(llm)),
      exchange_(std::move(exchange)),
      reporter_(config.report_path) {
    if (!market_ || !exchange_) {
        throw std::invalid_argument("TradingBot needs a market data source and an exchange");
    }
    started_at_ = system_clock::now();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "PIVOT AI TRADER - " << config_.symbol << std::endl;
    std::cout << std::string(60, '=') << std::endl;
    print_config(config_);
    std::cout << std::string(60, '=') << std::endl;

    limiter_ = std::make_unique<TradeLimiter>(config_.trade_state_file, config_.max_trades_per_day);

    std::map<std::string, double> balances;
    try {
        balances = exchange_->get_balances();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Cannot read starting balances from ") + exchange_->name() + ": " + e.what());
    }
    ledger_ = std::make_unique<PortfolioLedger>(config_.symbol, config_.quote_asset, balances,
                                                config_.reconcile_abs_tolerance, config_.reconcile_rel_tolerance);

    journal_ = std::make_unique<TradeJournal>(config_.trades_db);
    if (journal_->is_open()) {
        restore_from_journal();
        ledger_->attach_journal(journal_.get());
    } else {
        std::cerr << "⚠️ Running without a trade journal; history will not survive a restart" << std::endl;
    }

    AdvisorConfig advisor_config;
    advisor_config.enabled = config_.ollama_enabled && llm_ != nullptr;
    advisor_config.model = config_.ollama_model;
    advisor_config.quote_asset = config_.quote_asset;
    advisor_config.timeout = milliseconds(config_.ai_timeout_secs * 1000L);
    advisor_ = std::make_unique<AdvisorBridge>(advisor_config.enabled ? llm_ : nullptr, advisor_config);

    engine_ = std::make_unique<DecisionEngine>(*exchange_, *limiter_, *ledger_, config_.symbol, config_.buy_fraction);

    TradeLimitStatus limits = limiter_->get_status(system_clock::now());
    std::cout << "Trades today: " << limits.trades_executed << "/" << limits.max_trades_per_day
              << " | Engine state: " << state_to_string(engine_->state()) << std::endl;
}

TradingBot::~TradingBot() {
    print_summary();
}

void TradingBot::restore_from_journal() {
    std::vector<TradeRecord> records = journal_->load(config_.symbol);
    if (!records.empty()) {
        ledger_->restore_history(records);
    }
}

bool TradingBot::advisor_refresh_due(system_clock::time_point now) const {
    if (!last_recommendation_) return true;
    return now - last_recommendation_->generated_at >= seconds(config_.ai_recalc_interval_secs);
}

CycleReport TradingBot::run_cycle(system_clock::time_point now) {
    CycleReport report;

    std::unique_lock<std::mutex> lock(cycle_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        report.status = CycleStatus::SKIPPED_BUSY;
        report.message = "Previous cycle still running";
        std::cerr << "⚠️ " << report.message << ", skipping this tick" << std::endl;
        return report;
    }

    cycles_run_++;
    auto deadline = steady_clock::now() + seconds(config_.cycle_deadline_secs);

    auto abandon = [&](const std::string& why) {
        report.status = CycleStatus::ABANDONED;
        report.message = why;
        last_event_ = "Cycle abandoned: " + why;
        std::cerr << "⚠️ Cycle " << cycles_run_ << " abandoned: " << why << std::endl;
        return report;
    };

    // Market data and the AI health check are independent; issue both at once
    std::shared_ptr<MarketDataSource> market = market_;
    std::string symbol = config_.symbol;
    std::future<MarketSnapshot> snapshot_future = background_tasks().launch([market, symbol]() {
        return market->fetch_snapshot(symbol);
    });

    bool refresh_advisor = advisor_refresh_due(now);
    std::optional<std::future<bool>> health_future;
    if (refresh_advisor && advisor_->enabled()) {
        std::shared_ptr<LlmBackend> llm = llm_;
        health_future = background_tasks().launch([llm]() { return llm->health_check(); });
    }

    if (snapshot_future.wait_until(deadline) != std::future_status::ready) {
        return abandon("market data not received within " + std::to_string(config_.cycle_deadline_secs) + "s");
    }
    MarketSnapshot snapshot;
    try {
        snapshot = snapshot_future.get();
    } catch (const std::exception& e) {
        return abandon(std::string("market data unavailable: ") + e.what());
    }

    bool backend_healthy = false;
    if (health_future) {
        if (health_future->wait_until(deadline) == std::future_status::ready) {
            try {
                backend_healthy = health_future->get();
            } catch (const std::exception& e) {
                std::cerr << "⚠️ AI health check failed: " << e.what() << std::endl;
            }
        } else {
            std::cerr << "⚠️ AI health check timed out" << std::endl;
        }
    }

    exchange_->observe_price(config_.symbol, snapshot.current_price);

    IndicatorSet indicators;
    PivotLevels pivots;
    try {
        indicators = IndicatorEngine::compute_indicators(snapshot.candles_48h, config_.sma_short_period,
                                                         config_.sma_long_period, config_.rsi_period);
        PeriodRange prior = IndicatorEngine::closed_period(snapshot.candles_24h, now, snapshot.candle_interval_secs);
        pivots = IndicatorEngine::compute_pivot_levels(prior.high, prior.low, prior.close);
    } catch (const InsufficientDataError& e) {
        report.status = CycleStatus::INSUFFICIENT_DATA;
        report.message = e.what();
        last_event_ = std::string("Skipped, insufficient data: ") + e.what();
        std::cerr << "⚠️ " << last_event_ << std::endl;
        write_report(&snapshot, now);
        return report;
    }
    last_indicators_ = indicators;
    last_pivots_ = pivots;

    if (refresh_advisor) {
        // The AI call shares the cycle budget with the data fetch
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()) - milliseconds(1000);
        auto budget = std::min(milliseconds(config_.ai_timeout_secs * 1000L), remaining);
        advisor_->set_backend_healthy(backend_healthy && budget >= milliseconds(1000));
        advisor_->set_timeout(std::max(budget, milliseconds(1)));

        last_recommendation_ = advisor_->get_recommendation(snapshot, indicators, pivots, ledger_->snapshot());
    }

    if (steady_clock::now() > deadline) {
        return abandon("deadline passed before the decision step");
    }

    DecisionInputs inputs;
    inputs.price = snapshot.current_price;
    inputs.indicators = indicators;
    inputs.advisor = *last_recommendation_;

    CycleResult result = engine_->run_cycle(inputs, now);
    report.engine = result;

    std::ostringstream line;
    line << "Cycle " << cycles_run_ << " | " << config_.symbol << " $" << std::fixed << std::setprecision(2)
         << snapshot.current_price << " | RSI " << indicators.rsi
         << " | " << action_to_string(inputs.advisor.action) << " (" << source_to_string(inputs.advisor.source) << ")"
         << " | " << decision_action_to_string(result.decision.action)
         << " -> " << outcome_to_string(result.outcome);
    std::cout << line.str() << std::endl;

    last_event_ = result.message.empty() ? line.str() : result.message;
    report.message = last_event_;

    reconcile_balances();
    write_report(&snapshot, now);
    return report;
}

void TradingBot::reconcile_balances() {
    try {
        ledger_->reconcile(exchange_->get_balances());
    } catch (const std::exception& e) {
        std::cerr << "⚠️ Reconciliation skipped: " << e.what() << std::endl;
    }
}

void TradingBot::write_report(const MarketSnapshot* snapshot, system_clock::time_point now) {
    ReportContext ctx;
    ctx.mode = config_.is_simulation() ? "SIMULATION" : exchange_->name();
    ctx.portfolio = ledger_->snapshot();
    ctx.quote_asset = config_.quote_asset;
    if (snapshot) {
        ctx.current_price = snapshot->current_price;
        ctx.change_24h_pct = snapshot->change_24h_pct;
        ctx.high_24h = snapshot->high_24h;
        ctx.low_24h = snapshot->low_24h;
    }
    ctx.indicators = last_indicators_;
    ctx.pivots = last_pivots_;
    ctx.recommendation = last_recommendation_;
    ctx.limits = limiter_->get_status(now);
    ctx.engine_state = state_to_string(engine_->state());
    ctx.last_event = last_event_;
    ctx.started_at = started_at_;
    ctx.updated_at = now;
    reporter_.write(ctx);
}

void TradingBot::run() {
    running_ = true;
    std::cout << "\n🚀 Trading loop started, one cycle every " << config_.cycle_interval_secs << "s" << std::endl;

    while (running_) {
        auto cycle_start = steady_clock::now();
        try {
            run_cycle();
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }

        auto elapsed = duration_cast<seconds>(steady_clock::now() - cycle_start).count();
        int sleep = std::max(1, config_.cycle_interval_secs - static_cast<int>(elapsed));
        for (int i = 0; i < sleep && running_; i++) {
            std::this_thread::sleep_for(seconds(1));
        }
    }

    std::cout << "Trading loop stopped" << std::endl;
}

void TradingBot::print_summary() const {
    PortfolioState s = ledger_ ? ledger_->snapshot() : PortfolioState{};
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "SESSION SUMMARY" << std::endl;
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "  Cycles: " << cycles_run_ << std::endl;
    std::cout << "  Fills booked: " << s.trade_history.size() << std::endl;
    std::cout << "  Realized P&L: $" << std::fixed << std::setprecision(2) << s.realized_pnl << std::endl;
    std::cout << "  Win rate: " << std::setprecision(1) << s.win_rate() * 100.0 << "% ("
              << s.winning_trades << "W/" << s.losing_trades << "L)" << std::endl;
    std::cout << "  Position: " << (s.position ? "OPEN" : "flat") << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}
