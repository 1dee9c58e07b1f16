#pragma once

#include <string>
#include <optional>
#include "models.hpp"
#include "advisor_bridge.hpp"
#include "trade_limiter.hpp"
#include "portfolio_ledger.hpp"

// Everything one status report shows; market fields are absent when the cycle had no data
struct ReportContext {
    std::string mode;               // "SIMULATION", "BINANCE", ...
    PortfolioState portfolio;
    std::string quote_asset;
    double current_price = 0.0;
    double change_24h_pct = 0.0;
    double high_24h = 0.0;
    double low_24h = 0.0;
    std::optional<IndicatorSet> indicators;
    std::optional<PivotLevels> pivots;
    std::optional<AdvisorRecommendation> recommendation;
    TradeLimitStatus limits;
    std::string engine_state;
    std::string last_event;
    system_clock::time_point started_at;
    system_clock::time_point updated_at;
};

/*
 * Plain-text status file rewritten after every cycle. The file is replaced
 * through a temporary sibling and a rename so readers never see half a report.
 */
class PortfolioReporter {
public:
    explicit PortfolioReporter(const std::string& path) : path_(path) {}

    std::string render(const ReportContext& ctx) const;
    bool write(const ReportContext& ctx) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
