#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <optional>
#include "models.hpp"
#include "llm_backend.hpp"
#include "portfolio_ledger.hpp"

enum class AdvisorAction { STRONG_BUY, BUY, HOLD, SELL, STRONG_SELL };
enum class AdvisorSource { AI, FALLBACK };

struct AdvisorRecommendation {
    AdvisorAction action = AdvisorAction::HOLD;
    double confidence = 50.0;   // [0, 100]
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double buy_target = 0.0;
    double sell_target = 0.0;
    std::string reasoning;
    AdvisorSource source = AdvisorSource::FALLBACK;
    system_clock::time_point generated_at;

    bool is_buy() const { return action == AdvisorAction::BUY || action == AdvisorAction::STRONG_BUY; }
    bool is_sell() const { return action == AdvisorAction::SELL || action == AdvisorAction::STRONG_SELL; }
};

std::string action_to_string(AdvisorAction action);
std::string source_to_string(AdvisorSource source);

// Rule-based targets used whenever the AI answer is missing or unusable
class FallbackCalculator {
public:
    static constexpr double CONFIDENCE = 50.0;
    static constexpr double RSI_OVERSOLD = 30.0;
    static constexpr double RSI_OVERBOUGHT = 70.0;

    static AdvisorRecommendation calculate(const IndicatorSet& indicators, const PivotLevels& pivots);
    static AdvisorAction derive_action(const IndicatorSet& indicators);
};

struct AdvisorConfig {
    bool enabled = true;
    std::string model = "mistral";
    std::string quote_asset = "USDT";
    milliseconds timeout{120000};
};

/*
 * ADVISOR BRIDGE
 *
 * Asks the AI backend for targets once per call, bounded by the configured
 * timeout, and substitutes the fallback calculator on timeout, transport
 * error, unhealthy backend or an answer with no recognizable field. Fields the
 * AI left out are filled from the fallback individually. Never throws.
 */
class AdvisorBridge {
public:
    AdvisorBridge(std::shared_ptr<LlmBackend> backend, const AdvisorConfig& config);

    AdvisorRecommendation get_recommendation(const MarketSnapshot& snapshot,
                                             const IndicatorSet& indicators,
                                             const PivotLevels& pivots,
                                             const PortfolioState& portfolio);

    // Result of the latest health check; an unhealthy backend is not queried
    void set_backend_healthy(bool healthy) { backend_healthy_ = healthy; }
    bool backend_healthy() const { return backend_healthy_; }

    void set_timeout(milliseconds timeout) { config_.timeout = timeout; }
    milliseconds timeout() const { return config_.timeout; }
    bool enabled() const { return config_.enabled && backend_ != nullptr; }

    static std::string build_prompt(const MarketSnapshot& snapshot,
                                    const IndicatorSet& indicators,
                                    const PivotLevels& pivots,
                                    const PortfolioState& portfolio,
                                    const std::string& quote_asset);

    // Empty when the text carries none of the expected labels
    static std::optional<AdvisorRecommendation> parse_response(const std::string& text,
                                                               const AdvisorRecommendation& fallback);

private:
    std::optional<std::string> request_with_timeout(const std::string& prompt);

    std::shared_ptr<LlmBackend> backend_;
    AdvisorConfig config_;
    std::atomic<bool> backend_healthy_{true};
};
