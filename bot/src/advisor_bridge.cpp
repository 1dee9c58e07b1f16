#include "advisor_bridge.hpp"
#include "background_tasks.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n*");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n*");
    return s.substr(start, end - start + 1);
}

// "**Stop Loss:** $41,200" -> {"STOP_LOSS", "$41,200"}; first occurrence of a label wins
std::map<std::string, std::string> extract_fields(const std::string& text) {
    std::map<std::string, std::string> fields;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string value = trim(line.substr(colon + 1));
        // "[0-100]%", "$[price]": the answer template echoed back, not a value
        if (value.find('[') != std::string::npos) continue;

        std::string label;
        for (char c : line.substr(0, colon)) {
            if (std::isalpha(static_cast<unsigned char>(c))) {
                label += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            } else if ((c == ' ' || c == '_') && !label.empty() && label.back() != '_') {
                label += '_';
            }
        }
        while (!label.empty() && label.back() == '_') label.pop_back();
        if (label.empty()) continue;

        fields.emplace(label, value);
    }
    return fields;
}

// First number in the value, sign kept, thousands separators dropped
std::optional<double> parse_number(const std::string& value) {
    size_t start = value.find_first_of("0123456789");
    if (start == std::string::npos) return std::nullopt;
    if (start > 0 && value[start - 1] == '.') start--;

    // "-5", "-$5" and "$-5" are all negative
    bool negative = false;
    for (size_t i = start; i > 0; i--) {
        char c = value[i - 1];
        if (c == '-') { negative = true; break; }
        if (c != '$' && c != ' ') break;
    }

    std::string digits = negative ? "-" : "";
    for (size_t i = start; i < value.size(); i++) {
        char c = value[i];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') digits += c;
        else if (c == ',') continue;
        else break;
    }
    try {
        return std::stod(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<AdvisorAction> parse_action(const std::string& value) {
    std::string v = to_upper(value);
    std::replace(v.begin(), v.end(), ' ', '_');

    // "[STRONG_BUY/BUY/HOLD/...]" echoed back from the template is not an answer
    if (v.find('/') != std::string::npos) return std::nullopt;
    if (v.find("STRONG_BUY") != std::string::npos) return AdvisorAction::STRONG_BUY;
    if (v.find("STRONG_SELL") != std::string::npos) return AdvisorAction::STRONG_SELL;
    if (v.find("BUY") != std::string::npos) return AdvisorAction::BUY;
    if (v.find("SELL") != std::string::npos) return AdvisorAction::SELL;
    if (v.find("HOLD") != std::string::npos) return AdvisorAction::HOLD;
    return std::nullopt;
}

std::optional<double> find_price(const std::map<std::string, double>& prices, const std::string& label) {
    auto it = prices.find(label);
    if (it == prices.end()) return std::nullopt;
    return it->second;
}

}  // namespace

std::string action_to_string(AdvisorAction action) {
    switch (action) {
        case AdvisorAction::STRONG_BUY: return "STRONG_BUY";
        case AdvisorAction::BUY: return "BUY";
        case AdvisorAction::HOLD: return "HOLD";
        case AdvisorAction::SELL: return "SELL";
        case AdvisorAction::STRONG_SELL: return "STRONG_SELL";
    }
    return "HOLD";
}

std::string source_to_string(AdvisorSource source) {
    return source == AdvisorSource::AI ? "AI" : "FALLBACK";
}

AdvisorAction FallbackCalculator::derive_action(const IndicatorSet& indicators) {
    if (indicators.rsi < RSI_OVERSOLD) {
        return indicators.sma_short >= indicators.sma_long ? AdvisorAction::STRONG_BUY : AdvisorAction::BUY;
    }
    if (indicators.rsi > RSI_OVERBOUGHT) {
        return indicators.sma_short <= indicators.sma_long ? AdvisorAction::STRONG_SELL : AdvisorAction::SELL;
    }
    return AdvisorAction::HOLD;
}

AdvisorRecommendation FallbackCalculator::calculate(const IndicatorSet& indicators, const PivotLevels& pivots) {
    AdvisorRecommendation rec;
    rec.action = derive_action(indicators);
    rec.confidence = CONFIDENCE;
    rec.buy_target = pivots.s1;
    rec.sell_target = pivots.r1;
    rec.stop_loss = pivots.s2;
    rec.take_profit = pivots.r2;
    rec.source = AdvisorSource::FALLBACK;
    rec.generated_at = system_clock::now();

    std::ostringstream why;
    why << std::fixed << std::setprecision(1) << "Pivot targets (S1/R1, stop S2, target R2); RSI "
        << indicators.rsi << ", SMA trend " << (indicators.is_bullish() ? "bullish" : "bearish");
    rec.reasoning = why.str();
    return rec;
}

AdvisorBridge::AdvisorBridge(std::shared_ptr<LlmBackend> backend, const AdvisorConfig& config)
    : backend_(std::move(backend)), config_(config) {}

AdvisorRecommendation AdvisorBridge::get_recommendation(const MarketSnapshot& snapshot,
                                                        const IndicatorSet& indicators,
                                                        const PivotLevels& pivots,
                                                        const PortfolioState& portfolio) {
    AdvisorRecommendation fallback = FallbackCalculator::calculate(indicators, pivots);

    if (!config_.enabled || !backend_) {
        return fallback;
    }
    if (!backend_healthy_) {
        std::cerr << "⚠️ AI backend unhealthy, using fallback targets" << std::endl;
        return fallback;
    }

    std::string prompt = build_prompt(snapshot, indicators, pivots, portfolio, config_.quote_asset);

    std::cout << "🤖 Requesting AI analysis for " << snapshot.symbol << "..." << std::endl;
    auto text = request_with_timeout(prompt);
    if (!text) {
        return fallback;
    }

    auto parsed = parse_response(*text, fallback);
    if (!parsed) {
        std::cerr << "⚠️ AI response had no usable fields, using fallback targets" << std::endl;
        return fallback;
    }

    std::cout << "✅ AI recommendation: " << action_to_string(parsed->action) << " ("
              << std::fixed << std::setprecision(0) << parsed->confidence << "% confidence)" << std::endl;
    return *parsed;
}

std::optional<std::string> AdvisorBridge::request_with_timeout(const std::string& prompt) {
    // The worker owns its own references so it may outlive this call after a timeout
    std::shared_ptr<LlmBackend> backend = backend_;
    std::string model = config_.model;
    int timeout_secs = static_cast<int>((config_.timeout.count() + 999) / 1000);

    std::future<std::string> result = background_tasks().launch([backend, model, prompt, timeout_secs]() {
        return backend->generate(model, prompt, timeout_secs);
    });

    if (result.wait_for(config_.timeout) != std::future_status::ready) {
        std::cerr << "⚠️ AI request timed out after " << config_.timeout.count()
                  << "ms, using fallback targets" << std::endl;
        return std::nullopt;
    }

    try {
        return result.get();
    } catch (const std::exception& e) {
        std::cerr << "⚠️ AI request failed: " << e.what() << ", using fallback targets" << std::endl;
        return std::nullopt;
    }
}

std::string AdvisorBridge::build_prompt(const MarketSnapshot& snapshot,
                                        const IndicatorSet& indicators,
                                        const PivotLevels& pivots,
                                        const PortfolioState& portfolio,
                                        const std::string& quote_asset) {
    auto range = [](const std::vector<Candle>& candles, double& lo, double& hi) {
        if (candles.empty()) return false;
        lo = candles.front().low;
        hi = candles.front().high;
        for (const auto& c : candles) {
            lo = std::min(lo, c.low);
            hi = std::max(hi, c.high);
        }
        return true;
    };

    std::ostringstream p;
    p << std::fixed << std::setprecision(2);
    p << "You are a crypto trading analyst specializing in support and resistance analysis. "
      << "Analyze the following market data and calculate precise trading targets.\n\n";

    p << "MARKET DATA FOR " << snapshot.symbol << ":\n";
    p << "- Current Price: $" << snapshot.current_price << "\n";
    p << "- 24h High: $" << snapshot.high_24h << "\n";
    p << "- 24h Low: $" << snapshot.low_24h << "\n";
    p << "- 24h Change: " << snapshot.change_24h_pct << "%\n";

    double lo = 0, hi = 0;
    if (range(snapshot.candles_12h, lo, hi)) p << "- 12h Range: $" << lo << " - $" << hi << "\n";
    if (range(snapshot.candles_48h, lo, hi)) p << "- 48h Range: $" << lo << " - $" << hi << "\n";

    p << "- Moving Averages: SMA(short) " << indicators.sma_short << ", SMA(long) " << indicators.sma_long
      << ", Trend: " << (indicators.is_bullish() ? "BULLISH" : "BEARISH")
      << ", Last cross: " << sma_cross_to_string(indicators.sma_cross) << "\n";
    p << "- RSI(14): " << indicators.rsi << " ("
      << (indicators.rsi > 70 ? "OVERBOUGHT" : indicators.rsi < 30 ? "OVERSOLD" : "NEUTRAL") << ")\n\n";

    p << "PIVOT LEVELS (previous closed day):\n";
    p << "- PP: $" << pivots.pp << "  R1: $" << pivots.r1 << "  R2: $" << pivots.r2
      << "  S1: $" << pivots.s1 << "  S2: $" << pivots.s2 << "\n\n";

    p << "ACCOUNT:\n";
    for (const auto& [asset, amount] : portfolio.balances) {
        p << "- " << asset << ": " << std::setprecision(asset == quote_asset ? 2 : 8) << amount << "\n";
    }
    p << std::setprecision(2);
    if (portfolio.position) {
        const auto& pos = *portfolio.position;
        double pnl_pct = pos.entry_price > 0 ? (snapshot.current_price - pos.entry_price) / pos.entry_price * 100.0 : 0.0;
        p << "- Open position: " << std::setprecision(8) << pos.quantity << std::setprecision(2)
          << " @ $" << pos.entry_price << ", P&L " << pnl_pct << "%\n\n";
    } else {
        p << "- No open position\n\n";
    }

    p << "Provide your analysis in EXACTLY this format (use these exact labels):\n\n"
      << "RECOMMENDATION: [STRONG_BUY/BUY/HOLD/SELL/STRONG_SELL]\n"
      << "CONFIDENCE: [0-100]%\n"
      << "STOP_LOSS: $[price]\n"
      << "TAKE_PROFIT: $[price]\n"
      << "BUY_TARGET: $[entry price near support]\n"
      << "SELL_TARGET: $[exit price near resistance]\n"
      << "REASONING: [2-3 sentences]\n\n"
      << "Rules: stop-loss below strong support, take-profit near or above resistance, "
      << "give dollar amounts, not percentages.";
    return p.str();
}

std::optional<AdvisorRecommendation> AdvisorBridge::parse_response(const std::string& text,
                                                                   const AdvisorRecommendation& fallback) {
    auto fields = extract_fields(text);
    AdvisorRecommendation rec = fallback;
    rec.source = AdvisorSource::AI;
    rec.generated_at = system_clock::now();
    int recognized = 0;

    auto it = fields.find("RECOMMENDATION");
    if (it != fields.end()) {
        if (auto action = parse_action(it->second)) {
            rec.action = *action;
            recognized++;
        }
    }

    it = fields.find("CONFIDENCE");
    if (it != fields.end()) {
        if (auto conf = parse_number(it->second)) {
            rec.confidence = std::clamp(*conf, 0.0, 100.0);
            recognized++;
        }
    }

    std::map<std::string, double> prices;
    for (const char* label : {"STOP_LOSS", "TAKE_PROFIT", "BUY_TARGET", "SELL_TARGET"}) {
        it = fields.find(label);
        if (it == fields.end()) continue;
        auto value = parse_number(it->second);
        if (value && *value > 0) {
            prices[label] = *value;
            recognized++;
        }
    }
    if (auto v = find_price(prices, "STOP_LOSS")) rec.stop_loss = *v;
    if (auto v = find_price(prices, "TAKE_PROFIT")) rec.take_profit = *v;
    if (auto v = find_price(prices, "BUY_TARGET")) rec.buy_target = *v;
    if (auto v = find_price(prices, "SELL_TARGET")) rec.sell_target = *v;

    // An inverted exit band would trigger both exits at once
    if (rec.stop_loss >= rec.take_profit) {
        std::cerr << "⚠️ AI stop-loss $" << rec.stop_loss << " not below take-profit $"
                  << rec.take_profit << ", keeping pivot exits" << std::endl;
        rec.stop_loss = fallback.stop_loss;
        rec.take_profit = fallback.take_profit;
    }

    it = fields.find("REASONING");
    if (it != fields.end() && !it->second.empty()) {
        rec.reasoning = it->second;
        recognized++;
    }

    if (recognized == 0) {
        return std::nullopt;
    }
    return rec;
}
