#include "portfolio_reporter.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

const std::string RULE(60, '-');

std::string format_time(system_clock::time_point tp) {
    std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return buf;
}

std::string format_uptime(system_clock::duration d) {
    long secs = duration_cast<seconds>(d).count();
    std::ostringstream out;
    out << secs / 86400 << "d " << (secs % 86400) / 3600 << "h " << (secs % 3600) / 60 << "m";
    return out.str();
}

void section(std::ostringstream& out, const std::string& title) {
    out << "\n" << RULE << "\n" << title << "\n" << RULE << "\n";
}

}  // namespace

std::string PortfolioReporter::render(const ReportContext& ctx) const {
    const PortfolioState& p = ctx.portfolio;
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    out << std::string(60, '=') << "\n";
    out << "  CRYPTO TRADING BOT - PORTFOLIO STATUS [" << ctx.mode << "]\n";
    out << std::string(60, '=') << "\n";
    out << "Last Updated: " << format_time(ctx.updated_at) << "\n";
    out << "Bot Started:  " << format_time(ctx.started_at) << "\n";
    out << "Uptime:       " << format_uptime(ctx.updated_at - ctx.started_at) << "\n";

    section(out, "MARKET DATA - " + p.symbol);
    if (ctx.current_price > 0) {
        out << "  Current Price:     $" << ctx.current_price << "\n";
        out << "  24h Change:        " << ctx.change_24h_pct << "%\n";
        out << "  24h High:          $" << ctx.high_24h << "\n";
        out << "  24h Low:           $" << ctx.low_24h << "\n";
    } else {
        out << "  No market data this cycle\n";
    }

    if (ctx.pivots) {
        const PivotLevels& pv = *ctx.pivots;
        section(out, "SUPPORT & RESISTANCE (previous closed period)");
        out << "  R2:                $" << pv.r2 << "\n";
        out << "  R1:                $" << pv.r1 << "\n";
        out << "  Pivot:             $" << pv.pp << "\n";
        out << "  S1:                $" << pv.s1 << "\n";
        out << "  S2:                $" << pv.s2 << "\n";
    }

    if (ctx.indicators) {
        const IndicatorSet& ind = *ctx.indicators;
        section(out, "INDICATORS");
        out << "  SMA Short:         $" << ind.sma_short << "\n";
        out << "  SMA Long:          $" << ind.sma_long << "\n";
        out << "  Trend:             " << (ind.is_bullish() ? "BULLISH" : "BEARISH")
            << " (cross " << sma_cross_to_string(ind.sma_cross) << ")\n";
        out << "  RSI:               " << ind.rsi << "\n";
    }

    section(out, "ADVISOR");
    if (ctx.recommendation) {
        const AdvisorRecommendation& r = *ctx.recommendation;
        out << "  Source:            " << source_to_string(r.source) << "\n";
        out << "  Recommendation:    " << action_to_string(r.action) << "\n";
        out << "  Confidence:        " << std::setprecision(0) << r.confidence << "%\n" << std::setprecision(2);
        out << "  Stop-Loss:         $" << r.stop_loss << "\n";
        out << "  Take-Profit:       $" << r.take_profit << "\n";
        out << "  Buy Target:        $" << r.buy_target << "\n";
        out << "  Sell Target:       $" << r.sell_target << "\n";
        out << "  Reasoning:         " << r.reasoning << "\n";
    } else {
        out << "  No recommendation yet\n";
    }

    section(out, "DAILY TRADE LIMITS");
    out << "  Date (UTC):        " << ctx.limits.date << "\n";
    out << "  Trades Today:      " << ctx.limits.trades_executed << "/" << ctx.limits.max_trades_per_day << "\n";
    out << "  Can Trade:         " << (ctx.limits.can_trade ? "Yes" : "No (limit reached)") << "\n";

    section(out, "POSITION (" + ctx.engine_state + ")");
    if (p.position) {
        const Position& pos = *p.position;
        out << "  Side:              " << (pos.side == OrderSide::BUY ? "LONG" : "SHORT") << "\n";
        out << "  Entry Price:       $" << pos.entry_price << "\n";
        out << "  Size:              " << std::setprecision(8) << pos.quantity << std::setprecision(2) << "\n";
        if (ctx.current_price > 0) {
            out << "  Value:             $" << pos.quantity * ctx.current_price << "\n";
            out << "  Unrealized P&L:    $" << pos.unrealized_pnl(ctx.current_price) << "\n";
        }
    } else {
        out << "  No open position\n";
    }

    section(out, "BALANCES");
    // Only the traded pair has a price; other holdings are listed but not valued
    std::string base_asset = split_symbol(p.symbol, ctx.quote_asset).first;
    double total = 0.0;
    for (const auto& [asset, amount] : p.balances) {
        bool is_quote = asset == ctx.quote_asset;
        out << "  " << std::left << std::setw(19) << (asset + ":") << std::right
            << std::setprecision(is_quote ? 2 : 8) << amount << std::setprecision(2) << "\n";
        if (is_quote) total += amount;
        else if (asset == base_asset) total += amount * ctx.current_price;
    }
    if (ctx.current_price > 0) {
        out << "  Total Value:       $" << total << " (" << base_asset << " + " << ctx.quote_asset << ")\n";
    }

    section(out, "PERFORMANCE");
    out << "  Realized P&L:      $" << p.realized_pnl << "\n";
    out << "  Fills Booked:      " << p.trade_history.size() << "\n";
    out << "  Winning Trades:    " << p.winning_trades << "\n";
    out << "  Losing Trades:     " << p.losing_trades << "\n";
    out << "  Win Rate:          " << std::setprecision(1) << p.win_rate() * 100.0 << "%\n" << std::setprecision(2);
    out << "  Largest Win:       $" << p.largest_win << "\n";
    out << "  Largest Loss:      $" << p.largest_loss << "\n";

    if (!p.drifts.empty()) {
        section(out, "RECONCILIATION ALERTS");
        for (const auto& d : p.drifts) {
            out << "  " << d.asset << ": ledger " << std::setprecision(8) << d.ledger_amount
                << " vs exchange " << d.exchange_amount << std::setprecision(2) << "\n";
        }
    }

    section(out, "LAST EVENT");
    out << "  " << (ctx.last_event.empty() ? "None" : ctx.last_event) << "\n";
    out << std::string(60, '=') << "\n";
    return out.str();
}

bool PortfolioReporter::write(const ReportContext& ctx) const {
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            std::cerr << "⚠️ Cannot write report to " << tmp_path << std::endl;
            return false;
        }
        out << render(ctx);
        if (!out.good()) {
            std::cerr << "⚠️ Report write failed for " << tmp_path << std::endl;
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::cerr << "⚠️ Cannot replace report " << path_ << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}
