#include "paper_exchange.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

PaperExchange::PaperExchange(const std::string& quote_asset, double initial_quote_balance, PriceFeed feed)
    : quote_asset_(quote_asset), feed_(std::move(feed)) {
    balances_[quote_asset_] = initial_quote_balance;
    std::cout << "💰 Paper account seeded with " << std::fixed << std::setprecision(2)
              << initial_quote_balance << " " << quote_asset_ << std::endl;
}

void PaperExchange::observe_price(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_prices_[symbol] = price;
}

double PaperExchange::get_price(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_prices_.find(symbol);
        if (it != last_prices_.end()) return it->second;
    }
    if (feed_) {
        double price = feed_(symbol);
        observe_price(symbol, price);
        return price;
    }
    throw std::runtime_error("No price observed yet for " + symbol);
}

std::map<std::string, double> PaperExchange::get_balances() {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

OrderResult PaperExchange::submit_order(const Order& order) {
    if (order.quantity <= 0) {
        return OrderResult::rejected(RejectReason::INVALID_ORDER, "Quantity must be positive");
    }

    double price = 0.0;
    try {
        price = get_price(order.symbol);
    } catch (const std::exception& e) {
        return OrderResult::rejected(RejectReason::CONNECTIVITY, e.what());
    }

    std::string base_asset = split_symbol(order.symbol, quote_asset_).first;
    double notional = price * order.quantity;

    std::lock_guard<std::mutex> lock(mutex_);
    double& quote = balances_[quote_asset_];
    double& base = balances_[base_asset];

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(8);
    if (order.side == OrderSide::BUY) {
        if (quote < notional) {
            msg << "Insufficient balance: need " << notional << " " << quote_asset_ << ", have " << quote;
            return OrderResult::rejected(RejectReason::INSUFFICIENT_BALANCE, msg.str());
        }
        quote -= notional;
        base += order.quantity;
    } else {
        if (base < order.quantity) {
            msg << "Insufficient balance: need " << order.quantity << " " << base_asset << ", have " << base;
            return OrderResult::rejected(RejectReason::INSUFFICIENT_BALANCE, msg.str());
        }
        base -= order.quantity;
        quote += notional;
    }

    Fill fill;
    fill.price = price;
    fill.quantity = order.quantity;
    fill.timestamp = system_clock::now();

    std::cout << "📝 PAPER " << side_to_string(order.side) << " " << std::fixed << std::setprecision(6)
              << order.quantity << " " << order.symbol << " @ $" << std::setprecision(2) << price << std::endl;
    return OrderResult::executed(fill);
}
