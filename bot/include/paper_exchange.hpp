#pragma once

#include <string>
#include <map>
#include <mutex>
#include <functional>
#include "exchange.hpp"

/*
 * PAPER EXCHANGE
 *
 * Simulated venue for paper trading. Balances start with the configured quote
 * amount, market orders fill in full at the last observed price and are
 * rejected when the account cannot cover them.
 */
class PaperExchange : public Exchange {
public:
    using PriceFeed = std::function<double(const std::string&)>;

    PaperExchange(const std::string& quote_asset, double initial_quote_balance, PriceFeed feed = nullptr);

    std::string name() const override { return "paper"; }
    OrderResult submit_order(const Order& order) override;
    std::map<std::string, double> get_balances() override;
    double get_price(const std::string& symbol) override;

    void observe_price(const std::string& symbol, double price) override;

private:
    std::string quote_asset_;
    PriceFeed feed_;
    std::map<std::string, double> balances_;
    std::map<std::string, double> last_prices_;
    std::mutex mutex_;
};
