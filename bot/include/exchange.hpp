#pragma once

#include <string>
#include <map>
#include "models.hpp"

/*
 * Exchange collaborator. submit_order never throws for business rejections:
 * anything that was not executed comes back as OrderResult::rejected.
 * get_balances/get_price throw std::runtime_error when the venue is unreachable.
 */
class Exchange {
public:
    virtual ~Exchange() = default;

    virtual std::string name() const = 0;
    virtual OrderResult submit_order(const Order& order) = 0;
    virtual std::map<std::string, double> get_balances() = 0;
    virtual double get_price(const std::string& symbol) = 0;

    // Latest market price seen by the trading loop; simulated venues fill at it
    virtual void observe_price(const std::string& symbol, double price) {}
};
