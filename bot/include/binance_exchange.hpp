#pragma once

#include <string>
#include <map>
#include <vector>
#include "exchange.hpp"

/*
 * BINANCE SPOT REST CLIENT
 *
 * Signed endpoints carry timestamp + HMAC-SHA256(query, secret) as hex and
 * the X-MBX-APIKEY header. Only MARKET orders are sent.
 */
class BinanceExchange : public Exchange {
public:
    static constexpr const char* MAINNET_URL = "https://api.binance.com";
    static constexpr const char* TESTNET_URL = "https://testnet.binance.vision";

    BinanceExchange(const std::string& api_key, const std::string& api_secret,
                    bool testnet, int quantity_decimals = 5, const std::string& quote_asset = "USDT");

    std::string name() const override { return testnet_ ? "binance_testnet" : "binance"; }
    OrderResult submit_order(const Order& order) override;
    std::map<std::string, double> get_balances() override;
    double get_price(const std::string& symbol) override;

    std::string sign(const std::string& query) const;

    // Maps an HTTP status and Binance error body to a rejection reason
    static RejectReason classify_error(long http_status, const std::string& body);

    // Quantity floored to the lot precision, e.g. 0.000139 -> "0.00013"
    static std::string format_quantity(double quantity, int decimals);

    // FULL order reply -> fill net of commissions: base-asset fees shrink the
    // quantity received, quote-asset fees are folded into the price
    static OrderResult parse_order_fill(const std::string& body, const std::string& base_asset,
                                        const std::string& quote_asset);

private:
    std::vector<std::string> auth_headers() const;

    std::string api_key_;
    std::string api_secret_;
    bool testnet_;
    std::string base_url_;
    int quantity_decimals_;
    std::string quote_asset_;
};
