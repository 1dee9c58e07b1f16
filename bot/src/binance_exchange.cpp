#include "binance_exchange.hpp"
#include "http_client.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
constexpr long REQUEST_TIMEOUT_SECS = 10;
constexpr int INSUFFICIENT_BALANCE_CODE = -2010;
constexpr double QUANTITY_EPSILON = 1e-9;

long long now_ms() {
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}

BinanceExchange::BinanceExchange(const std::string& api_key, const std::string& api_secret,
                                 bool testnet, int quantity_decimals, const std::string& quote_asset)
    : api_key_(api_key),
      api_secret_(api_secret),
      testnet_(testnet),
      base_url_(testnet ? TESTNET_URL : MAINNET_URL),
      quantity_decimals_(quantity_decimals),
      quote_asset_(quote_asset) {
    if (api_key_.empty() || api_secret_.empty()) {
        throw std::runtime_error("Binance API key and secret are required");
    }
    std::cout << "🔑 Binance " << (testnet_ ? "TESTNET" : "LIVE") << " client at " << base_url_ << std::endl;
}

std::string BinanceExchange::sign(const std::string& query) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         api_secret_.data(), static_cast<int>(api_secret_.size()),
         reinterpret_cast<const unsigned char*>(query.data()), query.size(),
         digest, &digest_len);

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

std::vector<std::string> BinanceExchange::auth_headers() const {
    return {"X-MBX-APIKEY: " + api_key_};
}

std::string BinanceExchange::format_quantity(double quantity, int decimals) {
    // Round down so the order never exceeds what the ledger sized; the epsilon
    // keeps 0.00013 (stored as 0.000129999...) from losing a whole step
    double scale = std::pow(10.0, decimals);
    double truncated = std::floor(quantity * scale + QUANTITY_EPSILON) / scale;
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << truncated;
    return out.str();
}

RejectReason BinanceExchange::classify_error(long http_status, const std::string& body) {
    if (http_status == 429 || http_status == 418) {
        return RejectReason::RATE_LIMITED;
    }
    try {
        json err = json::parse(body);
        if (err.contains("code") && err["code"].is_number_integer() &&
            err["code"].get<int>() == INSUFFICIENT_BALANCE_CODE) {
            return RejectReason::INSUFFICIENT_BALANCE;
        }
    } catch (const std::exception&) {
        // Non-JSON error pages fall through to the status code
    }
    if (http_status >= 400 && http_status < 500) {
        return RejectReason::INVALID_ORDER;
    }
    return RejectReason::UNKNOWN;
}

double BinanceExchange::get_price(const std::string& symbol) {
    return retry_with_backoff([&]() {
        HttpResponse response = http_get(base_url_ + "/api/v3/ticker/price?symbol=" + symbol, {}, REQUEST_TIMEOUT_SECS);
        json body = parse_json_response(response, "Binance ticker");
        return std::stod(body.at("price").get<std::string>());
    }, 3, 500);
}

std::map<std::string, double> BinanceExchange::get_balances() {
    return retry_with_backoff([&]() {
        std::string query = "timestamp=" + std::to_string(now_ms());
        std::string url = base_url_ + "/api/v3/account?" + query + "&signature=" + sign(query);

        HttpResponse response = http_get(url, auth_headers(), REQUEST_TIMEOUT_SECS);
        json body = parse_json_response(response, "Binance account");

        std::map<std::string, double> balances;
        for (const auto& b : body.at("balances")) {
            double free = std::stod(b.at("free").get<std::string>());
            if (free > 0) {
                balances[b.at("asset").get<std::string>()] = free;
            }
        }
        return balances;
    }, 3, 500);
}

OrderResult BinanceExchange::submit_order(const Order& order) {
    std::string qty = format_quantity(order.quantity, quantity_decimals_);
    if (std::stod(qty) <= 0) {
        return OrderResult::rejected(RejectReason::INVALID_ORDER, "Quantity rounds to zero: " + std::to_string(order.quantity));
    }

    // Orders are never retried: a lost response could hide an executed fill
    std::string query = "symbol=" + order.symbol +
                        "&side=" + side_to_string(order.side) +
                        "&type=MARKET" +
                        "&quantity=" + qty +
                        "&newOrderRespType=FULL" +
                        "&timestamp=" + std::to_string(now_ms());
    std::string url = base_url_ + "/api/v3/order?" + query + "&signature=" + sign(query);

    HttpResponse response;
    try {
        response = http_post(url, "", auth_headers(), REQUEST_TIMEOUT_SECS);
    } catch (const HttpError& e) {
        return OrderResult::rejected(RejectReason::CONNECTIVITY, e.what());
    }

    if (!response.ok()) {
        RejectReason reason = classify_error(response.status, response.body);
        return OrderResult::rejected(reason, "HTTP " + std::to_string(response.status) + ": " + response.body.substr(0, 200));
    }

    OrderResult result = parse_order_fill(response.body, split_symbol(order.symbol, quote_asset_).first, quote_asset_);
    if (result.filled) {
        std::cout << "✅ Binance " << side_to_string(order.side) << " filled: " << std::fixed << std::setprecision(6)
                  << result.fill.quantity << " " << order.symbol << " @ $" << std::setprecision(2)
                  << result.fill.price << std::endl;
    } else {
        std::cerr << "❌ Binance order not booked: " << result.message << std::endl;
    }
    return result;
}

OrderResult BinanceExchange::parse_order_fill(const std::string& body_text, const std::string& base_asset,
                                              const std::string& quote_asset) {
    try {
        json body = json::parse(body_text);
        double executed = std::stod(body.at("executedQty").get<std::string>());
        double quote_qty = std::stod(body.at("cummulativeQuoteQty").get<std::string>());
        if (executed <= 0) {
            return OrderResult::rejected(RejectReason::UNKNOWN, "Order accepted but nothing executed, status " +
                                         body.value("status", std::string("?")));
        }

        double base_fee = 0.0, quote_fee = 0.0;
        if (body.contains("fills") && body["fills"].is_array()) {
            for (const auto& f : body["fills"]) {
                std::string asset = f.value("commissionAsset", std::string());
                double fee = std::stod(f.value("commission", std::string("0")));
                if (asset == base_asset) base_fee += fee;
                else if (asset == quote_asset) quote_fee += fee;
            }
        }
        if (base_fee >= executed) {
            return OrderResult::rejected(RejectReason::UNKNOWN, "Commission consumed the whole fill");
        }

        bool is_sell = body.value("side", std::string("BUY")) == "SELL";
        double net_quote = is_sell ? quote_qty - quote_fee : quote_qty + quote_fee;

        Fill fill;
        fill.quantity = executed - base_fee;
        fill.price = net_quote / fill.quantity;
        fill.timestamp = body.contains("transactTime")
            ? system_clock::time_point(milliseconds(body["transactTime"].get<long long>()))
            : system_clock::now();
        return OrderResult::executed(fill);
    } catch (const std::exception& e) {
        return OrderResult::rejected(RejectReason::UNKNOWN, std::string("Unreadable order reply: ") + e.what() +
                                     " body: " + body_text.substr(0, 200));
    }
}
