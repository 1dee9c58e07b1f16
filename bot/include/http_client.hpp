#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*
 * Thin libcurl wrapper shared by the market data, AI and exchange clients.
 * Transport failures throw HttpError; HTTP status codes are returned to the
 * caller untouched.
 */

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& what, bool timeout) : std::runtime_error(what), timed_out(timeout) {}
    bool timed_out;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Call once before any thread issues requests
void http_global_init();
void http_global_cleanup();

HttpResponse http_get(const std::string& url,
                      const std::vector<std::string>& headers = {},
                      long timeout_secs = 30);

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<std::string>& headers = {},
                       long timeout_secs = 30);

// Parses a response body, throwing std::runtime_error with the HTTP status on failure
json parse_json_response(const HttpResponse& response, const std::string& what);

// Retry with exponential backoff
template<typename Func>
auto retry_with_backoff(Func&& func, int max_retries, int base_delay_ms) -> decltype(func()) {
    int delay = base_delay_ms;
    std::exception_ptr last_exception;

    for (int attempt = 0; attempt < max_retries; attempt++) {
        try {
            return func();
        } catch (const std::exception& e) {
            last_exception = std::current_exception();

            if (attempt < max_retries - 1) {
                std::cerr << "⚠️ API call failed (attempt " << (attempt + 1) << "/" << max_retries
                          << "): " << e.what() << " - Retrying in " << delay << "ms..." << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                delay *= 2;
            }
        }
    }

    std::rethrow_exception(last_exception);
}
