#include "ollama_client.hpp"
#include "http_client.hpp"
#include <iostream>

namespace {
constexpr double TEMPERATURE = 0.3;
constexpr int NUM_PREDICT = 1000;
constexpr long HEALTH_TIMEOUT_SECS = 5;
}

OllamaClient::OllamaClient(const std::string& base_url) : base_url_(base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

bool OllamaClient::health_check() {
    try {
        HttpResponse response = http_get(base_url_ + "/api/tags", {}, HEALTH_TIMEOUT_SECS);
        if (!response.ok()) {
            std::cerr << "⚠️ Ollama responded with HTTP " << response.status << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "❌ Cannot connect to Ollama at " << base_url_ << ": " << e.what() << std::endl;
        return false;
    }
}

std::string OllamaClient::generate(const std::string& model, const std::string& prompt, int timeout_secs) {
    json request = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {{"temperature", TEMPERATURE}, {"num_predict", NUM_PREDICT}}}
    };

    HttpResponse response = http_post(base_url_ + "/api/generate", request.dump(),
                                      {"Content-Type: application/json"}, timeout_secs);
    json body = parse_json_response(response, "Ollama");

    if (!body.contains("response") || !body["response"].is_string()) {
        throw std::runtime_error("Ollama reply has no 'response' text");
    }
    return body["response"].get<std::string>();
}
