#pragma once

#include <string>
#include "llm_backend.hpp"

// Local Ollama server (POST /api/generate, GET /api/tags)
class OllamaClient : public LlmBackend {
public:
    explicit OllamaClient(const std::string& base_url = "http://localhost:11434");

    bool health_check() override;
    std::string generate(const std::string& model, const std::string& prompt, int timeout_secs) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
};
