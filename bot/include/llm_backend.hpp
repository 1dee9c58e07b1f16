#pragma once

#include <string>

// AI backend that turns a prompt into free text
class LlmBackend {
public:
    virtual ~LlmBackend() = default;

    virtual bool health_check() = 0;

    // Throws std::runtime_error on transport errors, timeouts or bad payloads
    virtual std::string generate(const std::string& model, const std::string& prompt, int timeout_secs) = 0;
};
