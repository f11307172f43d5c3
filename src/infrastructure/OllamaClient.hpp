/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace promptwarden::infrastructure {

/**
 * @class OllamaClient
 * @brief Deadline-bounded calls to /api/generate and /api/tags.
 *
 * Every failure is thrown as domain::GatewayError with kind ModelUnavailable
 * or ModelTimeout and stage "relay". Callers with another stage remap it.
 */
class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a non-streaming POST to /api/generate.
     * @param deterministic Pins temperature, top_p and seed.
     * @param forceJson Asks the model for a JSON document.
     * @return The "response" field of the reply.
     */
    std::string generate(const std::string& model,
                         const std::string& prompt,
                         std::chrono::milliseconds timeout,
                         bool deterministic = false,
                         bool forceJson = false) const;

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels(std::chrono::milliseconds timeout) const;

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace promptwarden::infrastructure
