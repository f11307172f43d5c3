/**
 * @file OllamaClassifierBackend.hpp
 * @brief ClassifierBackend that asks an Ollama model for a JSON risk score.
 */

#pragma once

#include "domain/ClassifierBackend.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace promptwarden::infrastructure {

/**
 * @class OllamaClassifierBackend
 * @brief Scores texts with deterministic sampling and format "json".
 *
 * Any transport or parse failure surfaces as GatewayError(ScannerUnavailable).
 */
class OllamaClassifierBackend : public domain::ClassifierBackend {
public:
    OllamaClassifierBackend(OllamaClient client, std::string model, std::chrono::milliseconds timeout);

    /** @brief Logs whether the scoring model is present on the server. */
    void initialize() override;

    double score(const domain::ClassificationRequest& request) const override;

    /** @brief Instruction sent ahead of the text for @p request's task. */
    static std::string BuildPrompt(const domain::ClassificationRequest& request);

    /**
     * @brief Extracts "score" from the model's JSON answer.
     * @throws GatewayError(ScannerUnavailable) if absent or not a number.
     */
    static double ParseScore(const std::string& response);

private:
    OllamaClient m_client;
    std::string m_model;
    std::chrono::milliseconds m_timeout;
};

} // namespace promptwarden::infrastructure
