/**
 * @file GatewayOrchestrator.hpp
 * @brief Drives one exchange through extraction, input guardrails, the model and output guardrails.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/ExtractionDispatcher.hpp"
#include "application/GuardrailPipeline.hpp"
#include "domain/Artifact.hpp"
#include "domain/AuditSink.hpp"
#include "domain/ChatExchange.hpp"
#include "domain/ModelRelay.hpp"

namespace promptwarden::application {

/**
 * @struct ExchangeRequest
 * @brief One user turn: typed prompt, requested model and an optional attachment.
 */
struct ExchangeRequest {
    std::string prompt;
    std::string modelName;                     ///< Blank selects the configured default.
    std::optional<domain::Artifact> artifact;
};

/**
 * @class GatewayOrchestrator
 * @brief State machine from RECEIVED to a terminal state.
 *
 * Failures never escape submitExchange(): they are recorded in the returned
 * exchange's failure field together with the terminal state reached. A
 * guardrail block is a normal exchange whose final text is a notice.
 */
class GatewayOrchestrator {
public:
    struct Options {
        std::chrono::milliseconds relayTimeout{120000};
        std::string defaultModel = "llama3";
    };

    GatewayOrchestrator(std::shared_ptr<const ExtractionDispatcher> dispatcher,
                        std::shared_ptr<const GuardrailPipeline> pipeline,
                        std::shared_ptr<domain::ModelRelay> relay,
                        Options options,
                        std::shared_ptr<domain::AuditSink> audit = nullptr);

    domain::ChatExchange submitExchange(const ExchangeRequest& request) const;

    /** @brief Backend model names, or just the default model if the backend is unreachable. */
    std::vector<std::string> listModels() const;

    const Options& options() const { return m_options; }

    /** @brief Prompt followed by the "File: <name>\nContent:\n<text>" block. */
    static std::string ComposeInput(const std::string& prompt,
                                    const std::optional<domain::ExtractedText>& attachment);

    /** @brief User-facing notice naming the scanner that blocked @p report. */
    static std::string BlockNotice(const domain::PipelineReport& report);

private:
    void fail(domain::ChatExchange& exchange, domain::ExchangeState terminal,
              domain::ErrorKind kind, const std::string& stage, const std::string& message) const;
    void finish(domain::ChatExchange& exchange) const;

    std::shared_ptr<const ExtractionDispatcher> m_dispatcher;
    std::shared_ptr<const GuardrailPipeline> m_pipeline;
    std::shared_ptr<domain::ModelRelay> m_relay;
    Options m_options;
    std::shared_ptr<domain::AuditSink> m_audit;
};

} // namespace promptwarden::application
