/**
 * @file GatewayOrchestrator.cpp
 * @brief Implementation of GatewayOrchestrator.
 */

#include "application/GatewayOrchestrator.hpp"
#include "domain/TextUtils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace promptwarden::application {

using domain::ChatExchange;
using domain::Direction;
using domain::ErrorKind;
using domain::ExchangeState;
using domain::GatewayError;
using domain::Verdict;
using domain::TextUtils;

namespace {

// Client text may carry malformed UTF-8; everything past intake (model wire
// format, scanners, JSON rendering) expects it to be valid.
ExchangeRequest SanitizeRequest(const ExchangeRequest& raw) {
    ExchangeRequest request;
    request.prompt = TextUtils::SanitizeUtf8(raw.prompt);
    request.modelName = TextUtils::SanitizeUtf8(raw.modelName);
    if (raw.artifact) {
        request.artifact = domain::Artifact(raw.artifact->bytes,
                                            TextUtils::SanitizeUtf8(raw.artifact->mediaType),
                                            TextUtils::SanitizeUtf8(raw.artifact->name));
    }
    return request;
}

} // namespace

GatewayOrchestrator::GatewayOrchestrator(std::shared_ptr<const ExtractionDispatcher> dispatcher,
                                         std::shared_ptr<const GuardrailPipeline> pipeline,
                                         std::shared_ptr<domain::ModelRelay> relay,
                                         Options options,
                                         std::shared_ptr<domain::AuditSink> audit)
    : m_dispatcher(std::move(dispatcher))
    , m_pipeline(std::move(pipeline))
    , m_relay(std::move(relay))
    , m_options(std::move(options))
    , m_audit(std::move(audit))
{
    if (!m_dispatcher || !m_pipeline || !m_relay) {
        throw std::invalid_argument("orchestrator requires a dispatcher, a pipeline and a relay");
    }
}

std::string GatewayOrchestrator::ComposeInput(const std::string& prompt,
                                              const std::optional<domain::ExtractedText>& attachment) {
    std::string combined = TextUtils::Trim(prompt).empty() ? std::string() : prompt;
    if (attachment) {
        if (!combined.empty()) combined += "\n\n";
        combined += "File: " + attachment->sourceName + "\nContent:\n" + attachment->text;
    }
    return combined;
}

std::string GatewayOrchestrator::BlockNotice(const domain::PipelineReport& report) {
    const domain::ScanOutcome* blocker = report.blockingOutcome();
    std::ostringstream oss;
    if (report.direction == Direction::Input) {
        oss << "Your message was blocked by the input guardrail";
    } else {
        oss << "The model response was withheld by the output guardrail";
    }
    if (!blocker) {
        oss << ".";
        return oss.str();
    }
    oss << " '" << blocker->scannerName << "'";
    if (blocker->score) {
        oss << " (score " << std::fixed << std::setprecision(2) << *blocker->score << ")";
    }
    if (!blocker->reason.empty()) {
        oss << ": " << blocker->reason;
    }
    oss << ".";
    return oss.str();
}

void GatewayOrchestrator::fail(ChatExchange& exchange, ExchangeState terminal, ErrorKind kind,
                               const std::string& stage, const std::string& message) const {
    exchange.failure = domain::ExchangeFailure{kind, stage, message};
    if (terminal != exchange.state) {
        exchange.enter(terminal);
    }
    std::cerr << "[GatewayOrchestrator] " << domain::ErrorKindToString(kind) << " at " << stage
              << ": " << message << std::endl;
    finish(exchange);
}

void GatewayOrchestrator::finish(ChatExchange& exchange) const {
    std::cout << "[GatewayOrchestrator] Exchange finished: state=" << domain::ExchangeStateToString(exchange.state)
              << ", verdict=" << domain::VerdictToString(exchange.finalVerdict())
              << ", model=" << exchange.modelName << std::endl;

    if (!m_audit) return;
    try {
        m_audit->record(exchange);
    } catch (const std::exception& e) {
        std::cerr << "[GatewayOrchestrator] Audit sink rejected exchange: " << e.what() << std::endl;
    }
}

ChatExchange GatewayOrchestrator::submitExchange(const ExchangeRequest& rawRequest) const {
    const ExchangeRequest request = SanitizeRequest(rawRequest);
    ChatExchange exchange;
    exchange.timestamp = std::chrono::system_clock::now();
    exchange.modelName = TextUtils::Trim(request.modelName).empty() ? m_options.defaultModel : request.modelName;
    exchange.enter(ExchangeState::Received);

    if (TextUtils::Trim(request.prompt).empty() && !request.artifact) {
        fail(exchange, ExchangeState::Received, ErrorKind::EmptyInput, "request",
             "A prompt or an attachment is required.");
        return exchange;
    }

    // --- Extraction ---
    std::optional<domain::ExtractedText> attachment;
    if (request.artifact) {
        const auto& artifact = *request.artifact;
        exchange.enter(ExchangeState::Extracting);

        domain::ExtractionOutcome outcome;
        outcome.filename = artifact.name;
        outcome.mediaType = TextUtils::NormalizeMediaType(artifact.mediaType);
        try {
            attachment = m_dispatcher->extract(artifact);
        } catch (const GatewayError& e) {
            outcome.method = e.stage();
            exchange.extraction = outcome;
            fail(exchange, ExchangeState::ExtractionFailed, e.kind(), e.stage(), e.what());
            return exchange;
        } catch (const std::exception& e) {
            exchange.extraction = outcome;
            fail(exchange, ExchangeState::ExtractionFailed, ErrorKind::ExtractionFailure, "extraction", e.what());
            return exchange;
        }

        outcome.method = attachment->method;
        outcome.characters = attachment->text.size();
        outcome.warnings = attachment->warnings;
        outcome.success = true;
        exchange.extraction = outcome;
        exchange.enter(ExchangeState::Extracted);
    }

    // --- Input guardrails ---
    exchange.rawInput = ComposeInput(request.prompt, attachment);
    exchange.enter(ExchangeState::ScanningInput);
    exchange.inputReport = m_pipeline->run(Direction::Input, exchange.rawInput);
    exchange.finalInput = exchange.inputReport->finalText;

    if (exchange.inputReport->verdict == Verdict::Block) {
        exchange.enter(ExchangeState::InputBlocked);
        exchange.finalText = BlockNotice(*exchange.inputReport);
        finish(exchange);
        return exchange;
    }
    exchange.enter(ExchangeState::InputCleared);

    // --- Model relay ---
    exchange.enter(ExchangeState::RelayingModel);
    try {
        exchange.modelResponse = m_relay->generate(exchange.finalInput, exchange.modelName, m_options.relayTimeout);
    } catch (const GatewayError& e) {
        fail(exchange, ExchangeState::ModelFailed, e.kind(), e.stage(), e.what());
        return exchange;
    } catch (const std::exception& e) {
        fail(exchange, ExchangeState::ModelFailed, ErrorKind::ModelUnavailable, "relay", e.what());
        return exchange;
    }
    exchange.enter(ExchangeState::ModelResponded);

    // --- Output guardrails ---
    exchange.enter(ExchangeState::ScanningOutput);
    exchange.outputReport = m_pipeline->run(Direction::Output, *exchange.modelResponse);

    if (exchange.outputReport->verdict == Verdict::Block) {
        exchange.enter(ExchangeState::OutputBlocked);
        exchange.finalText = BlockNotice(*exchange.outputReport);
        finish(exchange);
        return exchange;
    }
    exchange.enter(ExchangeState::OutputCleared);
    exchange.finalText = exchange.outputReport->finalText;
    exchange.enter(ExchangeState::Done);
    finish(exchange);
    return exchange;
}

std::vector<std::string> GatewayOrchestrator::listModels() const {
    try {
        auto models = m_relay->listModels();
        if (!models.empty()) return models;
        std::cerr << "[GatewayOrchestrator] Backend reported no models, using default." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[GatewayOrchestrator] Could not list models (" << e.what() << "), using default." << std::endl;
    }
    return {m_options.defaultModel};
}

} // namespace promptwarden::application
