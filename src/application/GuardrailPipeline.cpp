#include "application/GuardrailPipeline.hpp"
#include "domain/GatewayError.hpp"

#include <iostream>
#include <stdexcept>

namespace promptwarden::application {

using domain::Direction;
using domain::PipelineReport;
using domain::ScanAction;
using domain::ScanOutcome;

namespace {

ScanOutcome UnavailableOutcome(const ScannerRegistry::Entry& entry, const std::string& text, const std::string& error) {
    ScanOutcome outcome;
    outcome.scannerName = entry.spec.name;
    outcome.text = text;
    outcome.unavailable = true;
    outcome.reason = "scanner unavailable: " + error;
    if (entry.spec.failOpen) {
        outcome.triggered = false;
        outcome.action = entry.spec.action;
    } else {
        outcome.triggered = true;
        outcome.action = ScanAction::Block;
    }
    return outcome;
}

} // namespace

GuardrailPipeline::GuardrailPipeline(std::shared_ptr<const ScannerRegistry> registry)
    : m_registry(std::move(registry))
{
    if (!m_registry) {
        throw std::invalid_argument("guardrail pipeline requires a scanner registry");
    }
}

PipelineReport GuardrailPipeline::run(Direction direction, const std::string& text) const {
    PipelineReport report;
    report.direction = direction;
    report.originalText = text;

    std::string carried = text;
    for (const auto& entry : m_registry->scanners(direction)) {
        ScanOutcome outcome;
        try {
            outcome = entry.scanner->evaluate(carried, entry.spec);
            outcome.scannerName = entry.spec.name;
            outcome.action = entry.spec.action;
        } catch (const domain::GatewayError& e) {
            std::cerr << "[GuardrailPipeline] Scanner '" << entry.spec.name << "' unavailable: " << e.what() << std::endl;
            outcome = UnavailableOutcome(entry, carried, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[GuardrailPipeline] Scanner '" << entry.spec.name << "' failed: " << e.what() << std::endl;
            outcome = UnavailableOutcome(entry, carried, e.what());
        }

        const bool blocked = outcome.triggered && outcome.action == ScanAction::Block;
        if (blocked) {
            // A blocking scanner never rewrites the payload.
            outcome.text = carried;
        } else if (outcome.triggered) {
            carried = outcome.text;
        } else {
            outcome.text = carried;
        }
        report.outcomes.push_back(std::move(outcome));

        if (blocked) break;
    }

    report.finalize();
    return report;
}

} // namespace promptwarden::application
