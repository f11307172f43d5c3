/**
 * @file PipelineReport.hpp
 * @brief Ordered record of one guardrail pass and its verdict.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ScannerSpec.hpp"

namespace promptwarden::domain {

/** @brief Overall result of a pipeline run. */
enum class Verdict { Allow, Redact, Block };

inline std::string VerdictToString(Verdict v) {
    switch (v) {
        case Verdict::Allow: return "ALLOW";
        case Verdict::Redact: return "REDACT";
        case Verdict::Block: return "BLOCK";
    }
    return "ALLOW";
}

/**
 * @struct PipelineReport
 * @brief Outcomes in execution order for one direction.
 */
struct PipelineReport {
    Direction direction = Direction::Input;
    std::vector<ScanOutcome> outcomes;
    Verdict verdict = Verdict::Allow;
    std::string originalText;
    std::string finalText;

    /** @brief The outcome that caused a BLOCK verdict, if any. */
    const ScanOutcome* blockingOutcome() const {
        for (const auto& outcome : outcomes) {
            if (outcome.triggered && outcome.action == ScanAction::Block) {
                return &outcome;
            }
        }
        return nullptr;
    }

    /** @brief Recomputes verdict and final text from the recorded outcomes. */
    void finalize() {
        verdict = Verdict::Allow;
        for (const auto& outcome : outcomes) {
            if (!outcome.triggered) continue;
            if (outcome.action == ScanAction::Block) {
                verdict = Verdict::Block;
                break;
            }
            verdict = Verdict::Redact;
        }
        finalText = outcomes.empty() ? originalText : outcomes.back().text;
    }
};

} // namespace promptwarden::domain
