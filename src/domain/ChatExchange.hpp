/**
 * @file ChatExchange.hpp
 * @brief Per-request record correlating one user turn with its guardrail reports.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "domain/GatewayError.hpp"
#include "domain/PipelineReport.hpp"

namespace promptwarden::domain {

/**
 * @enum ExchangeState
 * @brief Lifecycle of one exchange. Failed/blocked states and Done are terminal.
 */
enum class ExchangeState {
    Received,
    Extracting,
    ExtractionFailed,
    Extracted,
    ScanningInput,
    InputBlocked,
    InputCleared,
    RelayingModel,
    ModelFailed,
    ModelResponded,
    ScanningOutput,
    OutputBlocked,
    OutputCleared,
    Done
};

inline std::string ExchangeStateToString(ExchangeState s) {
    switch (s) {
        case ExchangeState::Received: return "RECEIVED";
        case ExchangeState::Extracting: return "EXTRACTING";
        case ExchangeState::ExtractionFailed: return "EXTRACTION_FAILED";
        case ExchangeState::Extracted: return "EXTRACTED";
        case ExchangeState::ScanningInput: return "SCANNING_INPUT";
        case ExchangeState::InputBlocked: return "INPUT_BLOCKED";
        case ExchangeState::InputCleared: return "INPUT_CLEARED";
        case ExchangeState::RelayingModel: return "RELAYING_MODEL";
        case ExchangeState::ModelFailed: return "MODEL_FAILED";
        case ExchangeState::ModelResponded: return "MODEL_RESPONDED";
        case ExchangeState::ScanningOutput: return "SCANNING_OUTPUT";
        case ExchangeState::OutputBlocked: return "OUTPUT_BLOCKED";
        case ExchangeState::OutputCleared: return "OUTPUT_CLEARED";
        case ExchangeState::Done: return "DONE";
    }
    return "RECEIVED";
}

inline bool IsTerminal(ExchangeState s) {
    return s == ExchangeState::ExtractionFailed || s == ExchangeState::InputBlocked ||
           s == ExchangeState::ModelFailed || s == ExchangeState::OutputBlocked ||
           s == ExchangeState::Done;
}

/**
 * @struct ExchangeFailure
 * @brief Structured fault attached to an exchange that could not complete.
 */
struct ExchangeFailure {
    ErrorKind kind = ErrorKind::ExtractionFailure;
    std::string stage;
    std::string message;
};

/**
 * @struct ExtractionOutcome
 * @brief Summary of the attachment step, kept for observability (no content).
 */
struct ExtractionOutcome {
    std::string filename;
    std::string mediaType;
    std::string method;
    size_t characters = 0;
    bool success = false;
    std::vector<std::string> warnings;
};

/**
 * @struct ChatExchange
 * @brief Everything that happened to one user turn.
 *
 * Invariant: modelResponse is set only if the input verdict is not BLOCK.
 */
struct ChatExchange {
    std::string modelName;
    std::string rawInput;                          ///< Prompt plus any extracted attachment text.
    std::string finalInput;                        ///< Text that was (or would have been) relayed.
    std::optional<ExtractionOutcome> extraction;
    std::optional<PipelineReport> inputReport;
    std::optional<std::string> modelResponse;
    std::optional<PipelineReport> outputReport;
    std::string finalText;                         ///< Text returned to the caller.
    ExchangeState state = ExchangeState::Received;
    std::vector<ExchangeState> trail;              ///< Every state entered, in order.
    std::optional<ExchangeFailure> failure;
    std::chrono::system_clock::time_point timestamp;

    void enter(ExchangeState next) {
        state = next;
        trail.push_back(next);
    }

    /** @brief Verdict of the furthest pipeline that ran. */
    Verdict finalVerdict() const {
        if (inputReport && inputReport->verdict == Verdict::Block) return Verdict::Block;
        if (outputReport && outputReport->verdict == Verdict::Block) return Verdict::Block;
        if ((inputReport && inputReport->verdict == Verdict::Redact) ||
            (outputReport && outputReport->verdict == Verdict::Redact)) {
            return Verdict::Redact;
        }
        return Verdict::Allow;
    }
};

} // namespace promptwarden::domain
