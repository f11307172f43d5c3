/**
 * @file ScannerSpec.hpp
 * @brief Declarative scanner configuration and the outcome of one evaluation.
 */

#pragma once
#include <optional>
#include <string>

namespace promptwarden::domain {

/** @brief Which side of the model a scanner guards. */
enum class Direction { Input, Output };

/** @brief Cost class of a scanner. */
enum class ScannerKind { Classifier, Pattern, Limiter };

/** @brief What a triggered scanner does to the exchange. */
enum class ScanAction { Block, Redact };

inline std::string DirectionToString(Direction d) {
    return d == Direction::Input ? "input" : "output";
}

inline std::string ScannerKindToString(ScannerKind k) {
    switch (k) {
        case ScannerKind::Classifier: return "classifier";
        case ScannerKind::Pattern: return "pattern";
        case ScannerKind::Limiter: return "limiter";
    }
    return "pattern";
}

inline std::string ScanActionToString(ScanAction a) {
    return a == ScanAction::Block ? "BLOCK" : "REDACT";
}

/**
 * @struct ScannerSpec
 * @brief Static description of a configured scanner.
 */
struct ScannerSpec {
    std::string name;                       ///< Unique within a direction.
    ScannerKind kind = ScannerKind::Pattern;
    ScanAction action = ScanAction::Block;
    double threshold = 0.5;                 ///< [0,1], classifiers only.
    int rank = 0;                           ///< Lower runs first.
    bool failOpen = false;                  ///< Opt-in: skip instead of block when unavailable.
};

/**
 * @struct ScanOutcome
 * @brief Result of running one scanner over one text.
 */
struct ScanOutcome {
    std::string scannerName;
    bool triggered = false;
    std::optional<double> score;
    std::string text;                       ///< Unchanged input or a redacted copy.
    ScanAction action = ScanAction::Block;
    std::string reason;
    bool unavailable = false;               ///< Scanner could not execute.
};

} // namespace promptwarden::domain
