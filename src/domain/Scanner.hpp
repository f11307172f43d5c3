/**
 * @file Scanner.hpp
 * @brief Contract implemented by every guardrail check.
 */

#pragma once
#include <string>
#include "domain/ScannerSpec.hpp"

namespace promptwarden::domain {

/**
 * @class Scanner
 * @brief Evaluates a text against one safety policy.
 *
 * Implementations must be safe for concurrent calls: they are created once at
 * startup and shared by every exchange. A scanner that cannot execute throws
 * GatewayError(ErrorKind::ScannerUnavailable); the pipeline decides what to do.
 */
class Scanner {
public:
    virtual ~Scanner() = default;

    /**
     * @brief Scans @p text using the thresholds and action in @p spec.
     * @return Outcome whose text is either @p text or a transformed copy.
     */
    virtual ScanOutcome evaluate(const std::string& text, const ScannerSpec& spec) const = 0;
};

} // namespace promptwarden::domain
