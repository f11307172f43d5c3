/**
 * @file GuardrailPipeline.hpp
 * @brief Ordered fold of a direction's scanners over one text.
 */

#pragma once

#include <memory>
#include <string>

#include "application/ScannerRegistry.hpp"
#include "domain/PipelineReport.hpp"

namespace promptwarden::application {

/**
 * @class GuardrailPipeline
 * @brief Runs scanners by rank, compounding redactions and stopping at the first BLOCK.
 *
 * A scanner that throws is recorded as unavailable. Unless its spec opts into
 * fail-open, that outcome blocks the exchange.
 */
class GuardrailPipeline {
public:
    explicit GuardrailPipeline(std::shared_ptr<const ScannerRegistry> registry);

    domain::PipelineReport run(domain::Direction direction, const std::string& text) const;

    const ScannerRegistry& registry() const { return *m_registry; }

private:
    std::shared_ptr<const ScannerRegistry> m_registry;
};

} // namespace promptwarden::application
