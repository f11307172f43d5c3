/**
 * @file ClassifierScanner.hpp
 * @brief Threshold check over a score produced by a ClassifierBackend.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/ClassifierBackend.hpp"
#include "domain/Scanner.hpp"

namespace promptwarden::application::scanners {

/**
 * @class ClassifierScanner
 * @brief Triggers when the backend score reaches the configured threshold.
 *
 * Classifiers never rewrite text: a REDACT action only flags the exchange.
 * A score that is NaN or outside [0,1] raises GatewayError(ScannerUnavailable).
 */
class ClassifierScanner : public domain::Scanner {
public:
    ClassifierScanner(std::shared_ptr<const domain::ClassifierBackend> backend,
                      domain::ClassifierTask task,
                      std::vector<std::string> labels = {});

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

    domain::ClassifierTask task() const { return m_task; }
    const std::vector<std::string>& labels() const { return m_labels; }

private:
    std::shared_ptr<const domain::ClassifierBackend> m_backend;
    domain::ClassifierTask m_task;
    std::vector<std::string> m_labels;
};

} // namespace promptwarden::application::scanners
