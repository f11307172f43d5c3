#include "application/scanners/ClassifierScanner.hpp"
#include "domain/GatewayError.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace promptwarden::application::scanners {

using domain::ErrorKind;
using domain::GatewayError;

namespace {

std::string FormatScore(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

ClassifierScanner::ClassifierScanner(std::shared_ptr<const domain::ClassifierBackend> backend,
                                     domain::ClassifierTask task,
                                     std::vector<std::string> labels)
    : m_backend(std::move(backend))
    , m_task(task)
    , m_labels(std::move(labels))
{
    if (!m_backend) {
        throw std::invalid_argument("classifier scanner requires a backend");
    }
    if (m_task == domain::ClassifierTask::BannedTopics && m_labels.empty()) {
        throw std::invalid_argument("banned-topics classifier requires at least one topic");
    }
}

domain::ScanOutcome ClassifierScanner::evaluate(const std::string& text, const domain::ScannerSpec& spec) const {
    domain::ClassificationRequest request;
    request.task = m_task;
    request.text = text;
    request.labels = m_labels;

    double score = m_backend->score(request);
    if (!std::isfinite(score)) {
        throw GatewayError(ErrorKind::ScannerUnavailable, spec.name, "classifier returned a non-numeric score");
    }
    if (score < 0.0 || score > 1.0) {
        throw GatewayError(ErrorKind::ScannerUnavailable, spec.name,
                           "classifier returned score " + FormatScore(score) + " outside [0,1]");
    }

    domain::ScanOutcome outcome;
    outcome.scannerName = spec.name;
    outcome.action = spec.action;
    outcome.text = text;
    outcome.score = score;
    outcome.triggered = score >= spec.threshold;
    if (outcome.triggered) {
        outcome.reason = domain::ClassifierTaskToString(m_task) + " score " + FormatScore(score) +
                         " >= threshold " + FormatScore(spec.threshold);
    }
    return outcome;
}

} // namespace promptwarden::application::scanners
