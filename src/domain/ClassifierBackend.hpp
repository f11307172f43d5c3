/**
 * @file ClassifierBackend.hpp
 * @brief Interface for the statistical models behind classifier scanners.
 */

#pragma once
#include <string>
#include <vector>

namespace promptwarden::domain {

/** @brief Scoring tasks a classifier backend understands. */
enum class ClassifierTask {
    PromptInjection,
    BannedTopics,
    Sentiment,
    Toxicity
};

inline std::string ClassifierTaskToString(ClassifierTask task) {
    switch (task) {
        case ClassifierTask::PromptInjection: return "prompt_injection";
        case ClassifierTask::BannedTopics: return "ban_topics";
        case ClassifierTask::Sentiment: return "sentiment";
        case ClassifierTask::Toxicity: return "toxicity";
    }
    return "unknown";
}

/**
 * @struct ClassificationRequest
 * @brief One scoring call. Labels are used by zero-shot tasks (banned topics).
 */
struct ClassificationRequest {
    ClassifierTask task = ClassifierTask::PromptInjection;
    std::string text;
    std::vector<std::string> labels;
};

/**
 * @class ClassifierBackend
 * @brief Stateless scoring function backed by a model loaded once at startup.
 */
class ClassifierBackend {
public:
    virtual ~ClassifierBackend() = default;

    /** @brief Optional warm-up (connection check, model presence). */
    virtual void initialize() {}

    /**
     * @brief Scores the request.
     * @return Likelihood in [0,1] that the text exhibits the task's property.
     * @throws GatewayError(ScannerUnavailable) if the model cannot be reached.
     */
    virtual double score(const ClassificationRequest& request) const = 0;
};

} // namespace promptwarden::domain
