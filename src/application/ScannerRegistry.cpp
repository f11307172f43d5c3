/**
 * @file ScannerRegistry.cpp
 * @brief Implementation of ScannerRegistry and the built-in scanner factories.
 */

#include "application/ScannerRegistry.hpp"
#include "application/scanners/ClassifierScanner.hpp"
#include "application/scanners/PiiScanner.hpp"
#include "application/scanners/RuleScanners.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace promptwarden::application {

using domain::ClassifierTask;
using domain::Direction;
using domain::ScanAction;
using domain::ScannerKind;
using domain::ScannerSpec;

namespace {

// Stays below the pattern scanners' own input ceiling.
constexpr size_t kDefaultMaxBytes = 16384;

template <typename T>
T Param(const ScannerConfig& config, const char* key, const T& fallback) {
    if (!config.params.is_object() || !config.params.contains(key)) {
        return fallback;
    }
    try {
        return config.params.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("scanner '" + config.spec.name + "': parameter '" + key + "' " + e.what());
    }
}

ScannerConfig MakeConfig(const std::string& type, const std::string& name, ScanAction action,
                         int rank, double threshold = 0.5, nlohmann::json params = nlohmann::json::object()) {
    ScannerConfig config;
    config.type = type;
    config.spec.name = name;
    config.spec.action = action;
    config.spec.rank = rank;
    config.spec.threshold = threshold;
    config.params = std::move(params);
    return config;
}

} // namespace

ScannerRegistry::ScannerRegistry(std::shared_ptr<const domain::ClassifierBackend> classifier)
    : m_classifier(std::move(classifier))
{
    registerBuiltins();
}

void ScannerRegistry::registerBuiltins() {
    using namespace scanners;

    registerType("regex", ScannerKind::Pattern, [](const ScannerConfig& c) {
        return std::make_shared<RegexScanner>(Param(c, "patterns", DangerousCodePatterns()));
    });
    registerType("invisible_text", ScannerKind::Pattern, [](const ScannerConfig&) {
        return std::make_shared<InvisibleTextScanner>();
    });
    registerType("token_limit", ScannerKind::Limiter, [](const ScannerConfig& c) {
        const int limit = Param(c, "limit", 2000);
        if (limit <= 0) {
            throw std::invalid_argument("scanner '" + c.spec.name + "': limit must be positive");
        }
        return std::make_shared<TokenLimitScanner>(static_cast<size_t>(limit));
    });
    registerType("max_bytes", ScannerKind::Limiter, [](const ScannerConfig& c) {
        const int limit = Param(c, "max_bytes", static_cast<int>(kDefaultMaxBytes));
        if (limit <= 0) {
            throw std::invalid_argument("scanner '" + c.spec.name + "': max_bytes must be positive");
        }
        return std::make_shared<ByteLimitScanner>(static_cast<size_t>(limit));
    });
    registerType("language", ScannerKind::Pattern, [](const ScannerConfig& c) {
        return std::make_shared<LanguageScanner>(Param(c, "valid_languages", std::vector<std::string>{"en"}));
    });
    registerType("pii", ScannerKind::Pattern, [](const ScannerConfig& c) {
        return std::make_shared<PiiScanner>(Param(c, "entity_types", PiiScanner::SupportedEntityTypes()));
    });

    auto backend = m_classifier;
    auto classifier = [backend](ClassifierTask task, bool topics) {
        return [backend, task, topics](const ScannerConfig& c) -> std::shared_ptr<const domain::Scanner> {
            if (!backend) {
                throw std::invalid_argument("scanner '" + c.spec.name + "' requires a classifier backend");
            }
            std::vector<std::string> labels;
            if (topics) {
                labels = Param(c, "topics", DefaultBannedTopics());
            }
            return std::make_shared<ClassifierScanner>(backend, task, labels);
        };
    };
    registerType("prompt_injection", ScannerKind::Classifier, classifier(ClassifierTask::PromptInjection, false));
    registerType("ban_topics", ScannerKind::Classifier, classifier(ClassifierTask::BannedTopics, true));
    registerType("sentiment", ScannerKind::Classifier, classifier(ClassifierTask::Sentiment, false));
    registerType("toxicity", ScannerKind::Classifier, classifier(ClassifierTask::Toxicity, false));
}

void ScannerRegistry::registerType(const std::string& type, ScannerKind kind, Factory factory) {
    m_types[type] = TypeInfo{kind, std::move(factory)};
}

bool ScannerRegistry::knowsType(const std::string& type) const {
    return m_types.count(type) > 0;
}

void ScannerRegistry::validate(Direction direction, const ScannerSpec& spec) const {
    if (spec.name.empty()) {
        throw std::invalid_argument("scanner name must not be empty");
    }
    if (!(spec.threshold >= 0.0 && spec.threshold <= 1.0)) {
        throw std::invalid_argument("scanner '" + spec.name + "': threshold must be within [0,1]");
    }
    for (const auto& entry : scanners(direction)) {
        if (entry.spec.name == spec.name) {
            throw std::invalid_argument("duplicate " + domain::DirectionToString(direction) +
                                        " scanner name: " + spec.name);
        }
    }
}

void ScannerRegistry::insert(Direction direction, Entry entry) {
    auto& list = direction == Direction::Input ? m_input : m_output;
    auto pos = std::upper_bound(list.begin(), list.end(), entry.spec.rank,
                                [](int rank, const Entry& e) { return rank < e.spec.rank; });
    list.insert(pos, std::move(entry));
}

void ScannerRegistry::add(Direction direction, const ScannerConfig& config) {
    auto it = m_types.find(config.type);
    if (it == m_types.end()) {
        throw std::invalid_argument("unknown scanner type '" + config.type + "' for scanner '" + config.spec.name + "'");
    }

    Entry entry;
    entry.type = config.type;
    entry.spec = config.spec;
    entry.spec.kind = it->second.kind;
    validate(direction, entry.spec);

    entry.scanner = it->second.factory(config);
    insert(direction, std::move(entry));
}

void ScannerRegistry::add(Direction direction, const ScannerSpec& spec,
                          std::shared_ptr<const domain::Scanner> scanner, const std::string& type) {
    if (!scanner) {
        throw std::invalid_argument("scanner '" + spec.name + "' has no implementation");
    }
    validate(direction, spec);
    insert(direction, Entry{type, spec, std::move(scanner)});
}

const std::vector<ScannerRegistry::Entry>& ScannerRegistry::scanners(Direction direction) const {
    return direction == Direction::Input ? m_input : m_output;
}

ScannerRegistry ScannerRegistry::WithDefaults(std::shared_ptr<const domain::ClassifierBackend> classifier) {
    ScannerRegistry registry(std::move(classifier));
    for (const auto& config : DefaultInputScanners()) {
        registry.add(Direction::Input, config);
    }
    for (const auto& config : DefaultOutputScanners()) {
        registry.add(Direction::Output, config);
    }
    return registry;
}

std::vector<ScannerConfig> ScannerRegistry::DefaultInputScanners() {
    return {
        MakeConfig("max_bytes", "size_limit", ScanAction::Block, 0, 0.5, {{"max_bytes", kDefaultMaxBytes}}),
        MakeConfig("invisible_text", "invisible_text", ScanAction::Block, 10),
        MakeConfig("token_limit", "token_limit", ScanAction::Block, 20, 0.5, {{"limit", 2000}}),
        MakeConfig("regex", "dangerous_code", ScanAction::Block, 30, 0.5, {{"patterns", DangerousCodePatterns()}}),
        MakeConfig("regex", "injection_phrases", ScanAction::Block, 35, 0.5, {{"patterns", InjectionPhrasePatterns()}}),
        MakeConfig("language", "language", ScanAction::Block, 40, 0.5, {{"valid_languages", nlohmann::json::array({"en"})}}),
        MakeConfig("pii", "pii_input", ScanAction::Redact, 50),
        MakeConfig("prompt_injection", "prompt_injection", ScanAction::Block, 60, 0.75),
        MakeConfig("ban_topics", "ban_topics", ScanAction::Block, 70, 0.75, {{"topics", DefaultBannedTopics()}}),
        MakeConfig("sentiment", "sentiment", ScanAction::Block, 80, 0.75),
    };
}

std::vector<ScannerConfig> ScannerRegistry::DefaultOutputScanners() {
    return {
        MakeConfig("max_bytes", "size_limit", ScanAction::Redact, 0, 0.5, {{"max_bytes", kDefaultMaxBytes}}),
        MakeConfig("pii", "pii_output", ScanAction::Redact, 10),
        MakeConfig("toxicity", "toxicity", ScanAction::Block, 20, 0.65),
        MakeConfig("ban_topics", "ban_topics_output", ScanAction::Block, 30, 0.6, {{"topics", DefaultBannedTopics()}}),
    };
}

const std::vector<std::string>& ScannerRegistry::DangerousCodePatterns() {
    // Repetitions are bounded so a match attempt never recurses through the whole text.
    static const std::vector<std::string> kPatterns = {
        // SQL injection
        R"re(;\s{0,8}(DROP\s{1,8}TABLE|DELETE\s{1,8}FROM\s{1,8}\w{1,64}\s{0,8};|TRUNCATE\s{1,8}TABLE))re",
        R"re((UNION\s{1,8}ALL\s{1,8}SELECT|'\s{0,8}OR\s{1,8}'1'\s{0,8}=\s{0,8}'1))re",
        // XSS
        R"re(<script[^>]{0,256}>[\s\S]{0,512}?(alert|document\.|eval))re",
        R"re(javascript:\s{0,8}(alert|document\.|eval))re",
        // Destructive shell commands
        R"re(rm\s{1,8}-rf\s{1,8}[/~])re",
        R"re(sudo\s{1,8}(rm|chmod\s{1,8}777|dd\s{1,8}if))re",
        R"re(format\s{1,8}c:\s{0,8}/)re",
        R"re(del\s{1,8}/[sf]\s{1,8}[a-z]:\\)re",
        // Dangerous calls in code
        R"re(os\.system\s{0,8}\(\s{0,8}['"].{0,256}?(rm|del|format|shutdown|wget.{0,256}\|))re",
        R"re(subprocess\.(call|run|Popen)\s{0,8}\(\s{0,8}\[?\s{0,8}['"].{0,256}?(rm|del|curl.{0,256}\||wget.{0,256}\|))re",
        R"re(eval\s{0,8}\(\s{0,8}['"].{0,256}?(import|__))re",
        R"re(exec\s{0,8}\(\s{0,8}['"].{0,256}?(import\s{1,8}os|subprocess|socket))re",
    };
    return kPatterns;
}

const std::vector<std::string>& ScannerRegistry::InjectionPhrasePatterns() {
    static const std::vector<std::string> kPatterns = {
        R"re(ignore\s{1,8}(all\s{1,8})?(previous|prior|above)\s{1,8}(instructions?|prompts?|rules?))re",
        R"re(disregard\s{1,8}(all\s{1,8})?(previous|prior|above|your)\s{1,8}(instructions?|prompts?|programming))re",
    };
    return kPatterns;
}

const std::vector<std::string>& ScannerRegistry::DefaultBannedTopics() {
    static const std::vector<std::string> kTopics = {
        "violence", "weapons", "drugs", "hacking", "terrorism",
        "illegal activities", "self-harm", "hate speech", "discrimination"
    };
    return kTopics;
}

} // namespace promptwarden::application
