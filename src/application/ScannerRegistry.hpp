/**
 * @file ScannerRegistry.hpp
 * @brief Resolves configured scanner entries into ordered, shared scanner instances.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ClassifierBackend.hpp"
#include "domain/Scanner.hpp"
#include "domain/ScannerSpec.hpp"

namespace promptwarden::application {

/**
 * @struct ScannerConfig
 * @brief One "scanners.input[]" / "scanners.output[]" entry from settings.json.
 */
struct ScannerConfig {
    std::string type;            ///< Factory key, e.g. "regex", "pii", "prompt_injection".
    domain::ScannerSpec spec;
    nlohmann::json params = nlohmann::json::object();
};

/**
 * @class ScannerRegistry
 * @brief Ordered scanner list per direction, built once at startup.
 *
 * Entries are kept sorted by ascending rank; equal ranks keep insertion order.
 * Read-only after startup, so concurrent pipelines may share one instance.
 */
class ScannerRegistry {
public:
    using Factory = std::function<std::shared_ptr<const domain::Scanner>(const ScannerConfig&)>;

    struct Entry {
        std::string type;
        domain::ScannerSpec spec;
        std::shared_ptr<const domain::Scanner> scanner;
    };

    /**
     * @param classifier Backend for classifier types. May be null if no
     *        classifier scanner is configured.
     */
    explicit ScannerRegistry(std::shared_ptr<const domain::ClassifierBackend> classifier = nullptr);

    /** @brief Adds or replaces a factory for @p type. */
    void registerType(const std::string& type, domain::ScannerKind kind, Factory factory);

    bool knowsType(const std::string& type) const;

    /**
     * @brief Validates @p config, builds its scanner and inserts it by rank.
     * @throws std::invalid_argument on unknown type, duplicate name,
     *         threshold outside [0,1] or invalid parameters.
     */
    void add(domain::Direction direction, const ScannerConfig& config);

    /** @brief Inserts an already-built scanner (same validation as add()). */
    void add(domain::Direction direction, const domain::ScannerSpec& spec,
             std::shared_ptr<const domain::Scanner> scanner, const std::string& type = "custom");

    const std::vector<Entry>& scanners(domain::Direction direction) const;

    /** @brief Builds a registry holding the built-in default guard set. */
    static ScannerRegistry WithDefaults(std::shared_ptr<const domain::ClassifierBackend> classifier);

    static std::vector<ScannerConfig> DefaultInputScanners();
    static std::vector<ScannerConfig> DefaultOutputScanners();

    static const std::vector<std::string>& DangerousCodePatterns();
    static const std::vector<std::string>& InjectionPhrasePatterns();
    static const std::vector<std::string>& DefaultBannedTopics();

private:
    struct TypeInfo {
        domain::ScannerKind kind;
        Factory factory;
    };

    void registerBuiltins();
    void validate(domain::Direction direction, const domain::ScannerSpec& spec) const;
    void insert(domain::Direction direction, Entry entry);

    std::shared_ptr<const domain::ClassifierBackend> m_classifier;
    std::map<std::string, TypeInfo> m_types;
    std::vector<Entry> m_input;
    std::vector<Entry> m_output;
};

} // namespace promptwarden::application
