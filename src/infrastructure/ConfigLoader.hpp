/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading gateway configuration (settings.json).
 *
 * Keeps JSON parsing in one place: the rest of the codebase only sees the
 * typed GatewayConfig.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/ScannerRegistry.hpp"

namespace promptwarden::infrastructure {

struct ServerSettings {
    std::string host = "0.0.0.0";
    int port = 5000;
    size_t maxUploadBytes = 25 * 1024 * 1024;
    std::vector<std::string> allowedOrigins = {
        "http://localhost:3000", "http://localhost:5173", "*.vercel.app"
    };
};

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string defaultModel = "llama3";
    int timeoutMs = 120000;
};

struct ClassifierSettings {
    bool enabled = true;
    std::string model = "llama3";
    int timeoutMs = 30000;
};

struct ExtractionSettings {
    std::filesystem::path tempDir;          ///< Empty selects ScopedTempFile::DefaultDirectory().
    std::filesystem::path whisperModel;     ///< Empty selects <models dir>/ggml-base.bin.
    std::string whisperLanguage = "en";
    std::string ocrLanguage = "eng";
};

struct AuditSettings {
    bool enabled = false;
    std::filesystem::path path;             ///< Empty selects PathUtils::GetDefaultAuditPath().
};

/**
 * @struct GatewayConfig
 * @brief Everything read at startup. Immutable once the gateway is built.
 */
struct GatewayConfig {
    ServerSettings server;
    OllamaSettings ollama;
    ClassifierSettings classifier;
    ExtractionSettings extraction;
    AuditSettings audit;
    std::vector<application::ScannerConfig> inputScanners;
    std::vector<application::ScannerConfig> outputScanners;
};

class ConfigLoader {
public:
    /** @brief Built-in configuration with the default guard set. */
    static GatewayConfig Defaults();

    /**
     * @brief Reads and validates settings.json. Missing keys keep their defaults.
     * @throws std::runtime_error if the file cannot be read or is not JSON.
     * @throws std::invalid_argument if a value has the wrong type or range.
     */
    static GatewayConfig Load(const std::filesystem::path& path);

    static GatewayConfig FromJson(const nlohmann::json& j);

    /** @brief Applies OLLAMA_URL and PORT on top of @p config. */
    static void ApplyEnvironment(GatewayConfig& config);

    /**
     * @brief Picks the settings file: explicit path, else the XDG default if it exists.
     * @return nullopt when built-in defaults should be used.
     */
    static std::optional<std::filesystem::path> ResolvePath(const std::string& explicitPath);

    /** @brief Splits "http://host:port" into its parts. Returns false if malformed. */
    static bool ParseUrl(const std::string& url, std::string& host, int& port);

    static application::ScannerConfig ParseScanner(const nlohmann::json& entry);
};

} // namespace promptwarden::infrastructure
