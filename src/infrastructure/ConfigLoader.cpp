/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/TextUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace promptwarden::infrastructure {

using json = nlohmann::json;
using domain::ScanAction;
using domain::TextUtils;

namespace {

template <typename T>
void Read(const json& section, const char* key, T& target, const std::string& where) {
    if (!section.contains(key)) return;
    try {
        target = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(where + "." + key + ": " + e.what());
    }
}

const json& Section(const json& root, const char* key) {
    static const json kEmpty = json::object();
    if (!root.contains(key)) return kEmpty;
    const json& section = root.at(key);
    if (!section.is_object()) {
        throw std::invalid_argument(std::string("section '") + key + "' must be an object");
    }
    return section;
}

void RequirePort(int port, const std::string& where) {
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument(where + ": port out of range: " + std::to_string(port));
    }
}

void RequirePositive(int value, const std::string& where) {
    if (value <= 0) {
        throw std::invalid_argument(where + " must be positive");
    }
}

std::vector<application::ScannerConfig> ParseScannerList(const json& scanners, const char* direction,
                                                         std::vector<application::ScannerConfig> fallback) {
    if (!scanners.contains(direction)) return fallback;
    const json& list = scanners.at(direction);
    if (!list.is_array()) {
        throw std::invalid_argument(std::string("scanners.") + direction + " must be an array");
    }
    std::vector<application::ScannerConfig> parsed;
    for (const auto& entry : list) {
        parsed.push_back(ConfigLoader::ParseScanner(entry));
    }
    return parsed;
}

} // namespace

GatewayConfig ConfigLoader::Defaults() {
    GatewayConfig config;
    config.inputScanners = application::ScannerRegistry::DefaultInputScanners();
    config.outputScanners = application::ScannerRegistry::DefaultOutputScanners();
    return config;
}

application::ScannerConfig ConfigLoader::ParseScanner(const json& entry) {
    if (!entry.is_object()) {
        throw std::invalid_argument("scanner entries must be objects");
    }
    application::ScannerConfig config;
    Read(entry, "name", config.spec.name, "scanner");
    const std::string where = "scanner '" + config.spec.name + "'";

    Read(entry, "type", config.type, where);
    if (config.type.empty()) {
        throw std::invalid_argument(where + ": missing 'type'");
    }
    if (config.spec.name.empty()) {
        config.spec.name = config.type;
    }

    std::string action = "BLOCK";
    Read(entry, "action", action, where);
    for (auto& c : action) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (action == "BLOCK") {
        config.spec.action = ScanAction::Block;
    } else if (action == "REDACT") {
        config.spec.action = ScanAction::Redact;
    } else {
        throw std::invalid_argument(where + ": action must be BLOCK or REDACT, got " + action);
    }

    Read(entry, "threshold", config.spec.threshold, where);
    Read(entry, "rank", config.spec.rank, where);
    Read(entry, "fail_open", config.spec.failOpen, where);

    if (entry.contains("params")) {
        if (!entry.at("params").is_object()) {
            throw std::invalid_argument(where + ": params must be an object");
        }
        config.params = entry.at("params");
    }
    return config;
}

GatewayConfig ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("settings root must be a JSON object");
    }
    GatewayConfig config = Defaults();

    const json& server = Section(j, "server");
    Read(server, "host", config.server.host, "server");
    Read(server, "port", config.server.port, "server");
    Read(server, "max_upload_bytes", config.server.maxUploadBytes, "server");
    Read(server, "allowed_origins", config.server.allowedOrigins, "server");
    RequirePort(config.server.port, "server.port");

    const json& ollama = Section(j, "ollama");
    if (ollama.contains("url")) {
        std::string url;
        Read(ollama, "url", url, "ollama");
        if (!ParseUrl(url, config.ollama.host, config.ollama.port)) {
            throw std::invalid_argument("ollama.url is not an http://host:port URL: " + url);
        }
    }
    Read(ollama, "host", config.ollama.host, "ollama");
    Read(ollama, "port", config.ollama.port, "ollama");
    Read(ollama, "default_model", config.ollama.defaultModel, "ollama");
    Read(ollama, "timeout_ms", config.ollama.timeoutMs, "ollama");
    RequirePort(config.ollama.port, "ollama.port");
    RequirePositive(config.ollama.timeoutMs, "ollama.timeout_ms");

    const json& classifier = Section(j, "classifier");
    config.classifier.model = config.ollama.defaultModel;
    Read(classifier, "enabled", config.classifier.enabled, "classifier");
    Read(classifier, "model", config.classifier.model, "classifier");
    Read(classifier, "timeout_ms", config.classifier.timeoutMs, "classifier");
    RequirePositive(config.classifier.timeoutMs, "classifier.timeout_ms");

    const json& extraction = Section(j, "extraction");
    std::string tempDir, whisperModel;
    Read(extraction, "temp_dir", tempDir, "extraction");
    Read(extraction, "whisper_model", whisperModel, "extraction");
    Read(extraction, "whisper_language", config.extraction.whisperLanguage, "extraction");
    Read(extraction, "ocr_language", config.extraction.ocrLanguage, "extraction");
    config.extraction.tempDir = tempDir;
    config.extraction.whisperModel = whisperModel;

    const json& audit = Section(j, "audit");
    std::string auditPath;
    Read(audit, "enabled", config.audit.enabled, "audit");
    Read(audit, "path", auditPath, "audit");
    config.audit.path = auditPath;

    const json& scanners = Section(j, "scanners");
    config.inputScanners = ParseScannerList(scanners, "input", config.inputScanners);
    config.outputScanners = ParseScannerList(scanners, "output", config.outputScanners);

    return config;
}

GatewayConfig ConfigLoader::Load(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("Cannot open settings file: " + path.string());
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Error reading " + path.string() + ": " + e.what());
    }

    std::cout << "[ConfigLoader] Loaded " << path.string() << std::endl;
    return FromJson(j);
}

void ConfigLoader::ApplyEnvironment(GatewayConfig& config) {
    const char* url = std::getenv("OLLAMA_URL");
    if (url && *url) {
        if (ParseUrl(url, config.ollama.host, config.ollama.port)) {
            std::cout << "[ConfigLoader] OLLAMA_URL override: " << config.ollama.host << ":" << config.ollama.port << std::endl;
        } else {
            throw std::invalid_argument(std::string("OLLAMA_URL is not an http://host:port URL: ") + url);
        }
    }

    const char* port = std::getenv("PORT");
    if (port && *port) {
        int value = 0;
        try {
            value = std::stoi(port);
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("PORT is not a number: ") + port);
        }
        RequirePort(value, "PORT");
        config.server.port = value;
    }
}

std::optional<std::filesystem::path> ConfigLoader::ResolvePath(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return std::filesystem::path(explicitPath);
    }
    auto fallback = PathUtils::GetDefaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(fallback, ec)) {
        return fallback;
    }
    return std::nullopt;
}

bool ConfigLoader::ParseUrl(const std::string& url, std::string& host, int& port) {
    std::string rest = TextUtils::Trim(url);
    const std::string scheme = "http://";
    if (TextUtils::ToLower(rest.substr(0, scheme.size())) == scheme) {
        rest = rest.substr(scheme.size());
    } else if (rest.find("://") != std::string::npos) {
        return false;
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) return false;

    int parsedPort = 11434;
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string digits = rest.substr(colon + 1);
        if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 5) {
            return false;
        }
        parsedPort = std::stoi(digits);
        rest = rest.substr(0, colon);
    }
    if (rest.empty() || parsedPort <= 0 || parsedPort > 65535) return false;

    host = rest;
    port = parsedPort;
    return true;
}

} // namespace promptwarden::infrastructure
