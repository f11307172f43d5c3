/**
 * @file GatewayApp.cpp
 * @brief Implementation of the GatewayApp class.
 */
#include "app/GatewayApp.hpp"

#include "application/RedTeamRunner.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/ExchangeJson.hpp"
#include "infrastructure/HttpGatewayServer.hpp"
#include "infrastructure/OllamaClassifierBackend.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaRelay.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include "domain/TextUtils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>

namespace promptwarden::app {

namespace fs = std::filesystem;
using domain::Direction;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitClientError = 2;
constexpr int kExitBackendError = 3;

std::shared_ptr<application::ExtractionDispatcher> BuildDispatcher(
        const infrastructure::ExtractionSettings& settings,
        const std::shared_ptr<infrastructure::WhisperAudioExtractor>& transcriber) {
    fs::path tempDir = settings.tempDir.empty()
        ? infrastructure::ScopedTempFile::DefaultDirectory()
        : settings.tempDir;

    auto dispatcher = std::make_shared<application::ExtractionDispatcher>(
        std::make_shared<infrastructure::TempDirStaging>(tempDir));
    auto csv = std::make_shared<infrastructure::CsvRowsExtractor>(',');
    dispatcher->registerExtractor("application/pdf", std::make_shared<infrastructure::PdfTextExtractor>());
    dispatcher->registerExtractor("application/vnd.openxmlformats-officedocument.wordprocessingml.document",
                                  std::make_shared<infrastructure::DocxTextExtractor>());
    dispatcher->registerExtractor("text/csv", csv);
    dispatcher->registerExtractor("application/csv", csv);
    dispatcher->registerExtractor("text/tab-separated-values", std::make_shared<infrastructure::CsvRowsExtractor>('\t'));
    dispatcher->registerExtractor("image/*", std::make_shared<infrastructure::OcrImageExtractor>(settings.ocrLanguage));
    dispatcher->registerExtractor("audio/*", transcriber);
    dispatcher->registerExtractor("text/*", std::make_shared<infrastructure::PlainTextExtractor>());
    return dispatcher;
}

bool ReadFile(const fs::path& path, std::string& bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

GatewayApp::GatewayApp(infrastructure::GatewayConfig config)
    : m_config(std::move(config)) {}

GatewayApp::~GatewayApp() {
    Shutdown();
}

bool GatewayApp::Init() {
    // Dependency Injection / Composition Root
    const auto& ollama = m_config.ollama;
    infrastructure::OllamaClient client(ollama.host, ollama.port);

    if (m_config.classifier.enabled) {
        auto backend = std::make_shared<infrastructure::OllamaClassifierBackend>(
            client, m_config.classifier.model, std::chrono::milliseconds(m_config.classifier.timeoutMs));
        backend->initialize();
        m_services.classifier = backend;
    }

    std::string modelPath = m_config.extraction.whisperModel.string();
    if (modelPath.empty()) {
        modelPath = (infrastructure::PathUtils::GetModelsDir() / "ggml-base.bin").string();
    }
    m_services.transcriber = std::make_shared<infrastructure::WhisperAudioExtractor>(
        modelPath, m_config.extraction.whisperLanguage);
    m_services.transcriber->initialize();

    m_services.dispatcher = BuildDispatcher(m_config.extraction, m_services.transcriber);

    try {
        auto registry = std::make_shared<application::ScannerRegistry>(m_services.classifier);
        for (const auto& scanner : m_config.inputScanners) {
            registry->add(Direction::Input, scanner);
        }
        for (const auto& scanner : m_config.outputScanners) {
            registry->add(Direction::Output, scanner);
        }
        m_services.registry = registry;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[GatewayApp] Invalid scanner configuration: " << e.what() << std::endl;
        return false;
    }
    std::cout << "[GatewayApp] Guardrails: " << m_services.registry->scanners(Direction::Input).size()
              << " input / " << m_services.registry->scanners(Direction::Output).size() << " output scanners" << std::endl;

    m_services.pipeline = std::make_shared<application::GuardrailPipeline>(m_services.registry);
    m_services.relay = std::make_shared<infrastructure::OllamaRelay>(client);

    if (m_config.audit.enabled) {
        fs::path auditPath = m_config.audit.path.empty()
            ? infrastructure::PathUtils::GetDefaultAuditPath()
            : m_config.audit.path;
        m_services.auditSink = std::make_shared<infrastructure::JsonlAuditSink>(auditPath);
    }

    application::GatewayOrchestrator::Options options;
    options.relayTimeout = std::chrono::milliseconds(ollama.timeoutMs);
    options.defaultModel = ollama.defaultModel;
    m_services.orchestrator = std::make_shared<application::GatewayOrchestrator>(
        m_services.dispatcher, m_services.pipeline, m_services.relay, options, m_services.auditSink);

    std::cout << "[GatewayApp] Model backend: " << ollama.host << ":" << ollama.port
              << " (default model " << ollama.defaultModel << ")" << std::endl;
    return true;
}

int GatewayApp::Serve() {
    infrastructure::HttpGatewayServer::Options options;
    options.host = m_config.server.host;
    options.port = m_config.server.port;
    options.maxUploadBytes = m_config.server.maxUploadBytes;
    options.allowedOrigins = m_config.server.allowedOrigins;

    infrastructure::HttpGatewayServer server(m_services.orchestrator, options);
    return server.listen() ? kExitOk : kExitBackendError;
}

int GatewayApp::Ask(const std::string& prompt, const std::string& filePath,
                    const std::string& mediaType, const std::string& model) {
    application::ExchangeRequest request;
    request.prompt = prompt;
    request.modelName = model;

    if (!filePath.empty()) {
        std::string bytes;
        if (!ReadFile(filePath, bytes)) {
            std::cerr << "[GatewayApp] Cannot read " << filePath << std::endl;
            return kExitUsage;
        }
        const std::string type = mediaType.empty() ? GuessMediaType(filePath) : mediaType;
        request.artifact = domain::Artifact(std::move(bytes), type, fs::path(filePath).filename().string());
    }

    const auto exchange = m_services.orchestrator->submitExchange(request);
    nlohmann::json metadata = infrastructure::ExchangeJson::Metadata(exchange);

    if (exchange.failure) {
        std::cerr << "Error (" << domain::ErrorKindToString(exchange.failure->kind) << " at "
                  << exchange.failure->stage << "): " << exchange.failure->message << std::endl;
        std::cerr << metadata.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return domain::IsClientError(exchange.failure->kind) ? kExitClientError : kExitBackendError;
    }

    std::cout << exchange.finalText << std::endl;
    std::cerr << metadata.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return kExitOk;
}

int GatewayApp::ListModels() {
    for (const auto& name : m_services.orchestrator->listModels()) {
        std::cout << name << std::endl;
    }
    return kExitOk;
}

int GatewayApp::RedTeam(const std::string& promptsPath, const std::string& outPath) {
    try {
        auto cases = application::RedTeamRunner::LoadCases(promptsPath);
        application::RedTeamRunner runner(m_services.orchestrator);
        auto results = runner.run(cases);

        std::string target = outPath;
        if (target.empty()) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            target = "results/red_team_log_" + std::to_string(seconds) + ".csv";
        }
        application::RedTeamRunner::WriteCsv(results, fs::path(target));
    } catch (const std::exception& e) {
        std::cerr << "[GatewayApp] Red-team run failed: " << e.what() << std::endl;
        return kExitUsage;
    }
    return kExitOk;
}

void GatewayApp::Shutdown() {
    if (m_services.auditSink) {
        m_services.auditSink->stop();
    }
}

std::string GatewayApp::GuessMediaType(const std::string& path) {
    static const std::map<std::string, std::string> kTypes = {
        {".pdf", "application/pdf"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".json", "application/json"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".bmp", "image/bmp"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".wav", "audio/wav"},
        {".mp3", "audio/mpeg"},
        {".ogg", "audio/ogg"},
        {".m4a", "audio/mp4"},
        {".webm", "audio/webm"},
        {".zip", "application/zip"},
    };
    auto it = kTypes.find(domain::TextUtils::ToLower(fs::path(path).extension().string()));
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

} // namespace promptwarden::app
