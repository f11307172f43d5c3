/**
 * @file AppServices.hpp
 * @brief Container for gateway services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ExtractionDispatcher.hpp"
#include "application/GatewayOrchestrator.hpp"
#include "application/GuardrailPipeline.hpp"
#include "application/ScannerRegistry.hpp"
#include "domain/ClassifierBackend.hpp"
#include "domain/ModelRelay.hpp"
#include "infrastructure/JsonlAuditSink.hpp"
#include "infrastructure/WhisperAudioExtractor.hpp"

namespace promptwarden::application {

struct AppServices {
    std::shared_ptr<domain::ClassifierBackend> classifier;
    std::shared_ptr<infrastructure::WhisperAudioExtractor> transcriber;
    std::shared_ptr<ExtractionDispatcher> dispatcher;
    std::shared_ptr<ScannerRegistry> registry;
    std::shared_ptr<GuardrailPipeline> pipeline;
    std::shared_ptr<domain::ModelRelay> relay;
    std::shared_ptr<infrastructure::JsonlAuditSink> auditSink;
    std::shared_ptr<GatewayOrchestrator> orchestrator;
};

} // namespace promptwarden::application
