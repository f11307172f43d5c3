/**
 * @file OllamaRelay.hpp
 * @brief ModelRelay backed by a local or remote Ollama server.
 */

#pragma once

#include "domain/ModelRelay.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace promptwarden::infrastructure {

class OllamaRelay : public domain::ModelRelay {
public:
    explicit OllamaRelay(OllamaClient client,
                         std::chrono::milliseconds listTimeout = std::chrono::milliseconds(5000));

    std::string generate(const std::string& prompt,
                         const std::string& modelName,
                         std::chrono::milliseconds timeout) override;

    std::vector<std::string> listModels() override;

private:
    OllamaClient m_client;
    std::chrono::milliseconds m_listTimeout;
};

} // namespace promptwarden::infrastructure
