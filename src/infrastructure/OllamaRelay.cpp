#include "infrastructure/OllamaRelay.hpp"
#include <iostream>

namespace promptwarden::infrastructure {

OllamaRelay::OllamaRelay(OllamaClient client, std::chrono::milliseconds listTimeout)
    : m_client(std::move(client)), m_listTimeout(listTimeout) {}

std::string OllamaRelay::generate(const std::string& prompt,
                                  const std::string& modelName,
                                  std::chrono::milliseconds timeout) {
    std::cout << "[OllamaRelay] Relaying " << prompt.size() << " chars to " << modelName << std::endl;
    return m_client.generate(modelName, prompt, timeout);
}

std::vector<std::string> OllamaRelay::listModels() {
    return m_client.getAvailableModels(m_listTimeout);
}

} // namespace promptwarden::infrastructure
