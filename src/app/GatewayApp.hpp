/**
 * @file GatewayApp.hpp
 * @brief Composition root for PromptWarden: builds services from configuration and runs a command.
 */

#pragma once

#include <string>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace promptwarden::app {

/**
 * @class GatewayApp
 * @brief Wires extractors, scanners, the relay and the audit sink, then serves or runs one command.
 */
class GatewayApp {
public:
    explicit GatewayApp(infrastructure::GatewayConfig config);
    ~GatewayApp();

    /**
     * @brief Builds every service. Configuration errors are logged.
     * @return True if the gateway is ready.
     */
    bool Init();

    /** @brief Runs the HTTP server until it is stopped. */
    int Serve();

    /** @brief One exchange from the command line; prints the reply and its metadata. */
    int Ask(const std::string& prompt, const std::string& filePath,
            const std::string& mediaType, const std::string& model);

    int ListModels();

    int RedTeam(const std::string& promptsPath, const std::string& outPath);

    /** @brief Flushes the audit log. Safe to call more than once. */
    void Shutdown();

    /** @brief Media type for a file name extension, "application/octet-stream" if unknown. */
    static std::string GuessMediaType(const std::string& path);

private:
    infrastructure::GatewayConfig m_config;
    application::AppServices m_services;
};

} // namespace promptwarden::app
