/**
 * @file HttpGatewayServer.hpp
 * @brief REST surface (/api/query, /api/models) over cpp-httplib.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/GatewayOrchestrator.hpp"
#include "domain/GatewayError.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace promptwarden::infrastructure {

/**
 * @class HttpGatewayServer
 * @brief Maps HTTP requests onto GatewayOrchestrator::submitExchange().
 *
 * Guardrail blocks are 200 responses. Client-side failures are 400, an
 * unreachable model is 502 and a model timeout is 504.
 */
class HttpGatewayServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        int port = 5000;
        size_t maxUploadBytes = 25 * 1024 * 1024;
        std::vector<std::string> allowedOrigins;   ///< Exact origins or "*.suffix" host wildcards.
    };

    HttpGatewayServer(std::shared_ptr<const application::GatewayOrchestrator> orchestrator, Options options);
    ~HttpGatewayServer();

    HttpGatewayServer(const HttpGatewayServer&) = delete;
    HttpGatewayServer& operator=(const HttpGatewayServer&) = delete;

    /** @brief Blocks serving requests until stop(). Returns false if the port cannot be bound. */
    bool listen();

    /** @brief Binds an ephemeral port on @p host and returns it (-1 on failure). */
    int bindToAnyPort(const std::string& host = "127.0.0.1");
    /** @brief Serves on the socket bound by bindToAnyPort(). */
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    static bool OriginAllowed(const std::string& origin, const std::vector<std::string>& allowList);
    static int StatusFor(domain::ErrorKind kind);

private:
    void registerRoutes();
    /** @brief Adds CORS headers. Returns false (with a 403 reply) for a disallowed origin. */
    bool applyCors(const httplib::Request& req, httplib::Response& res) const;
    void handleQuery(const httplib::Request& req, httplib::Response& res) const;
    void handleModels(const httplib::Request& req, httplib::Response& res) const;

    std::shared_ptr<const application::GatewayOrchestrator> m_orchestrator;
    Options m_options;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace promptwarden::infrastructure
