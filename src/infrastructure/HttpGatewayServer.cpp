/**
 * @file HttpGatewayServer.cpp
 * @brief Implementation of HttpGatewayServer.
 */

#include "infrastructure/HttpGatewayServer.hpp"
#include "infrastructure/ExchangeJson.hpp"
#include "domain/TextUtils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace promptwarden::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::TextUtils;

namespace {

constexpr const char* kJson = "application/json";

std::string OriginHost(const std::string& origin) {
    std::string host = origin;
    auto scheme = host.find("://");
    if (scheme != std::string::npos) host = host.substr(scheme + 3);
    auto slash = host.find('/');
    if (slash != std::string::npos) host = host.substr(0, slash);
    auto colon = host.rfind(':');
    if (colon != std::string::npos) host = host.substr(0, colon);
    return TextUtils::ToLower(host);
}

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    // Replace rather than throw on bytes that are not UTF-8.
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJson);
}

std::string FormField(const httplib::Request& req, const char* name) {
    return req.has_file(name) ? req.get_file_value(name).content : std::string();
}

} // namespace

HttpGatewayServer::HttpGatewayServer(std::shared_ptr<const application::GatewayOrchestrator> orchestrator, Options options)
    : m_orchestrator(std::move(orchestrator))
    , m_options(std::move(options))
    , m_server(std::make_unique<httplib::Server>())
{
    if (!m_orchestrator) {
        throw std::invalid_argument("HTTP server requires an orchestrator");
    }
    registerRoutes();
}

HttpGatewayServer::~HttpGatewayServer() {
    stop();
}

bool HttpGatewayServer::OriginAllowed(const std::string& origin, const std::vector<std::string>& allowList) {
    const std::string normalized = TextUtils::ToLower(origin);
    const std::string host = OriginHost(origin);
    for (const auto& entry : allowList) {
        const std::string allowed = TextUtils::ToLower(entry);
        if (allowed == "*" || allowed == normalized) return true;
        if (allowed.size() > 2 && allowed.compare(0, 2, "*.") == 0) {
            const std::string suffix = allowed.substr(1);   // ".vercel.app"
            if (host.size() > suffix.size() &&
                host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return true;
            }
        }
    }
    return false;
}

int HttpGatewayServer::StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyInput:
        case ErrorKind::UnsupportedFormat:
        case ErrorKind::ExtractionFailure:
            return 400;
        case ErrorKind::ModelTimeout:
            return 504;
        case ErrorKind::ModelUnavailable:
        case ErrorKind::ScannerUnavailable:
            return 502;
        case ErrorKind::GuardrailBlocked:
            return 200;
    }
    return 500;
}

bool HttpGatewayServer::applyCors(const httplib::Request& req, httplib::Response& res) const {
    if (!req.has_header("Origin")) {
        return true;   // Same-origin or non-browser client.
    }
    const std::string origin = req.get_header_value("Origin");
    if (!OriginAllowed(origin, m_options.allowedOrigins)) {
        std::cerr << "[HttpGatewayServer] Rejected origin " << origin << std::endl;
        SendJson(res, 403, {{"error", "Origin not allowed by CORS policy"}, {"origin", origin}});
        return false;
    }
    res.set_header("Access-Control-Allow-Origin", origin);
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Vary", "Origin");
    return true;
}

void HttpGatewayServer::registerRoutes() {
    m_server->set_payload_max_length(m_options.maxUploadBytes);

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
            throw std::runtime_error("unknown exception");
        } catch (const std::exception& e) {
            std::cerr << "[HttpGatewayServer] Unhandled error on " << req.path << ": " << e.what() << std::endl;
            SendJson(res, 500, {{"error", std::string("Internal error: ") + e.what()}});
        }
    });

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpGatewayServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    m_server->Options(R"(/api/.*)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!applyCors(req, res)) return;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    m_server->Post("/api/query", [this](const httplib::Request& req, httplib::Response& res) {
        if (!applyCors(req, res)) return;
        handleQuery(req, res);
    });

    m_server->Get("/api/models", [this](const httplib::Request& req, httplib::Response& res) {
        if (!applyCors(req, res)) return;
        handleModels(req, res);
    });
}

void HttpGatewayServer::handleQuery(const httplib::Request& req, httplib::Response& res) const {
    application::ExchangeRequest request;

    if (req.is_multipart_form_data()) {
        request.prompt = FormField(req, "prompt");
        request.modelName = FormField(req, "model");
        if (req.has_file("file")) {
            const auto file = req.get_file_value("file");
            request.artifact = domain::Artifact(file.content, file.content_type, file.filename);
        }
    } else if (!req.body.empty()) {
        try {
            auto body = json::parse(req.body);
            if (!body.is_object()) {
                SendJson(res, 400, {{"error", "Request body must be a JSON object"}});
                return;
            }
            request.prompt = body.value("prompt", std::string());
            request.modelName = body.value("model", std::string());
        } catch (const json::exception& e) {
            SendJson(res, 400, {{"error", std::string("Malformed request body: ") + e.what()}});
            return;
        }
    }

    const auto exchange = m_orchestrator->submitExchange(request);
    const auto metadata = ExchangeJson::Metadata(exchange);
    const auto timestamp = ExchangeJson::FormatTimestamp(exchange.timestamp);

    if (exchange.failure) {
        SendJson(res, StatusFor(exchange.failure->kind), {
            {"error", exchange.failure->message},
            {"kind", domain::ErrorKindToString(exchange.failure->kind)},
            {"stage", exchange.failure->stage},
            {"metadata", metadata},
            {"timestamp", timestamp}
        });
        return;
    }

    SendJson(res, 200, {
        {"response", exchange.finalText},
        {"metadata", metadata},
        {"timestamp", timestamp}
    });
}

void HttpGatewayServer::handleModels(const httplib::Request&, httplib::Response& res) const {
    SendJson(res, 200, {{"models", m_orchestrator->listModels()}});
}

bool HttpGatewayServer::listen() {
    std::cout << "[HttpGatewayServer] Listening on http://" << m_options.host << ":" << m_options.port << std::endl;
    if (!m_server->listen(m_options.host, m_options.port)) {
        std::cerr << "[HttpGatewayServer] Cannot bind " << m_options.host << ":" << m_options.port << std::endl;
        return false;
    }
    return true;
}

int HttpGatewayServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool HttpGatewayServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void HttpGatewayServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool HttpGatewayServer::isRunning() const {
    return m_server && m_server->is_running();
}

} // namespace promptwarden::infrastructure
