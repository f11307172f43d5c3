#include "infrastructure/OllamaClient.hpp"
#include "domain/GatewayError.hpp"
#include <httplib.h>
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace promptwarden::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::GatewayError;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr const char* kStage = "relay";

void ApplyTimeout(httplib::Client& cli, std::chrono::milliseconds timeout) {
    const auto ms = std::max<long long>(1, timeout.count());
    const time_t sec = static_cast<time_t>(ms / 1000);
    const time_t usec = static_cast<time_t>((ms % 1000) * 1000);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
}

/** @brief Maps a transport failure to ModelTimeout or ModelUnavailable. */
[[noreturn]] void ThrowTransportError(httplib::Error error,
                                      std::chrono::steady_clock::time_point start,
                                      std::chrono::milliseconds timeout,
                                      const std::string& target) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    const bool timedOut = elapsed >= timeout ||
                          error == httplib::Error::Read ||
                          error == httplib::Error::Write ||
                          error == httplib::Error::Canceled;
    const std::string detail = httplib::to_string(error);
    if (timedOut && error != httplib::Error::Connection) {
        throw GatewayError(ErrorKind::ModelTimeout, kStage,
                           "Model backend did not answer within " + std::to_string(timeout.count()) + " ms (" + detail + ")");
    }
    if (elapsed >= timeout) {
        throw GatewayError(ErrorKind::ModelTimeout, kStage,
                           "Connection to " + target + " timed out after " + std::to_string(elapsed.count()) + " ms");
    }
    throw GatewayError(ErrorKind::ModelUnavailable, kStage, "Cannot reach model backend at " + target + " (" + detail + ")");
}
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::string OllamaClient::generate(const std::string& model,
                                   const std::string& prompt,
                                   std::chrono::milliseconds timeout,
                                   bool deterministic,
                                   bool forceJson) const {
    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, timeout);

    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false}
    };
    if (deterministic) {
        requestData["options"] = {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        };
    }
    if (forceJson) {
        requestData["format"] = "json";
    }

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/generate";
    req.set_header("Content-Type", "application/json");
    req.body = requestData.dump(-1, ' ', false, json::error_handler_t::replace);

    // The socket timeouts restart with every chunk, so a backend that trickles
    // bytes would never hit them; the receiver enforces the overall deadline.
    const std::string target = m_host + ":" + std::to_string(m_port);
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    std::string received;
    req.content_receiver = [&received, deadline](const char* data, size_t length, uint64_t, uint64_t) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        received.append(data, length);
        return true;
    };

    auto res = cli.send(req);
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        ThrowTransportError(res.error(), start, timeout, target);
    }
    const std::string& payload = received.empty() ? res->body : received;

    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << payload << std::endl;
        std::string message = "Model backend returned HTTP " + std::to_string(res->status);
        try {
            auto body = json::parse(payload);
            if (body.contains("error") && body["error"].is_string()) {
                message += ": " + body["error"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Non-JSON error page; the status code is enough.
        }
        throw GatewayError(ErrorKind::ModelUnavailable, kStage, message);
    }

    try {
        auto body = json::parse(payload);
        if (body.contains("response") && body["response"].is_string()) {
            return body["response"].get<std::string>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    throw GatewayError(ErrorKind::ModelUnavailable, kStage, "Model backend sent a malformed response body");
}

std::vector<std::string> OllamaClient::getAvailableModels(std::chrono::milliseconds timeout) const {
    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, timeout);

    const std::string target = m_host + ":" + std::to_string(m_port);
    const auto start = std::chrono::steady_clock::now();
    auto res = cli.Get("/api/tags");
    if (!res) {
        ThrowTransportError(res.error(), start, timeout, target);
    }
    if (res->status != 200) {
        throw GatewayError(ErrorKind::ModelUnavailable, kStage,
                           "Model listing returned HTTP " + std::to_string(res->status));
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name") && item["name"].is_string()) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        throw GatewayError(ErrorKind::ModelUnavailable, kStage, std::string("Malformed model listing: ") + e.what());
    }
    return models;
}

} // namespace promptwarden::infrastructure
