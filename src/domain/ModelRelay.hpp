/**
 * @file ModelRelay.hpp
 * @brief Interface to the external language-model backend.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace promptwarden::domain {

/**
 * @class ModelRelay
 * @brief Bounded request/response call to a model server.
 */
class ModelRelay {
public:
    virtual ~ModelRelay() = default;

    /**
     * @brief Generates a completion for @p prompt with the given model.
     * @param timeout Upper bound for the whole call; never retried.
     * @throws GatewayError(ModelUnavailable) on connection/protocol failures.
     * @throws GatewayError(ModelTimeout) when the deadline passes.
     */
    virtual std::string generate(const std::string& prompt,
                                 const std::string& modelName,
                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Lists models known to the backend.
     * @throws GatewayError(ModelUnavailable) if the backend cannot be reached.
     */
    virtual std::vector<std::string> listModels() = 0;
};

} // namespace promptwarden::domain
