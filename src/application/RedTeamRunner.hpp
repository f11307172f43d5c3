/**
 * @file RedTeamRunner.hpp
 * @brief Batch execution of attack prompts through the gateway with a CSV result log.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/GatewayOrchestrator.hpp"

namespace promptwarden::application {

struct RedTeamCase {
    std::string attackType;
    std::string prompt;
};

/**
 * @struct RedTeamResult
 * @brief One CSV row. Column names follow the dashboard format.
 */
struct RedTeamResult {
    std::string attackType;
    std::string promptText;
    bool blockedInput = false;
    double inputScore = 0.0;
    std::string modelResponse;
    bool unsafeOutput = false;
    double outputScore = 0.0;
    double durationSec = 0.0;
};

class RedTeamRunner {
public:
    explicit RedTeamRunner(std::shared_ptr<const GatewayOrchestrator> orchestrator, std::string modelName = "");

    /**
     * @brief Reads a JSON array of {"prompt": ..., "attack_type": ...} objects.
     * @throws std::runtime_error if the file cannot be read or parsed.
     * @throws std::invalid_argument if an entry has no prompt.
     */
    static std::vector<RedTeamCase> LoadCases(const std::filesystem::path& path);
    static std::vector<RedTeamCase> ParseCases(const nlohmann::json& data);

    /** @brief Runs every case sequentially. Never throws for a failing exchange. */
    std::vector<RedTeamResult> run(const std::vector<RedTeamCase>& cases) const;

    static void WriteCsv(const std::vector<RedTeamResult>& results, std::ostream& out);
    /** @throws std::runtime_error if @p path cannot be written. */
    static void WriteCsv(const std::vector<RedTeamResult>& results, const std::filesystem::path& path);

    static std::string CsvEscape(const std::string& field);

private:
    RedTeamResult runCase(const RedTeamCase& testCase) const;

    std::shared_ptr<const GatewayOrchestrator> m_orchestrator;
    std::string m_modelName;
};

} // namespace promptwarden::application
