#include "application/RedTeamRunner.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace promptwarden::application {

using domain::Verdict;

namespace {

const char* kDefaultAttackType = "PromptInjection_Toxicity";

double MaxScore(const std::optional<domain::PipelineReport>& report) {
    double best = 0.0;
    if (!report) return best;
    for (const auto& outcome : report->outcomes) {
        if (outcome.score) best = std::max(best, *outcome.score);
    }
    return best;
}

const char* BoolField(bool value) {
    return value ? "True" : "False";
}

} // namespace

RedTeamRunner::RedTeamRunner(std::shared_ptr<const GatewayOrchestrator> orchestrator, std::string modelName)
    : m_orchestrator(std::move(orchestrator))
    , m_modelName(std::move(modelName))
{
    if (!m_orchestrator) {
        throw std::invalid_argument("red-team runner requires an orchestrator");
    }
}

std::vector<RedTeamCase> RedTeamRunner::LoadCases(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open red-team prompts: " + path.string());
    }
    nlohmann::json data;
    try {
        in >> data;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid red-team prompts file " + path.string() + ": " + e.what());
    }
    return ParseCases(data);
}

std::vector<RedTeamCase> RedTeamRunner::ParseCases(const nlohmann::json& data) {
    if (!data.is_array()) {
        throw std::invalid_argument("red-team prompts must be a JSON array");
    }
    std::vector<RedTeamCase> cases;
    for (size_t i = 0; i < data.size(); ++i) {
        const auto& item = data[i];
        if (!item.is_object() || !item.contains("prompt") || !item["prompt"].is_string()) {
            throw std::invalid_argument("red-team entry " + std::to_string(i) + " has no string 'prompt'");
        }
        RedTeamCase testCase;
        testCase.prompt = item["prompt"].get<std::string>();
        testCase.attackType = item.value("attack_type", std::string(kDefaultAttackType));
        cases.push_back(std::move(testCase));
    }
    return cases;
}

RedTeamResult RedTeamRunner::runCase(const RedTeamCase& testCase) const {
    auto start = std::chrono::steady_clock::now();

    ExchangeRequest request;
    request.prompt = testCase.prompt;
    request.modelName = m_modelName;
    auto exchange = m_orchestrator->submitExchange(request);

    RedTeamResult result;
    result.attackType = testCase.attackType;
    result.promptText = testCase.prompt;
    result.blockedInput = exchange.inputReport && exchange.inputReport->verdict == Verdict::Block;
    result.inputScore = MaxScore(exchange.inputReport);
    result.outputScore = MaxScore(exchange.outputReport);

    if (result.blockedInput) {
        result.modelResponse = "BLOCKED BY INPUT GUARDRAIL";
        result.unsafeOutput = true;
    } else if (exchange.failure) {
        result.modelResponse = "Model error: " + exchange.failure->message;
        result.unsafeOutput = true;
    } else {
        result.modelResponse = exchange.modelResponse.value_or("");
        result.unsafeOutput = exchange.outputReport && exchange.outputReport->verdict == Verdict::Block;
    }

    result.durationSec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

std::vector<RedTeamResult> RedTeamRunner::run(const std::vector<RedTeamCase>& cases) const {
    std::cout << "[RedTeamRunner] Running " << cases.size() << " attack prompt(s)..." << std::endl;

    std::vector<RedTeamResult> results;
    size_t blocked = 0;
    size_t unsafe = 0;
    for (const auto& testCase : cases) {
        results.push_back(runCase(testCase));
        const auto& last = results.back();
        if (last.blockedInput) {
            ++blocked;
        } else if (last.unsafeOutput) {
            ++unsafe;
        }
    }

    std::cout << "[RedTeamRunner] " << blocked << "/" << cases.size() << " blocked at input, "
              << unsafe << " flagged at output or failed." << std::endl;
    return results;
}

std::string RedTeamRunner::CsvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void RedTeamRunner::WriteCsv(const std::vector<RedTeamResult>& results, std::ostream& out) {
    out << "attack_type,prompt_text,blocked_input,input_score,model_response,unsafe_output,output_score,duration_sec\n";
    for (const auto& r : results) {
        out << CsvEscape(r.attackType) << ','
            << CsvEscape(r.promptText) << ','
            << BoolField(r.blockedInput) << ','
            << r.inputScore << ','
            << CsvEscape(r.modelResponse) << ','
            << BoolField(r.unsafeOutput) << ','
            << r.outputScore << ','
            << r.durationSec << '\n';
    }
}

void RedTeamRunner::WriteCsv(const std::vector<RedTeamResult>& results, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write red-team results: " + path.string());
    }
    WriteCsv(results, out);
    std::cout << "[RedTeamRunner] Results saved to " << path.string() << std::endl;
}

} // namespace promptwarden::application
