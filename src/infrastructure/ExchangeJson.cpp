#include "infrastructure/ExchangeJson.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace promptwarden::infrastructure {

using json = nlohmann::json;

json ExchangeJson::Report(const domain::PipelineReport& report) {
    json outcomes = json::array();
    for (const auto& outcome : report.outcomes) {
        json o = {
            {"scanner", outcome.scannerName},
            {"triggered", outcome.triggered},
            {"action", domain::ScanActionToString(outcome.action)},
            {"score", outcome.score ? json(*outcome.score) : json(nullptr)},
            {"unavailable", outcome.unavailable}
        };
        if (!outcome.reason.empty()) {
            o["reason"] = outcome.reason;
        }
        outcomes.push_back(o);
    }

    json j = {
        {"direction", domain::DirectionToString(report.direction)},
        {"verdict", domain::VerdictToString(report.verdict)},
        {"outcomes", outcomes}
    };
    if (const auto* blocker = report.blockingOutcome()) {
        j["blocked_by"] = blocker->scannerName;
    }
    return j;
}

json ExchangeJson::Extraction(const domain::ExtractionOutcome& extraction) {
    return {
        {"filename", extraction.filename},
        {"media_type", extraction.mediaType},
        {"method", extraction.method},
        {"characters", extraction.characters},
        {"success", extraction.success},
        {"warnings", extraction.warnings}
    };
}

json ExchangeJson::Metadata(const domain::ChatExchange& exchange) {
    json j;
    j["type"] = exchange.extraction ? "file" : "text";
    if (exchange.extraction) {
        j["filename"] = exchange.extraction->filename;
        j["extraction"] = Extraction(*exchange.extraction);
    }
    if (exchange.inputReport) {
        j["input_report"] = Report(*exchange.inputReport);
    }
    if (exchange.outputReport) {
        j["output_report"] = Report(*exchange.outputReport);
    }
    j["verdict"] = domain::VerdictToString(exchange.finalVerdict());
    j["state"] = domain::ExchangeStateToString(exchange.state);

    json trail = json::array();
    for (auto state : exchange.trail) {
        trail.push_back(domain::ExchangeStateToString(state));
    }
    j["trail"] = trail;
    return j;
}

json ExchangeJson::AuditRecord(const domain::ChatExchange& exchange) {
    json j = {
        {"timestamp", FormatTimestamp(exchange.timestamp)},
        {"model", exchange.modelName},
        {"input_characters", exchange.rawInput.size()},
        {"metadata", Metadata(exchange)}
    };
    if (exchange.failure) {
        j["failure"] = {
            {"kind", domain::ErrorKindToString(exchange.failure->kind)},
            {"stage", exchange.failure->stage},
            {"message", exchange.failure->message}
        };
    }
    return j;
}

std::string ExchangeJson::FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << (ms < 0 ? ms + 1000 : ms) << 'Z';
    return oss.str();
}

} // namespace promptwarden::infrastructure
