/**
 * @file ExchangeJson.hpp
 * @brief JSON rendering of exchange metadata for HTTP replies, the CLI and the audit log.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/ChatExchange.hpp"

namespace promptwarden::infrastructure {

/**
 * @class ExchangeJson
 * @brief Content-free views of a ChatExchange: names, verdicts, scores and sizes only.
 */
class ExchangeJson {
public:
    static nlohmann::json Report(const domain::PipelineReport& report);
    static nlohmann::json Extraction(const domain::ExtractionOutcome& extraction);

    /**
     * @brief Metadata block: type, filename, extraction, input/output reports
     *        (output absent if never reached), verdict, state and trail.
     */
    static nlohmann::json Metadata(const domain::ChatExchange& exchange);

    /** @brief Metadata plus model name, timestamp and failure: one audit line. */
    static nlohmann::json AuditRecord(const domain::ChatExchange& exchange);

    /** @brief ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z. */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
};

} // namespace promptwarden::infrastructure
