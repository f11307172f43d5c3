/**
 * @file FormatExtractor.hpp
 * @brief Interface for converting one media family into text.
 */

#pragma once
#include <filesystem>
#include <string>
#include "domain/Artifact.hpp"

namespace promptwarden::domain {

/**
 * @class FormatExtractor
 * @brief Converts an Artifact of a known media type into ExtractedText.
 *
 * Extractors that drive external tools need the bytes on disk; the dispatcher
 * stages them into a transient file and passes its path. Extractors that work
 * in memory receive an empty path.
 */
class FormatExtractor {
public:
    virtual ~FormatExtractor() = default;

    /** @brief Name recorded as ExtractedText::method. */
    virtual std::string method() const = 0;

    /** @brief Whether the artifact must be staged to transient storage first. */
    virtual bool requiresStaging() const { return true; }

    /**
     * @brief Extracts text.
     * @param artifact The upload; bytes are never retained.
     * @param stagedPath Transient copy of the bytes, or empty if not staged.
     * @throws GatewayError(ExtractionFailure) or any std::exception on parser failure.
     */
    virtual ExtractedText extract(const Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const = 0;
};

} // namespace promptwarden::domain
