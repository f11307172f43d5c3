/**
 * @file ExtractionDispatcher.hpp
 * @brief Routes an uploaded artifact to the extractor for its declared media type.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/Artifact.hpp"
#include "domain/FormatExtractor.hpp"
#include "domain/StagingArea.hpp"

namespace promptwarden::application {

/**
 * @class ExtractionDispatcher
 * @brief Format-aware conversion of artifacts into text with guaranteed cleanup.
 *
 * Extractors are matched in registration order against the normalized media
 * type. A pattern is either an exact type ("text/csv") or a family wildcard
 * ("image/*"); register exact types before the family that contains them.
 */
class ExtractionDispatcher {
public:
    /** @param staging Where uploads go for extractors that need a file on disk. */
    explicit ExtractionDispatcher(std::shared_ptr<const domain::StagingArea> staging);

    /** @brief Adds an extractor for @p pattern. Not thread-safe; call during startup only. */
    void registerExtractor(const std::string& pattern, std::shared_ptr<const domain::FormatExtractor> extractor);

    /** @brief True if some extractor accepts @p mediaType. */
    bool supports(const std::string& mediaType) const;

    /**
     * @brief Converts @p artifact into text.
     * @throws domain::GatewayError UnsupportedFormat or ExtractionFailure.
     */
    domain::ExtractedText extract(const domain::Artifact& artifact) const;

private:
    struct Route {
        std::string pattern;
        std::shared_ptr<const domain::FormatExtractor> extractor;
    };

    const domain::FormatExtractor* resolve(const std::string& normalizedType) const;

    std::shared_ptr<const domain::StagingArea> m_staging;
    std::vector<Route> m_routes;
};

} // namespace promptwarden::application
