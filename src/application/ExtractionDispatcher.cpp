/**
 * @file ExtractionDispatcher.cpp
 * @brief Implementation of ExtractionDispatcher.
 */

#include "application/ExtractionDispatcher.hpp"
#include "domain/GatewayError.hpp"
#include "domain/TextUtils.hpp"
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace promptwarden::application {

using domain::ErrorKind;
using domain::GatewayError;
using domain::TextUtils;

namespace {

bool Matches(const std::string& pattern, const std::string& mediaType) {
    if (pattern.size() >= 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0) {
        return mediaType.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
    }
    return pattern == mediaType;
}

// Only the extension of the client-supplied name reaches the filesystem.
std::string SafeSuffix(const std::string& name) {
    std::string ext = std::filesystem::path(name).extension().string();
    if (ext.size() < 2 || ext.size() > 8) return ".bin";
    for (size_t i = 1; i < ext.size(); ++i) {
        if (!std::isalnum(static_cast<unsigned char>(ext[i]))) return ".bin";
    }
    return TextUtils::ToLower(ext);
}

} // namespace

ExtractionDispatcher::ExtractionDispatcher(std::shared_ptr<const domain::StagingArea> staging)
    : m_staging(std::move(staging))
{
    if (!m_staging) {
        throw std::invalid_argument("ExtractionDispatcher requires a staging area");
    }
}

void ExtractionDispatcher::registerExtractor(const std::string& pattern,
                                             std::shared_ptr<const domain::FormatExtractor> extractor) {
    m_routes.push_back(Route{TextUtils::NormalizeMediaType(pattern), std::move(extractor)});
}

const domain::FormatExtractor* ExtractionDispatcher::resolve(const std::string& normalizedType) const {
    for (const auto& route : m_routes) {
        if (Matches(route.pattern, normalizedType)) {
            return route.extractor.get();
        }
    }
    return nullptr;
}

bool ExtractionDispatcher::supports(const std::string& mediaType) const {
    return resolve(TextUtils::NormalizeMediaType(mediaType)) != nullptr;
}

domain::ExtractedText ExtractionDispatcher::extract(const domain::Artifact& artifact) const {
    const std::string mediaType = TextUtils::NormalizeMediaType(artifact.mediaType);
    const domain::FormatExtractor* extractor = resolve(mediaType);
    if (!extractor) {
        throw GatewayError(ErrorKind::UnsupportedFormat, "extraction",
                           "Unsupported media type: " + (artifact.mediaType.empty() ? std::string("<none>") : artifact.mediaType));
    }

    domain::ExtractedText result;
    try {
        if (extractor->requiresStaging()) {
            auto staged = m_staging->stage(artifact.bytes, SafeSuffix(artifact.name));
            result = extractor->extract(artifact, staged->path());
        } else {
            result = extractor->extract(artifact, {});
        }
    } catch (const GatewayError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[ExtractionDispatcher] " << extractor->method() << " failed for " << mediaType << ": " << e.what() << std::endl;
        throw GatewayError(ErrorKind::ExtractionFailure, extractor->method(),
                           "Failed to process file (" + mediaType + "): " + e.what());
    }

    result.mediaType = mediaType;
    result.sourceName = artifact.name;
    if (result.method.empty()) result.method = extractor->method();
    return result;
}

} // namespace promptwarden::application
