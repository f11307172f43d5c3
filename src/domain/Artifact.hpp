/**
 * @file Artifact.hpp
 * @brief Uploaded attachment and the text derived from it.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace promptwarden::domain {

/**
 * @class Artifact
 * @brief Raw upload owned by exactly one extraction call.
 */
class Artifact {
public:
    std::string bytes;       ///< Raw payload, treated as opaque binary.
    std::string mediaType;   ///< Declared media type (e.g. "text/csv").
    std::string name;        ///< Original file name as supplied by the client.

    Artifact() = default;
    Artifact(std::string payload, std::string type, std::string originalName)
        : bytes(std::move(payload)), mediaType(std::move(type)), name(std::move(originalName)) {}
};

/**
 * @struct ExtractedText
 * @brief Text rendering of one Artifact. Never modified after extraction returns.
 */
struct ExtractedText {
    std::string text;
    std::string mediaType;   ///< Normalized media type used for dispatch.
    std::string method;      ///< "pdftotext", "csv-rows", "tesseract", "whisper", ...
    std::string sourceName;
    std::vector<std::string> warnings;

    bool operator==(const ExtractedText& other) const {
        return text == other.text && mediaType == other.mediaType &&
               method == other.method && sourceName == other.sourceName &&
               warnings == other.warnings;
    }
    bool operator!=(const ExtractedText& other) const { return !(*this == other); }
};

} // namespace promptwarden::domain
