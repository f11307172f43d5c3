/**
 * @file ContentExtractor.hpp
 * @brief Format extractors for documents, spreadsheets, images and plain text.
 */

#pragma once
#include <string>
#include "domain/FormatExtractor.hpp"

namespace promptwarden::infrastructure {

/**
 * @class PdfTextExtractor
 * @brief Full-text extraction through pdftotext, with an ocrmypdf pass for image-only PDFs.
 */
class PdfTextExtractor : public domain::FormatExtractor {
public:
    std::string method() const override { return "pdftotext"; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;
};

/**
 * @class DocxTextExtractor
 * @brief Raw text of a word-processing package (word/document.xml).
 */
class DocxTextExtractor : public domain::FormatExtractor {
public:
    std::string method() const override { return "docx-xml"; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;

    /** @brief Converts WordprocessingML to text. Exposed for tests. */
    static std::string DocumentXmlToText(const std::string& xml);
};

/**
 * @class CsvRowsExtractor
 * @brief Parses delimited text and renders rows as a JSON array of objects.
 *
 * The first record names the fields. Field order is preserved as read; short
 * rows are padded with empty strings and surplus cells are keyed "_<index>".
 */
class CsvRowsExtractor : public domain::FormatExtractor {
public:
    explicit CsvRowsExtractor(char delimiter = ',') : m_delimiter(delimiter) {}

    std::string method() const override { return "csv-rows"; }
    bool requiresStaging() const override { return false; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;

private:
    char m_delimiter;
};

/**
 * @class OcrImageExtractor
 * @brief Optical character recognition through the tesseract CLI.
 */
class OcrImageExtractor : public domain::FormatExtractor {
public:
    explicit OcrImageExtractor(std::string language = "eng") : m_language(std::move(language)) {}

    std::string method() const override { return "tesseract"; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;

private:
    std::string m_language;
};

/**
 * @class PlainTextExtractor
 * @brief UTF-8 pass-through; malformed sequences become U+FFFD.
 */
class PlainTextExtractor : public domain::FormatExtractor {
public:
    std::string method() const override { return "text-decode"; }
    bool requiresStaging() const override { return false; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;
};

} // namespace promptwarden::infrastructure
