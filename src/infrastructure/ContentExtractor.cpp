/**
 * @file ContentExtractor.cpp
 * @brief Implementation of the document, spreadsheet, image and text extractors.
 */

#include "infrastructure/ContentExtractor.hpp"
#include "domain/GatewayError.hpp"
#include "infrastructure/CommandRunner.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include "domain/TextUtils.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace promptwarden::infrastructure {

using domain::ErrorKind;
using domain::GatewayError;
using domain::TextUtils;

namespace {

void RequireTool(const std::string& tool, const std::string& stage) {
    if (!CommandRunner::HasTool(tool)) {
        throw GatewayError(ErrorKind::ExtractionFailure, stage, tool + " is not installed on the gateway host.");
    }
}

std::string RunPdfToText(const std::filesystem::path& pdf) {
    auto result = CommandRunner::Run("pdftotext -enc UTF-8 " + CommandRunner::Quote(pdf.string()) + " - 2>/dev/null");
    if (result.exitCode != 0) {
        throw GatewayError(ErrorKind::ExtractionFailure, "pdftotext",
                           "pdftotext failed with exit code " + std::to_string(result.exitCode) + " (damaged or encrypted PDF?)");
    }
    return result.output;
}

std::vector<std::vector<std::string>> ParseDelimited(const std::string& data, char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;

    auto endRecord = [&]() {
        record.push_back(field);
        field.clear();
        const bool blankLine = record.size() == 1 && record[0].empty() && !fieldQuoted;
        if (!blankLine) records.push_back(record);
        record.clear();
        fieldQuoted = false;
    };

    size_t i = 0;
    if (data.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < data.size(); ++i) {
        const char c = data[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && field.empty() && !fieldQuoted) {
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            record.push_back(field);
            field.clear();
            fieldQuoted = false;
        } else if (c == '\r') {
            if (i + 1 < data.size() && data[i + 1] == '\n') ++i;
            endRecord();
        } else if (c == '\n') {
            endRecord();
        } else {
            field.push_back(c);
        }
    }

    if (inQuotes) {
        throw std::runtime_error("Unterminated quoted field in delimited data");
    }
    if (!field.empty() || !record.empty() || fieldQuoted) {
        endRecord();
    }
    return records;
}

std::string DecodeXmlEntity(const std::string& entity) {
    if (entity == "amp") return "&";
    if (entity == "lt") return "<";
    if (entity == "gt") return ">";
    if (entity == "quot") return "\"";
    if (entity == "apos") return "'";
    if (entity.size() > 1 && entity[0] == '#') {
        try {
            unsigned long cp = (entity[1] == 'x' || entity[1] == 'X')
                ? std::stoul(entity.substr(2), nullptr, 16)
                : std::stoul(entity.substr(1), nullptr, 10);
            if (cp > 0x10FFFF) cp = TextUtils::kReplacementChar;
            std::string out;
            TextUtils::AppendUtf8(out, static_cast<std::uint32_t>(cp));
            return out;
        } catch (const std::exception&) {
            return "&" + entity + ";";
        }
    }
    return "&" + entity + ";";
}

} // namespace

// ---------------------------------------------------------------------------
// PDF

domain::ExtractedText PdfTextExtractor::extract(const domain::Artifact& artifact,
                                                const std::filesystem::path& stagedPath) const {
    RequireTool("pdftotext", method());

    domain::ExtractedText result;
    std::string content = RunPdfToText(stagedPath);
    if (TextUtils::HasSubstance(content)) {
        result.text = TextUtils::SanitizeUtf8(content);
        result.method = "pdftotext";
        return result;
    }

    // Image-only PDF: add a text layer into a sibling transient file.
    if (CommandRunner::HasTool("ocrmypdf")) {
        std::cout << "[PdfTextExtractor] No text layer in " << artifact.name << ", running ocrmypdf..." << std::endl;
        ScopedTempFile ocrPdf(stagedPath.parent_path(), "_ocr.pdf");
        std::string cmd = "ocrmypdf --jobs 4 --output-type pdf " + CommandRunner::Quote(stagedPath.string()) +
                          " " + CommandRunner::Quote(ocrPdf.path().string()) + " 2>&1";
        int exitCode = CommandRunner::RunWithCallback(cmd, [](const std::string& line) {
            if (line.find("Page") != std::string::npos || line.find("Scanning") != std::string::npos) {
                std::cout << "[PdfTextExtractor][OCR] " << line << std::endl;
            }
        });
        if (exitCode == 0) {
            std::string ocrContent = RunPdfToText(ocrPdf.path());
            if (TextUtils::HasSubstance(ocrContent)) {
                result.text = TextUtils::SanitizeUtf8(ocrContent);
                result.method = "ocr-hybrid (ocrmypdf)";
                result.warnings.push_back("Content extracted via OCR hybrid pipeline. Recognition errors possible.");
                return result;
            }
        } else {
            result.warnings.push_back("ocrmypdf failed to process the file.");
        }
    }

    result.text = TextUtils::SanitizeUtf8(content);
    result.method = "pdftotext";
    result.warnings.push_back("PDF has little or no extractable text.");
    return result;
}

// ---------------------------------------------------------------------------
// DOCX

std::string DocxTextExtractor::DocumentXmlToText(const std::string& xml) {
    std::string out;
    bool inText = false;
    bool inTabStops = false;
    size_t i = 0;
    while (i < xml.size()) {
        if (xml[i] == '<') {
            size_t close = xml.find('>', i);
            if (close == std::string::npos) break;
            const std::string tag = xml.substr(i + 1, close - i - 1);
            const bool closing = !tag.empty() && tag[0] == '/';
            const bool selfClosing = !tag.empty() && tag.back() == '/';
            const size_t start = closing ? 1 : 0;
            const size_t end = tag.find_first_of(" \t\r\n/", start);
            const std::string name = tag.substr(start, end == std::string::npos ? std::string::npos : end - start);

            if (name == "w:t") {
                inText = !closing && !selfClosing;
            } else if (name == "w:tabs") {
                inTabStops = !closing && !selfClosing;
            } else if (name == "w:p" && (closing || selfClosing)) {
                out += "\n\n";
            } else if (name == "w:tab" && !closing && !inTabStops) {
                out += "\t";
            } else if ((name == "w:br" || name == "w:cr") && !closing) {
                out += "\n";
            }
            i = close + 1;
        } else if (xml[i] == '&') {
            size_t semi = xml.find(';', i);
            if (semi == std::string::npos || semi - i > 10) {
                if (inText) out.push_back('&');
                ++i;
                continue;
            }
            if (inText) out += DecodeXmlEntity(xml.substr(i + 1, semi - i - 1));
            i = semi + 1;
        } else {
            if (inText) out.push_back(xml[i]);
            ++i;
        }
    }
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) out.pop_back();
    return out;
}

domain::ExtractedText DocxTextExtractor::extract(const domain::Artifact& artifact,
                                                 const std::filesystem::path& stagedPath) const {
    (void)artifact;
    RequireTool("unzip", method());

    auto xml = CommandRunner::Run("unzip -p " + CommandRunner::Quote(stagedPath.string()) + " word/document.xml 2>/dev/null");
    if (xml.exitCode != 0 || xml.output.empty()) {
        throw GatewayError(ErrorKind::ExtractionFailure, method(), "Not a valid word-processing package (word/document.xml missing).");
    }

    domain::ExtractedText result;
    result.text = TextUtils::SanitizeUtf8(DocumentXmlToText(xml.output));
    result.method = method();
    return result;
}

// ---------------------------------------------------------------------------
// CSV

domain::ExtractedText CsvRowsExtractor::extract(const domain::Artifact& artifact,
                                                const std::filesystem::path& stagedPath) const {
    (void)stagedPath;
    auto records = ParseDelimited(TextUtils::SanitizeUtf8(artifact.bytes), m_delimiter);

    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    if (!records.empty()) {
        const auto& header = records.front();
        for (size_t r = 1; r < records.size(); ++r) {
            const auto& cells = records[r];
            nlohmann::ordered_json row = nlohmann::ordered_json::object();
            for (size_t c = 0; c < header.size(); ++c) {
                row[header[c]] = c < cells.size() ? cells[c] : std::string();
            }
            for (size_t c = header.size(); c < cells.size(); ++c) {
                row["_" + std::to_string(c)] = cells[c];
            }
            rows.push_back(std::move(row));
        }
    }

    domain::ExtractedText result;
    result.text = rows.dump(2);
    result.method = method();
    if (records.size() <= 1) {
        result.warnings.push_back("No data rows found.");
    }
    return result;
}

// ---------------------------------------------------------------------------
// Images

domain::ExtractedText OcrImageExtractor::extract(const domain::Artifact& artifact,
                                                 const std::filesystem::path& stagedPath) const {
    RequireTool("tesseract", method());

    auto ocr = CommandRunner::Run("tesseract " + CommandRunner::Quote(stagedPath.string()) +
                                  " stdout -l " + CommandRunner::Quote(m_language) + " 2>/dev/null");
    if (ocr.exitCode != 0) {
        throw GatewayError(ErrorKind::ExtractionFailure, method(),
                           "OCR failed for " + artifact.name + " (exit code " + std::to_string(ocr.exitCode) + ")");
    }

    domain::ExtractedText result;
    result.text = TextUtils::SanitizeUtf8(ocr.output);
    result.method = method();
    if (!TextUtils::HasSubstance(result.text)) {
        result.warnings.push_back("OCR produced little or no text.");
    }
    return result;
}

// ---------------------------------------------------------------------------
// Plain text

domain::ExtractedText PlainTextExtractor::extract(const domain::Artifact& artifact,
                                                  const std::filesystem::path& stagedPath) const {
    (void)stagedPath;
    domain::ExtractedText result;
    std::string bytes = artifact.bytes;
    if (bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        bytes.erase(0, 3);   // byte order mark
    }
    result.text = TextUtils::SanitizeUtf8(bytes);
    result.method = method();
    if (result.text != bytes) {
        result.warnings.push_back("Invalid UTF-8 sequences were replaced.");
    }
    return result;
}

} // namespace promptwarden::infrastructure
