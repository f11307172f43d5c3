/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */

#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace promptwarden::domain {

std::vector<CodePoint> TextUtils::DecodeUtf8(const std::string& input) {
    std::vector<CodePoint> out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        const unsigned char lead = static_cast<unsigned char>(input[i]);
        CodePoint cp;
        cp.offset = i;

        size_t extra = 0;
        std::uint32_t value = 0;
        std::uint32_t minValue = 0;
        if (lead < 0x80U) {
            cp.value = lead;
            cp.length = 1;
            out.push_back(cp);
            ++i;
            continue;
        } else if ((lead & 0xE0U) == 0xC0U) {
            extra = 1; value = lead & 0x1FU; minValue = 0x80;
        } else if ((lead & 0xF0U) == 0xE0U) {
            extra = 2; value = lead & 0x0FU; minValue = 0x800;
        } else if ((lead & 0xF8U) == 0xF0U) {
            extra = 3; value = lead & 0x07U; minValue = 0x10000;
        }

        bool ok = extra > 0 && i + extra < input.size();
        if (ok) {
            for (size_t k = 1; k <= extra; ++k) {
                const unsigned char cont = static_cast<unsigned char>(input[i + k]);
                if ((cont & 0xC0U) != 0x80U) {
                    ok = false;
                    break;
                }
                value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
            }
        }
        if (ok && (value < minValue || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))) {
            ok = false;
        }

        if (ok) {
            cp.value = value;
            cp.length = extra + 1;
            i += extra + 1;
        } else {
            cp.value = lead;
            cp.length = 1;
            cp.valid = false;
            ++i;
        }
        out.push_back(cp);
    }
    return out;
}

std::string TextUtils::SanitizeUtf8(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (const auto& cp : DecodeUtf8(input)) {
        if (cp.valid) {
            out.append(input, cp.offset, cp.length);
        } else {
            AppendUtf8(out, kReplacementChar);
        }
    }
    return out;
}

void TextUtils::AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string TextUtils::ToLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string TextUtils::NormalizeMediaType(const std::string& mediaType) {
    std::string base = mediaType.substr(0, mediaType.find(';'));
    return ToLower(Trim(base));
}

std::string TextUtils::Trim(const std::string& input) {
    size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
    size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
    return input.substr(start, end - start);
}

bool TextUtils::HasSubstance(const std::string& content, size_t minChars) {
    size_t nonWhitespace = 0;
    for (char c : content) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            ++nonWhitespace;
            if (nonWhitespace >= minChars) return true;
        }
    }
    return false;
}

} // namespace promptwarden::domain
