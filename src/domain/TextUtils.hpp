/**
 * @file TextUtils.hpp
 * @brief UTF-8 decoding and small string helpers shared by extractors and scanners.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace promptwarden::domain {

/**
 * @struct CodePoint
 * @brief One decoded code point and where its bytes live in the source string.
 */
struct CodePoint {
    std::uint32_t value = 0;
    size_t offset = 0;
    size_t length = 0;
    bool valid = true;   ///< False for a malformed byte (value holds the raw byte).
};

class TextUtils {
public:
    static constexpr std::uint32_t kReplacementChar = 0xFFFD;

    /** @brief Decodes @p input; malformed bytes become single invalid entries. */
    static std::vector<CodePoint> DecodeUtf8(const std::string& input);

    /** @brief Returns @p input with every malformed sequence replaced by U+FFFD. */
    static std::string SanitizeUtf8(const std::string& input);

    static void AppendUtf8(std::string& out, std::uint32_t cp);

    static std::string ToLower(const std::string& input);

    /** @brief Strips parameters and whitespace and lowercases a media type. */
    static std::string NormalizeMediaType(const std::string& mediaType);

    static std::string Trim(const std::string& input);

    /** @brief True if @p content has at least @p minChars non-whitespace characters. */
    static bool HasSubstance(const std::string& content, size_t minChars = 10);
};

} // namespace promptwarden::domain
