/**
 * @file RuleScanners.hpp
 * @brief Deterministic scanners with no model dependency.
 */

#pragma once

#include <cstdint>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "domain/Scanner.hpp"

namespace promptwarden::application::scanners {

/**
 * @class RegexScanner
 * @brief Case-insensitive search for any of a list of patterns.
 *
 * BLOCK triggers on the first match. REDACT replaces every match with "[REDACTED]".
 * std::regex backtracks recursively, so texts above kMaxInputBytes are refused
 * with std::length_error instead of being searched; a "max_bytes" limiter
 * ranked ahead of this scanner keeps that from happening in practice.
 */
class RegexScanner : public domain::Scanner {
public:
    static constexpr size_t kMaxInputBytes = 32768;

    /** @throws std::invalid_argument if a pattern does not compile or the list is empty. */
    explicit RegexScanner(const std::vector<std::string>& patterns);

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

private:
    struct Pattern {
        std::string source;
        std::regex regex;
    };
    std::vector<Pattern> m_patterns;
};

/**
 * @class InvisibleTextScanner
 * @brief Detects zero-width, bidi-control, tag, format and private-use code points.
 */
class InvisibleTextScanner : public domain::Scanner {
public:
    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

    static bool IsInvisible(std::uint32_t cp);
};

/**
 * @class TokenLimitScanner
 * @brief Rejects (or truncates) texts whose estimated token count exceeds a limit.
 *
 * A whitespace-separated chunk of n bytes counts as max(1, ceil(n / 4)) tokens.
 */
class TokenLimitScanner : public domain::Scanner {
public:
    explicit TokenLimitScanner(size_t limit);

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

    static size_t EstimateTokens(const std::string& text);

private:
    size_t m_limit;
};

/**
 * @class ByteLimitScanner
 * @brief Rejects (or truncates) texts longer than a byte budget.
 *
 * REDACT cuts at the last UTF-8 character boundary within the budget.
 */
class ByteLimitScanner : public domain::Scanner {
public:
    explicit ByteLimitScanner(size_t maxBytes);

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

private:
    size_t m_maxBytes;
};

/**
 * @class LanguageScanner
 * @brief Flags text whose detected language is not in the allowed set.
 *
 * Detection counts stop words for en/es/pt/fr/de/it and checks for non-Latin
 * scripts. Texts with fewer than three words, or with no signal at all, pass.
 */
class LanguageScanner : public domain::Scanner {
public:
    explicit LanguageScanner(std::vector<std::string> validLanguages);

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

    /** @brief Best-guess language code, "" when undetermined. */
    static std::string Detect(const std::string& text);

private:
    std::set<std::string> m_valid;
};

} // namespace promptwarden::application::scanners
