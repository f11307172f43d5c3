/**
 * @file PiiScanner.hpp
 * @brief Pattern recognizers for personal data with placeholder redaction.
 */

#pragma once

#include <functional>
#include <regex>
#include <string>
#include <vector>

#include "domain/Scanner.hpp"

namespace promptwarden::application::scanners {

/**
 * @class PiiScanner
 * @brief Detects entity types such as EMAIL_ADDRESS or CREDIT_CARD.
 *
 * REDACT replaces each entity with "[REDACTED_<TYPE>]". Overlapping matches
 * keep the earliest, then the longest, span. Texts above kMaxInputBytes are
 * refused with std::length_error, as in RegexScanner.
 */
class PiiScanner : public domain::Scanner {
public:
    static constexpr size_t kMaxInputBytes = 32768;

    /** @brief Entity types recognized when none are configured. */
    static const std::vector<std::string>& SupportedEntityTypes();

    /** @throws std::invalid_argument for an unknown entity type. */
    explicit PiiScanner(const std::vector<std::string>& entityTypes = SupportedEntityTypes());

    domain::ScanOutcome evaluate(const std::string& text, const domain::ScannerSpec& spec) const override;

    struct Match {
        size_t start = 0;
        size_t end = 0;
        std::string entityType;
    };

    /** @brief Non-overlapping entity spans in text order. */
    std::vector<Match> findEntities(const std::string& text) const;

    static bool LuhnValid(const std::string& digits);
    static bool IbanValid(const std::string& candidate);

private:
    struct Recognizer {
        std::string entityType;
        std::regex regex;
        std::function<bool(const std::string&)> validate;
    };

    std::vector<Recognizer> m_recognizers;
};

} // namespace promptwarden::application::scanners
