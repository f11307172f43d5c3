#include "application/scanners/PiiScanner.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace promptwarden::application::scanners {

using domain::ScanAction;
using domain::ScannerSpec;
using domain::ScanOutcome;

namespace {

std::string DigitsOnly(const std::string& s) {
    std::string digits;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    return digits;
}

bool IsAlnumAt(const std::string& text, size_t pos) {
    return pos < text.size() && std::isalnum(static_cast<unsigned char>(text[pos])) != 0;
}

bool CreditCardValid(const std::string& candidate) {
    std::string digits = DigitsOnly(candidate);
    return digits.size() >= 13 && digits.size() <= 19 && PiiScanner::LuhnValid(digits);
}

bool SsnValid(const std::string& candidate) {
    std::string area = candidate.substr(0, 3);
    if (area == "000" || area == "666" || area[0] == '9') return false;
    if (candidate.substr(4, 2) == "00") return false;
    return candidate.substr(7, 4) != "0000";
}

bool AlwaysValid(const std::string&) { return true; }

std::regex Compile(const char* pattern, bool icase = false) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    return std::regex(pattern, flags);
}

} // namespace

const std::vector<std::string>& PiiScanner::SupportedEntityTypes() {
    static const std::vector<std::string> kTypes = {
        "CREDIT_CARD", "US_SSN", "IBAN_CODE", "EMAIL_ADDRESS", "IP_ADDRESS", "CRYPTO", "PHONE_NUMBER"
    };
    return kTypes;
}

bool PiiScanner::LuhnValid(const std::string& digits) {
    if (digits.empty()) return false;
    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) return false;
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

bool PiiScanner::IbanValid(const std::string& candidate) {
    std::string compact;
    for (char c : candidate) {
        if (c != ' ') compact += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (compact.size() < 15 || compact.size() > 34) return false;

    // Move country code and check digits to the end, then mod-97 digit by digit.
    std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int remainder = 0;
    for (char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            int value = c - 'A' + 10;
            remainder = (remainder * 100 + value) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

PiiScanner::PiiScanner(const std::vector<std::string>& entityTypes) {
    const std::map<std::string, Recognizer> known = {
        {"CREDIT_CARD", {"CREDIT_CARD", Compile(R"(\b(?:\d[ -]?){12,18}\d\b)"), CreditCardValid}},
        {"US_SSN", {"US_SSN", Compile(R"(\b\d{3}-\d{2}-\d{4}\b)"), SsnValid}},
        {"IBAN_CODE", {"IBAN_CODE", Compile(R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,4})?\b)"), IbanValid}},
        {"EMAIL_ADDRESS", {"EMAIL_ADDRESS", Compile(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9-]+(?:\.[A-Za-z0-9-]+)*\.[A-Za-z]{2,})"), AlwaysValid}},
        {"IP_ADDRESS", {"IP_ADDRESS", Compile(R"(\b(?:(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3}(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\b)"), AlwaysValid}},
        {"CRYPTO", {"CRYPTO", Compile(R"(\b(?:bc1[a-z0-9]{25,39}|[13][a-km-zA-HJ-NP-Z1-9]{25,34})\b)"), AlwaysValid}},
        {"PHONE_NUMBER", {"PHONE_NUMBER", Compile(R"((?:\+\d{1,3}[ .-]?)?(?:\(\d{3}\)|\d{3})[ .-]?\d{3}[ .-]?\d{4}\b)"), AlwaysValid}},
    };

    // Recognizers run in the canonical order so overlaps resolve the same way
    // regardless of configuration order.
    for (const auto& type : SupportedEntityTypes()) {
        if (std::find(entityTypes.begin(), entityTypes.end(), type) != entityTypes.end()) {
            m_recognizers.push_back(known.at(type));
        }
    }
    for (const auto& type : entityTypes) {
        if (!known.count(type)) {
            throw std::invalid_argument("unknown PII entity type: " + type);
        }
    }
    if (m_recognizers.empty()) {
        throw std::invalid_argument("PII scanner needs at least one entity type");
    }
}

std::vector<PiiScanner::Match> PiiScanner::findEntities(const std::string& text) const {
    if (text.size() > kMaxInputBytes) {
        throw std::length_error("text of " + std::to_string(text.size()) + " bytes exceeds the " +
                                std::to_string(kMaxInputBytes) + "-byte entity search limit");
    }
    struct Candidate {
        Match match;
        size_t priority;
    };
    std::vector<Candidate> candidates;

    for (size_t r = 0; r < m_recognizers.size(); ++r) {
        const auto& recognizer = m_recognizers[r];
        auto begin = std::sregex_iterator(text.begin(), text.end(), recognizer.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            size_t start = static_cast<size_t>(it->position(0));
            size_t end = start + static_cast<size_t>(it->length(0));
            // Reject fragments of longer digit or word runs.
            if (start > 0 && IsAlnumAt(text, start - 1)) continue;
            if (IsAlnumAt(text, end)) continue;
            if (!recognizer.validate(it->str(0))) continue;
            candidates.push_back({{start, end, recognizer.entityType}, r});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.match.start != b.match.start) return a.match.start < b.match.start;
        size_t lenA = a.match.end - a.match.start;
        size_t lenB = b.match.end - b.match.start;
        if (lenA != lenB) return lenA > lenB;
        return a.priority < b.priority;
    });

    std::vector<Match> kept;
    size_t cursor = 0;
    for (const auto& candidate : candidates) {
        if (candidate.match.start < cursor) continue;
        kept.push_back(candidate.match);
        cursor = candidate.match.end;
    }
    return kept;
}

ScanOutcome PiiScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    ScanOutcome outcome;
    outcome.scannerName = spec.name;
    outcome.action = spec.action;
    outcome.text = text;

    const auto entities = findEntities(text);
    if (entities.empty()) return outcome;

    std::map<std::string, size_t> counts;
    for (const auto& entity : entities) ++counts[entity.entityType];

    outcome.triggered = true;
    for (const auto& [type, count] : counts) {
        if (!outcome.reason.empty()) outcome.reason += ", ";
        outcome.reason += type + " x" + std::to_string(count);
    }

    if (spec.action == ScanAction::Redact) {
        std::string redacted;
        size_t cursor = 0;
        for (const auto& entity : entities) {
            redacted.append(text, cursor, entity.start - cursor);
            redacted += "[REDACTED_" + entity.entityType + "]";
            cursor = entity.end;
        }
        redacted.append(text, cursor, std::string::npos);
        outcome.text = redacted;
    }
    return outcome;
}

} // namespace promptwarden::application::scanners
