#include "application/scanners/RuleScanners.hpp"
#include "domain/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>

namespace promptwarden::application::scanners {

using domain::ScanAction;
using domain::ScannerSpec;
using domain::ScanOutcome;
using domain::TextUtils;

namespace {

ScanOutcome MakeOutcome(const ScannerSpec& spec, const std::string& text) {
    ScanOutcome outcome;
    outcome.scannerName = spec.name;
    outcome.action = spec.action;
    outcome.text = text;
    return outcome;
}

// --- Language tables ---

const std::map<std::string, std::set<std::string>>& StopWords() {
    static const std::map<std::string, std::set<std::string>> kStopWords = {
        {"en", {"the", "and", "is", "are", "was", "were", "to", "of", "in", "that", "it", "you",
                "for", "on", "with", "as", "this", "be", "have", "what", "how", "i", "my", "your",
                "not", "can", "do", "a", "an", "me", "please", "will", "would", "should"}},
        {"es", {"el", "la", "los", "las", "de", "que", "y", "en", "un", "una", "es", "por", "para",
                "con", "no", "se", "su", "al", "lo", "como", "cómo", "qué", "más", "pero", "mi",
                "tu", "está", "este", "esta", "puedo", "hacer"}},
        {"pt", {"o", "os", "as", "de", "que", "e", "em", "um", "uma", "é", "para", "com", "não",
                "se", "do", "da", "dos", "das", "no", "na", "por", "mais", "como", "mas", "você",
                "está", "isso", "meu", "posso", "fazer"}},
        {"fr", {"le", "la", "les", "de", "des", "et", "est", "un", "une", "en", "que", "qui", "pour",
                "dans", "pas", "ne", "je", "vous", "il", "elle", "sur", "avec", "ce", "cette", "du",
                "au", "comment", "faire"}},
        {"de", {"der", "die", "das", "und", "ist", "nicht", "ein", "eine", "zu", "den", "von", "mit",
                "sich", "des", "auf", "für", "ich", "sie", "es", "wie", "was", "dem", "im", "auch",
                "wir", "kann"}},
        {"it", {"il", "lo", "la", "gli", "le", "di", "che", "e", "è", "un", "una", "per", "non", "con",
                "sono", "come", "mi", "ti", "si", "del", "della", "questo", "ma", "anche", "ho",
                "posso", "fare"}},
    };
    return kStopWords;
}

/** @brief Script label for letters outside the Latin blocks, "" for Latin or non-letters. */
std::string ScriptOf(std::uint32_t cp) {
    if (cp >= 0x0370 && cp <= 0x03FF) return "greek-script";
    if (cp >= 0x0400 && cp <= 0x04FF) return "cyrillic-script";
    if (cp >= 0x0590 && cp <= 0x05FF) return "hebrew-script";
    if (cp >= 0x0600 && cp <= 0x06FF) return "arabic-script";
    if (cp >= 0x0900 && cp <= 0x097F) return "devanagari-script";
    if (cp >= 0x0E00 && cp <= 0x0E7F) return "thai-script";
    if (cp >= 0x3040 && cp <= 0x30FF) return "japanese-script";
    if (cp >= 0x4E00 && cp <= 0x9FFF) return "cjk-script";
    if (cp >= 0xAC00 && cp <= 0xD7AF) return "hangul-script";
    return "";
}

bool IsWordChar(std::uint32_t cp) {
    if (cp < 0x80) return std::isalnum(static_cast<unsigned char>(cp)) != 0 || cp == '\'';
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    return cp >= 0xC0;
}

std::uint32_t FoldCase(std::uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;
    return cp;
}

} // namespace

// --- RegexScanner ---

RegexScanner::RegexScanner(const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        throw std::invalid_argument("regex scanner needs at least one pattern");
    }
    for (const auto& source : patterns) {
        try {
            m_patterns.push_back({source, std::regex(source, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("invalid pattern '" + source + "': " + e.what());
        }
    }
}

ScanOutcome RegexScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    if (text.size() > kMaxInputBytes) {
        throw std::length_error("text of " + std::to_string(text.size()) + " bytes exceeds the " +
                                std::to_string(kMaxInputBytes) + "-byte pattern search limit");
    }
    ScanOutcome outcome = MakeOutcome(spec, text);

    std::vector<std::string> matched;
    for (const auto& pattern : m_patterns) {
        if (std::regex_search(text, pattern.regex)) {
            matched.push_back(pattern.source);
            if (spec.action == ScanAction::Block) break;
        }
    }
    if (matched.empty()) return outcome;

    outcome.triggered = true;
    outcome.reason = "matched pattern: " + matched.front();
    if (matched.size() > 1) {
        outcome.reason += " (+" + std::to_string(matched.size() - 1) + " more)";
    }

    if (spec.action == ScanAction::Redact) {
        std::string redacted = text;
        for (const auto& pattern : m_patterns) {
            redacted = std::regex_replace(redacted, pattern.regex, "[REDACTED]");
        }
        outcome.text = redacted;
    }
    return outcome;
}

// --- InvisibleTextScanner ---

bool InvisibleTextScanner::IsInvisible(std::uint32_t cp) {
    if (cp == 0x00AD || cp == 0x061C || cp == 0x180E) return true;        // soft hyphen, ALM, MVS
    if (cp >= 0x200B && cp <= 0x200F) return true;                        // zero-width, LRM/RLM
    if (cp >= 0x202A && cp <= 0x202E) return true;                        // bidi embeddings/overrides
    if (cp >= 0x2060 && cp <= 0x2064) return true;                        // word joiner, invisible operators
    if (cp >= 0x2066 && cp <= 0x206F) return true;                        // bidi isolates, deprecated format
    if (cp == 0xFEFF) return true;
    if (cp >= 0xFFF9 && cp <= 0xFFFB) return true;                        // interlinear annotation
    if (cp >= 0x1D173 && cp <= 0x1D17A) return true;                      // musical format controls
    if (cp >= 0xE0000 && cp <= 0xE007F) return true;                      // tags
    if (cp >= 0xE000 && cp <= 0xF8FF) return true;                        // private use
    if (cp >= 0xF0000 && cp <= 0xFFFFD) return true;
    if (cp >= 0x100000 && cp <= 0x10FFFD) return true;
    return false;
}

ScanOutcome InvisibleTextScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    ScanOutcome outcome = MakeOutcome(spec, text);

    size_t found = 0;
    std::string stripped;
    stripped.reserve(text.size());
    for (const auto& cp : TextUtils::DecodeUtf8(text)) {
        if (cp.valid && IsInvisible(cp.value)) {
            ++found;
            continue;
        }
        stripped.append(text, cp.offset, cp.length);
    }

    if (found == 0) return outcome;

    outcome.triggered = true;
    outcome.reason = "found " + std::to_string(found) + " invisible character(s)";
    if (spec.action == ScanAction::Redact) {
        outcome.text = stripped;
    }
    return outcome;
}

// --- TokenLimitScanner ---

TokenLimitScanner::TokenLimitScanner(size_t limit)
    : m_limit(limit)
{
    if (m_limit == 0) {
        throw std::invalid_argument("token limit must be positive");
    }
}

size_t TokenLimitScanner::EstimateTokens(const std::string& text) {
    size_t tokens = 0;
    std::istringstream iss(text);
    std::string chunk;
    while (iss >> chunk) {
        tokens += std::max<size_t>(1, (chunk.size() + 3) / 4);
    }
    return tokens;
}

ScanOutcome TokenLimitScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    ScanOutcome outcome = MakeOutcome(spec, text);

    const size_t tokens = EstimateTokens(text);
    if (tokens <= m_limit) return outcome;

    outcome.triggered = true;
    outcome.reason = "estimated " + std::to_string(tokens) + " tokens exceeds limit " + std::to_string(m_limit);

    if (spec.action == ScanAction::Redact) {
        // Keep whole chunks up to the limit, preserving the original spacing.
        size_t used = 0;
        size_t keepUntil = 0;
        size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            size_t start = i;
            while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            if (start == i) break;
            size_t cost = std::max<size_t>(1, (i - start + 3) / 4);
            if (used + cost > m_limit) break;
            used += cost;
            keepUntil = i;
        }
        outcome.text = text.substr(0, keepUntil);
    }
    return outcome;
}

// --- ByteLimitScanner ---

ByteLimitScanner::ByteLimitScanner(size_t maxBytes)
    : m_maxBytes(maxBytes)
{
    if (m_maxBytes == 0) {
        throw std::invalid_argument("byte limit must be positive");
    }
}

ScanOutcome ByteLimitScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    ScanOutcome outcome = MakeOutcome(spec, text);
    if (text.size() <= m_maxBytes) return outcome;

    outcome.triggered = true;
    outcome.reason = std::to_string(text.size()) + " bytes exceeds limit " + std::to_string(m_maxBytes);

    if (spec.action == ScanAction::Redact) {
        // Never split a multi-byte sequence: back up over continuation bytes.
        size_t cut = m_maxBytes;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        outcome.text = text.substr(0, cut);
    }
    return outcome;
}

// --- LanguageScanner ---

LanguageScanner::LanguageScanner(std::vector<std::string> validLanguages) {
    for (auto& lang : validLanguages) {
        m_valid.insert(TextUtils::ToLower(lang));
    }
    if (m_valid.empty()) {
        throw std::invalid_argument("language scanner needs at least one valid language");
    }
}

std::string LanguageScanner::Detect(const std::string& text) {
    std::vector<std::string> words;
    std::map<std::string, size_t> scriptLetters;
    size_t latinLetters = 0;

    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (const auto& cp : TextUtils::DecodeUtf8(text)) {
        if (!cp.valid || !IsWordChar(cp.value)) {
            flush();
            continue;
        }
        std::string script = ScriptOf(cp.value);
        if (!script.empty()) {
            ++scriptLetters[script];
        } else if (cp.value >= 0x41) {
            ++latinLetters;
        }
        TextUtils::AppendUtf8(current, FoldCase(cp.value));
    }
    flush();

    // A dominant non-Latin script decides on its own.
    std::string bestScript;
    size_t bestScriptCount = 0;
    for (const auto& [script, count] : scriptLetters) {
        if (count > bestScriptCount) {
            bestScript = script;
            bestScriptCount = count;
        }
    }
    if (bestScriptCount > latinLetters) {
        return bestScript;
    }

    if (words.size() < 3) return "";

    std::string best;
    size_t bestHits = 0;
    for (const auto& [lang, stopWords] : StopWords()) {
        size_t hits = 0;
        for (const auto& word : words) {
            if (stopWords.count(word)) ++hits;
        }
        // Ties go to English, then alphabetical order.
        if (hits > bestHits || (hits == bestHits && hits > 0 && lang == "en")) {
            best = lang;
            bestHits = hits;
        }
    }
    return best;
}

ScanOutcome LanguageScanner::evaluate(const std::string& text, const ScannerSpec& spec) const {
    ScanOutcome outcome = MakeOutcome(spec, text);

    const std::string detected = Detect(text);
    if (detected.empty() || m_valid.count(detected)) return outcome;

    outcome.triggered = true;
    outcome.reason = "detected language '" + detected + "' is not allowed";
    return outcome;
}

} // namespace promptwarden::application::scanners
