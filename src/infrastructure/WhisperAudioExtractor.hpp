/**
 * @file WhisperAudioExtractor.hpp
 * @brief Speech-to-text extraction for audio attachments using whisper.cpp.
 */

#pragma once

#include "domain/FormatExtractor.hpp"
#include <mutex>
#include <vector>
#include <string>

struct whisper_context;

namespace promptwarden::infrastructure {

/**
 * @class WhisperAudioExtractor
 * @brief Transcribes audio/* artifacts. The model is loaded once by initialize().
 *
 * A whisper context is not safe for parallel inference, so transcriptions are
 * serialized through m_mutex. The context is never reloaded after startup.
 */
class WhisperAudioExtractor : public domain::FormatExtractor {
public:
    WhisperAudioExtractor(std::string modelPath, std::string language = "en");
    ~WhisperAudioExtractor() override;

    WhisperAudioExtractor(const WhisperAudioExtractor&) = delete;
    WhisperAudioExtractor& operator=(const WhisperAudioExtractor&) = delete;

    /** @brief Loads the ggml model. Returns false (and logs) if unavailable. */
    bool initialize();

    std::string method() const override { return "whisper"; }
    domain::ExtractedText extract(const domain::Artifact& artifact,
                                  const std::filesystem::path& stagedPath) const override;

private:
    std::string transcribe(const std::vector<float>& pcmf32) const;

    std::string m_modelPath;
    std::string m_language;
    whisper_context* m_ctx = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace promptwarden::infrastructure
