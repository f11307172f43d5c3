/**
 * @file WhisperAudioExtractor.cpp
 * @brief Implementation of the WhisperAudioExtractor class.
 */
#include "infrastructure/WhisperAudioExtractor.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include "domain/TextUtils.hpp"
#include "domain/GatewayError.hpp"
#include "whisper.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

namespace promptwarden::infrastructure {

using domain::ErrorKind;
using domain::GatewayError;
using domain::TextUtils;

namespace {

bool IsWavType(const std::string& mediaType) {
    return mediaType == "audio/wav" || mediaType == "audio/x-wav" || mediaType == "audio/wave" || mediaType == "audio/vnd.wave";
}

} // namespace

WhisperAudioExtractor::WhisperAudioExtractor(std::string modelPath, std::string language)
    : m_modelPath(std::move(modelPath))
    , m_language(std::move(language))
{
}

WhisperAudioExtractor::~WhisperAudioExtractor() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperAudioExtractor::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_ctx) return true;

    if (!std::filesystem::exists(m_modelPath)) {
        std::cerr << "[WhisperAudioExtractor] Model not found at " << m_modelPath
                  << ". Audio attachments will be rejected (download a ggml model, e.g. ggml-base.bin)." << std::endl;
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);
    if (!m_ctx) {
        std::cerr << "[WhisperAudioExtractor] Failed to initialize whisper context from " << m_modelPath << std::endl;
        return false;
    }

    std::cout << "[WhisperAudioExtractor] Loaded model " << m_modelPath << std::endl;
    return true;
}

std::string WhisperAudioExtractor::transcribe(const std::vector<float>& pcmf32) const {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.language = m_language.c_str();
    wparams.n_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        throw GatewayError(ErrorKind::ExtractionFailure, method(), "Whisper inference failed.");
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(m_ctx, i);
        if (!result.empty()) result += " ";
        result += TextUtils::Trim(text ? text : "");
    }
    return result;
}

domain::ExtractedText WhisperAudioExtractor::extract(const domain::Artifact& artifact,
                                                     const std::filesystem::path& stagedPath) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_ctx) {
        throw GatewayError(ErrorKind::ExtractionFailure, method(), "Transcription model is not loaded.");
    }

    const std::string mediaType = TextUtils::NormalizeMediaType(artifact.mediaType);
    PcmAudio audio;
    std::string error;
    bool loaded = false;

    if (IsWavType(mediaType)) {
        loaded = AudioUtils::DecodeWav(artifact.bytes, audio, error);
    }

    // Compressed audio, or a recording labelled WAV that is not RIFF: resample with ffmpeg.
    if (!loaded) {
        ScopedTempFile wav(stagedPath.parent_path(), "_16k.wav");
        std::string convError;
        if (!AudioUtils::TranscodeToWav(stagedPath, wav.path(), convError)) {
            throw GatewayError(ErrorKind::ExtractionFailure, method(), error.empty() ? convError : error + "; " + convError);
        }
        if (!AudioUtils::DecodeWavFile(wav.path(), audio, error)) {
            throw GatewayError(ErrorKind::ExtractionFailure, method(), "Failed to load audio: " + error);
        }
    }

    std::cout << "[WhisperAudioExtractor] Transcribing " << audio.durationSec() << " s of audio from "
              << (artifact.name.empty() ? std::string("upload") : artifact.name) << std::endl;

    domain::ExtractedText result;
    result.text = TextUtils::SanitizeUtf8(transcribe(audio.samples));
    result.method = method();
    if (result.text.empty()) {
        result.warnings.push_back("No speech recognized.");
    }
    return result;
}

} // namespace promptwarden::infrastructure
