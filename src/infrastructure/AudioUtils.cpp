#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <SDL.h>

#include <fstream>
#include <iterator>

namespace promptwarden::infrastructure {

namespace fs = std::filesystem;

namespace {

// Pushes the decoded WAV through an SDL audio stream to reach float32 mono at 16 kHz.
bool Resample(const SDL_AudioSpec& spec, const Uint8* buffer, Uint32 length, PcmAudio& audio, std::string& error) {
    SDL_AudioStream* stream = SDL_NewAudioStream(spec.format, spec.channels, spec.freq,
                                                 AUDIO_F32SYS, 1, PcmAudio::kSampleRate);
    if (!stream) {
        error = "SDL_NewAudioStream failed: " + std::string(SDL_GetError());
        return false;
    }

    if (SDL_AudioStreamPut(stream, buffer, static_cast<int>(length)) < 0 || SDL_AudioStreamFlush(stream) < 0) {
        error = "Audio resampling failed: " + std::string(SDL_GetError());
        SDL_FreeAudioStream(stream);
        return false;
    }

    const int available = SDL_AudioStreamAvailable(stream);
    audio.samples.assign(static_cast<size_t>(available) / sizeof(float), 0.0f);
    const int got = SDL_AudioStreamGet(stream, audio.samples.data(), available);
    SDL_FreeAudioStream(stream);

    if (got < 0) {
        error = "Audio resampling failed: " + std::string(SDL_GetError());
        audio.samples.clear();
        return false;
    }
    audio.samples.resize(static_cast<size_t>(got) / sizeof(float));
    return true;
}

} // namespace

bool AudioUtils::DecodeWav(const std::string& bytes, PcmAudio& audio, std::string& error) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        error = "Not a RIFF/WAVE payload.";
        return false;
    }

    SDL_RWops* rw = SDL_RWFromConstMem(bytes.data(), static_cast<int>(bytes.size()));
    if (!rw) {
        error = "SDL_RWFromConstMem failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioSpec spec;
    Uint8* buffer = nullptr;
    Uint32 length = 0;
    // freesrc = 1: SDL closes rw whether or not loading succeeds.
    if (SDL_LoadWAV_RW(rw, 1, &spec, &buffer, &length) == nullptr) {
        error = "SDL_LoadWAV_RW failed: " + std::string(SDL_GetError());
        return false;
    }

    const bool ok = Resample(spec, buffer, length, audio, error);
    SDL_FreeWAV(buffer);
    if (ok && audio.samples.empty()) {
        error = "Recording contains no audio samples.";
        return false;
    }
    return ok;
}

bool AudioUtils::DecodeWavFile(const fs::path& path, PcmAudio& audio, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open audio file: " + path.string();
        return false;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return DecodeWav(bytes, audio, error);
}

bool AudioUtils::TranscodeToWav(const fs::path& inputPath, const fs::path& outputPath, std::string& error) {
    if (!CommandRunner::HasTool("ffmpeg")) {
        error = "ffmpeg is not installed; only WAV recordings can be transcribed.";
        return false;
    }

    std::string cmd = "ffmpeg -y -loglevel error -i " + CommandRunner::Quote(inputPath.string()) +
                      " -ar " + std::to_string(PcmAudio::kSampleRate) + " -ac 1 -c:a pcm_s16le " +
                      CommandRunner::Quote(outputPath.string()) + " 2>/dev/null";

    auto result = CommandRunner::Run(cmd);
    if (result.exitCode != 0) {
        error = "ffmpeg could not decode the recording (exit code " + std::to_string(result.exitCode) + ").";
        return false;
    }
    if (!fs::exists(outputPath)) {
        error = "Transcoded audio not found: " + outputPath.string();
        return false;
    }
    return true;
}

} // namespace promptwarden::infrastructure
