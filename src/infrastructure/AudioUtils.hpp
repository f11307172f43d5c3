#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace promptwarden::infrastructure {

/** @brief 16 kHz mono float samples, the input format whisper.cpp expects. */
struct PcmAudio {
    static constexpr int kSampleRate = 16000;

    std::vector<float> samples;

    double durationSec() const { return static_cast<double>(samples.size()) / kSampleRate; }
};

/**
 * @brief Audio decoding for uploaded recordings.
 */
class AudioUtils {
public:
    /**
     * @brief Decodes an in-memory RIFF/WAV payload and resamples it to PcmAudio.
     * @param bytes Raw upload bytes.
     * @param audio Receives the samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool DecodeWav(const std::string& bytes, PcmAudio& audio, std::string& error);

    /** @brief Same as DecodeWav() for a file on disk. */
    static bool DecodeWavFile(const std::filesystem::path& path, PcmAudio& audio, std::string& error);

    /**
     * @brief Transcodes any ffmpeg-readable recording to 16 kHz mono PCM WAV.
     * @return False (with @p error set) if ffmpeg is missing or fails.
     */
    static bool TranscodeToWav(const std::filesystem::path& inputPath, const std::filesystem::path& outputPath, std::string& error);
};

} // namespace promptwarden::infrastructure
