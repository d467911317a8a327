#pragma once

#include "export.h"
#include "types.h"
#include <vector>

namespace huginn {

/**
 * @brief Speech segment with start/end times
 */
struct SpeechSegment {
    float start;    // Start time in seconds
    float end;      // End time in seconds

    SpeechSegment(float s = 0.0f, float e = 0.0f) : start(s), end(e) {}
};

/**
 * @brief Voice Activity Detection options
 */
struct VADOptions {
    bool enabled = true;                  // Gate chunks before recognition
    float threshold = 0.02f;              // RMS energy threshold (0.0-1.0)
    int min_speech_duration_ms = 250;     // Minimum speech duration to keep
    int min_silence_duration_ms = 500;    // Minimum silence to split segments
    int speech_pad_ms = 100;              // Padding around speech segments
    bool adaptive_threshold = true;       // Auto-adjust threshold based on noise floor
    float noise_floor_percentile = 0.1f;  // Percentile for noise floor estimation
    float silence_amplitude = 0.001f;     // Peak below this = digital silence
    bool verbose = false;                 // Log per-chunk energy statistics
};

/**
 * @brief Energy-based Voice Activity Detector
 *
 * Detects speech segments in audio using RMS energy analysis. Used as the
 * speech gate in front of the recognizer: chunks without speech never reach
 * the engine, which is where Whisper hallucinates the most.
 */
class HUGINN_API VAD {
public:
    VAD(const VADOptions& options = {});
    ~VAD() = default;

    /**
     * @brief Detect speech segments in audio
     *
     * @param samples Audio samples (mono, float32, normalized [-1, 1])
     * @param sample_rate Sample rate (typically 16000)
     * @return Vector of speech segments with start/end times
     */
    std::vector<SpeechSegment> detect_speech(
        const std::vector<float>& samples,
        int sample_rate = SAMPLE_RATE
    ) const;

    /**
     * @brief Gate decision for one chunk
     *
     * @return false for digital silence or when no segment survives post-processing
     */
    bool contains_speech(const std::vector<float>& samples, int sample_rate = SAMPLE_RATE) const;

    const VADOptions& options() const { return options_; }

private:
    VADOptions options_;

    // Calculate RMS energy for a window
    static float calculate_rms(const float* samples, int count);

    // Estimate noise floor from energy histogram
    float estimate_noise_floor(const std::vector<float>& energies) const;

    // Merge close segments and filter short ones
    std::vector<SpeechSegment> post_process_segments(
        const std::vector<SpeechSegment>& segments
    ) const;
};

} // namespace huginn
