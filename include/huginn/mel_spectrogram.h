#pragma once

#include <vector>

namespace huginn {

/**
 * @brief Whisper-compatible mel-spectrogram converter
 *
 * Converts audio samples to mel-filterbank features for Whisper models.
 *
 * Parameters match Whisper's defaults:
 * - 80 mel bins (128 for large-v3 models)
 * - 16kHz sample rate
 * - 400-point FFT (25ms @ 16kHz)
 * - 160-sample hop (10ms @ 16kHz)
 */
class MelSpectrogram {
public:
    /**
     * @brief Construct mel-spectrogram converter
     *
     * @param sample_rate Audio sample rate (default: 16000 Hz)
     * @param n_fft FFT window size (default: 400)
     * @param n_mels Number of mel bins (default: 80)
     * @param hop_length Hop size between frames (default: 160)
     */
    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to mel-spectrogram
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @param mel_output Output mel-spectrogram (n_frames x n_mels)
     * @return Number of frames generated
     */
    int compute(const std::vector<float>& samples,
                std::vector<std::vector<float>>& mel_output) const;

    int getMelBins() const { return n_mels_; }
    int getHopLength() const { return hop_length_; }

private:
    // Power spectrum of one windowed frame (n_fft / 2 + 1 bins)
    void computeFramePower(const std::vector<float>& samples, int offset,
                           std::vector<float>& power) const;

    std::vector<float> createHannWindow(int size);
    std::vector<std::vector<float>> createMelFilters(int sample_rate, int n_fft, int n_mels);

    // Slaney-style mel scale used by Whisper
    float hzToMel(float hz);
    float melToHz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    std::vector<float> hann_window_;
    std::vector<std::vector<float>> mel_filters_;
    std::vector<float> cos_table_;   // [k * n_fft + n]
    std::vector<float> sin_table_;
};

} // namespace huginn
