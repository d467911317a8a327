#include "huginn/mel_spectrogram.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace huginn {

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
{
    hann_window_ = createHannWindow(n_fft);
    mel_filters_ = createMelFilters(sample_rate, n_fft, n_mels);

    // DFT twiddle factors, computed once per converter
    int n_freqs = n_fft / 2 + 1;
    cos_table_.resize(static_cast<size_t>(n_freqs) * n_fft);
    sin_table_.resize(static_cast<size_t>(n_freqs) * n_fft);
    for (int k = 0; k < n_freqs; k++) {
        for (int n = 0; n < n_fft; n++) {
            float angle = -2.0f * static_cast<float>(M_PI) * k * n / n_fft;
            cos_table_[static_cast<size_t>(k) * n_fft + n] = std::cos(angle);
            sin_table_[static_cast<size_t>(k) * n_fft + n] = std::sin(angle);
        }
    }
}

std::vector<float> MelSpectrogram::createHannWindow(int size)
{
    // Periodic Hann window (matches torch.hann_window)
    std::vector<float> window(size);
    for (int i = 0; i < size; i++) {
        window[i] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * i / size));
    }
    return window;
}

float MelSpectrogram::hzToMel(float hz)
{
    float f_min = 0.0f;
    float f_sp = 200.0f / 3.0f;
    float min_log_hz = 1000.0f;
    float min_log_mel = (min_log_hz - f_min) / f_sp;
    float logstep = std::log(6.4f) / 27.0f;

    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return (hz - f_min) / f_sp;
}

float MelSpectrogram::melToHz(float mel)
{
    float f_min = 0.0f;
    float f_sp = 200.0f / 3.0f;
    float min_log_hz = 1000.0f;
    float min_log_mel = (min_log_hz - f_min) / f_sp;
    float logstep = std::log(6.4f) / 27.0f;

    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_min + f_sp * mel;
}

std::vector<std::vector<float>> MelSpectrogram::createMelFilters(int sample_rate, int n_fft, int n_mels)
{
    int n_freqs = n_fft / 2 + 1;
    std::vector<std::vector<float>> filters(n_mels, std::vector<float>(n_freqs, 0.0f));

    std::vector<float> fft_freqs(n_freqs);
    for (int i = 0; i < n_freqs; i++) {
        fft_freqs[i] = i * sample_rate / static_cast<float>(n_fft);
    }

    float min_mel = 0.0f;
    float max_mel = hzToMel(sample_rate / 2.0f);

    std::vector<float> mel_freqs(n_mels + 2);
    for (int i = 0; i < n_mels + 2; i++) {
        mel_freqs[i] = melToHz(min_mel + (max_mel - min_mel) * i / (n_mels + 1));
    }

    for (int m = 0; m < n_mels; m++) {
        float left = mel_freqs[m];
        float center = mel_freqs[m + 1];
        float right = mel_freqs[m + 2];
        float enorm = 2.0f / (right - left);  // Slaney area normalization

        for (int f = 0; f < n_freqs; f++) {
            float freq = fft_freqs[f];

            if (freq >= left && freq <= center) {
                filters[m][f] = enorm * (freq - left) / (center - left);
            } else if (freq > center && freq <= right) {
                filters[m][f] = enorm * (right - freq) / (right - center);
            }
        }
    }

    return filters;
}

void MelSpectrogram::computeFramePower(const std::vector<float>& samples, int offset,
                                       std::vector<float>& power) const
{
    int n_freqs = n_fft_ / 2 + 1;
    int available = static_cast<int>(samples.size()) - offset;
    int n_max = std::min(n_fft_, std::max(0, available));

    std::vector<float> windowed(n_fft_, 0.0f);
    for (int n = 0; n < n_max; n++) {
        windowed[n] = samples[offset + n] * hann_window_[n];
    }

    for (int k = 0; k < n_freqs; k++) {
        const float* cos_row = &cos_table_[static_cast<size_t>(k) * n_fft_];
        const float* sin_row = &sin_table_[static_cast<size_t>(k) * n_fft_];
        float re = 0.0f;
        float im = 0.0f;
        for (int n = 0; n < n_fft_; n++) {
            re += windowed[n] * cos_row[n];
            im += windowed[n] * sin_row[n];
        }
        power[k] = re * re + im * im;
    }
}

int MelSpectrogram::compute(const std::vector<float>& samples, std::vector<std::vector<float>>& mel_output) const
{
    if (samples.size() < static_cast<size_t>(n_fft_)) {
        return 0;
    }

    int n_frames = static_cast<int>((samples.size() - n_fft_) / hop_length_ + 1);
    int n_freqs = n_fft_ / 2 + 1;

    mel_output.assign(n_frames, std::vector<float>(n_mels_));
    std::vector<float> power(n_freqs);

    float global_max = -1e10f;
    for (int frame = 0; frame < n_frames; frame++) {
        computeFramePower(samples, frame * hop_length_, power);

        for (int mel = 0; mel < n_mels_; mel++) {
            float mel_value = 0.0f;
            for (int freq = 0; freq < n_freqs; freq++) {
                mel_value += mel_filters_[mel][freq] * power[freq];
            }
            float log_mel = std::log10(std::max(mel_value, 1e-10f));
            mel_output[frame][mel] = log_mel;
            global_max = std::max(global_max, log_mel);
        }
    }

    // Whisper dynamic range compression: clamp to max - 8, then scale
    for (auto& frame : mel_output) {
        for (auto& value : frame) {
            value = std::max(value, global_max - 8.0f);
            value = (value + 4.0f) / 4.0f;
        }
    }

    return n_frames;
}

} // namespace huginn
