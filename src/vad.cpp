#include "huginn/vad.h"
#include <cmath>
#include <algorithm>
#include <iostream>

namespace huginn {

VAD::VAD(const VADOptions& options)
    : options_(options)
{
}

float VAD::calculate_rms(const float* samples, int count) {
    if (count <= 0) return 0.0f;

    float sum_sq = 0.0f;
    for (int i = 0; i < count; ++i) {
        sum_sq += samples[i] * samples[i];
    }
    return std::sqrt(sum_sq / count);
}

float VAD::estimate_noise_floor(const std::vector<float>& energies) const {
    if (energies.empty()) return options_.threshold;

    std::vector<float> sorted = energies;
    std::sort(sorted.begin(), sorted.end());

    size_t noise_idx = static_cast<size_t>(sorted.size() * options_.noise_floor_percentile);
    float noise_floor = sorted[std::min(noise_idx, sorted.size() - 1)];

    size_t speech_idx = static_cast<size_t>(sorted.size() * 0.9);
    float speech_level = sorted[std::min(speech_idx, sorted.size() - 1)];

    float dynamic_range = speech_level - noise_floor;

    // Noise floor plus a quarter of the dynamic range, never below twice the
    // floor or the configured threshold, never above the midpoint
    float threshold = noise_floor + (dynamic_range * 0.25f);
    threshold = std::max(threshold, noise_floor * 2.0f);
    threshold = std::max(threshold, options_.threshold);

    float max_threshold = noise_floor + (dynamic_range * 0.5f);
    threshold = std::min(threshold, max_threshold);

    if (options_.verbose) {
        std::cout << "[VAD] Noise floor: " << noise_floor
                  << ", Speech level: " << speech_level
                  << ", Dynamic range: " << dynamic_range << "\n";
    }

    return threshold;
}

std::vector<SpeechSegment> VAD::detect_speech(
    const std::vector<float>& samples,
    int sample_rate
) const {
    std::vector<SpeechSegment> segments;

    if (samples.empty() || sample_rate <= 0) return segments;

    // Frame size: 32ms (512 samples at 16kHz)
    int frame_size = sample_rate * 32 / 1000;
    int hop_size = frame_size / 2;  // 50% overlap

    std::vector<float> energies;
    std::vector<int> frame_starts;

    for (size_t i = 0; i + frame_size <= samples.size(); i += hop_size) {
        energies.push_back(calculate_rms(&samples[i], frame_size));
        frame_starts.push_back(static_cast<int>(i));
    }

    if (energies.empty()) return segments;

    float threshold = options_.threshold;
    if (options_.adaptive_threshold) {
        threshold = estimate_noise_floor(energies);
    }

    bool in_speech = false;
    int speech_start = 0;

    for (size_t i = 0; i < energies.size(); ++i) {
        bool is_speech = energies[i] > threshold;

        if (is_speech && !in_speech) {
            in_speech = true;
            speech_start = frame_starts[i];
        } else if (!is_speech && in_speech) {
            in_speech = false;
            int speech_end = frame_starts[i] + frame_size;
            segments.emplace_back(static_cast<float>(speech_start) / sample_rate,
                                  static_cast<float>(speech_end) / sample_rate);
        }
    }

    // Speech continues to the end of the chunk
    if (in_speech) {
        segments.emplace_back(static_cast<float>(speech_start) / sample_rate,
                              static_cast<float>(samples.size()) / sample_rate);
    }

    return post_process_segments(segments);
}

std::vector<SpeechSegment> VAD::post_process_segments(
    const std::vector<SpeechSegment>& segments
) const {
    if (segments.empty()) return segments;

    float min_speech_sec = options_.min_speech_duration_ms / 1000.0f;
    float min_silence_sec = options_.min_silence_duration_ms / 1000.0f;
    float pad_sec = options_.speech_pad_ms / 1000.0f;

    std::vector<SpeechSegment> merged;
    SpeechSegment current = segments[0];

    for (size_t i = 1; i < segments.size(); ++i) {
        float gap = segments[i].start - current.end;

        if (gap < min_silence_sec) {
            current.end = segments[i].end;
        } else {
            merged.push_back(current);
            current = segments[i];
        }
    }
    merged.push_back(current);

    std::vector<SpeechSegment> result;
    for (auto& seg : merged) {
        float duration = seg.end - seg.start;
        if (duration >= min_speech_sec) {
            seg.start = std::max(0.0f, seg.start - pad_sec);
            seg.end += pad_sec;
            result.push_back(seg);
        }
    }

    return result;
}

bool VAD::contains_speech(const std::vector<float>& samples, int sample_rate) const {
    float max_sample = 0.0f;
    for (size_t i = 0; i < samples.size(); i += 100) {  // Sample every 100th
        max_sample = std::max(max_sample, std::abs(samples[i]));
    }

    if (max_sample < options_.silence_amplitude) {
        if (options_.verbose) {
            std::cout << "[VAD] Chunk is silent (max amplitude: " << max_sample << ") - skipping\n";
        }
        return false;
    }

    auto segments = detect_speech(samples, sample_rate);
    if (options_.verbose) {
        std::cout << "[VAD] Detected " << segments.size() << " speech segment(s)\n";
    }
    return !segments.empty();
}

} // namespace huginn
