#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace huginn {

/// Capture rate of every stream handled by Huginn (mono float32)
constexpr int SAMPLE_RATE = 16000;

/// VAD sensitivity bounds (1 = large chunks, 5 = small chunks)
constexpr int MIN_VAD_LEVEL = 1;
constexpr int MAX_VAD_LEVEL = 5;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Compute precision type
 */
enum class ComputeType {
    Float32,        // Full precision (most accurate, slowest)
    Float16,        // Half precision (fast on GPU)
    Int8,           // 8-bit quantized (fastest, good quality)
    Int8Float16,    // Mixed precision
    Auto            // Auto-detect best for device
};

/**
 * @brief Device type for inference
 */
enum class DeviceType {
    Auto,           // Auto-detect (prefer CUDA if available)
    CUDA,           // NVIDIA GPU
    CPU             // CPU only
};

/**
 * @brief Kind of transcript produced for a chunk
 */
enum class SegmentKind {
    Instant,        // Quick provisional pass, superseded by the next final
    Final           // Confirmed transcript (deduplicated, translated)
};

/**
 * @brief Transcript segment delivered to a session
 */
struct TranscriptSegment {
    std::uint64_t id = 0;           // Session-scoped id, used to pair translations
    std::string text;               // Transcribed text (trimmed)
    SegmentKind kind = SegmentKind::Final;
    TimePoint arrival{};            // When the segment was produced
    float start = 0.0f;             // Start offset within the chunk (seconds)
    float end = 0.0f;               // End offset within the chunk (seconds)
};

/**
 * @brief Translation slot of a subtitle entry
 */
enum class TranslationState {
    None,           // Translation not requested (instant segment or translation off)
    Pending,        // Requested, not resolved yet (also left here on failure)
    Translated      // Result attached
};

/**
 * @brief One entry of a session's reconciled subtitle history
 */
struct SubtitleEntry {
    TranscriptSegment segment;
    TranslationState translation_state = TranslationState::None;
    std::string translation;
};

/**
 * @brief Lifecycle status of a recognition model
 */
enum class ModelStatus {
    Unloaded,
    Checking,
    Downloading,
    Loading,
    Ready,
    Failed
};

/**
 * @brief Download progress of model artifacts
 */
struct DownloadProgress {
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;  // 0 while unknown

    int percentage() const {
        if (bytes_total == 0) return 0;
        auto pct = static_cast<int>((bytes_done * 100) / bytes_total);
        return pct > 100 ? 100 : pct;
    }
};

/**
 * @brief Read-only view of a model's lifecycle state
 */
struct ModelSnapshot {
    std::string name;
    ModelStatus status = ModelStatus::Unloaded;
    DownloadProgress progress;
    int sessions = 0;               // Sessions currently attached
    std::string error;              // Last failure message (status == Failed)
};

/**
 * @brief Result of a local artifact query
 */
struct ModelAvailability {
    bool exists = false;
    std::string size;               // Human-readable download size ("500 MB")
};

/**
 * @brief A translation request for one confirmed segment
 */
struct TranslationJob {
    std::string source_text;
    std::uint64_t segment_id = 0;
    std::string source_language;    // Whisper/short code ("sv")
    std::string target_language;    // Name or code ("english", "en")
    std::string model_id;           // Translation model directory name
    std::string result;             // Empty until resolved
    bool failed = false;
    std::string error;
};

/**
 * @brief Per-request recognition options
 */
struct RecognitionOptions {
    std::string language = "sv";            // Whisper language token
    int beam_size = 3;                      // Beam search width
    int max_length = 448;                   // Maximum tokens per chunk
    float no_speech_threshold = 0.6f;       // Max no-speech probability
    float log_prob_threshold = -1.0f;       // Min average log probability
    float compression_ratio_threshold = 2.4f;
};

/**
 * @brief Model initialization options
 *
 * Passed to WhisperEngine and the NLLB translator
 */
struct ModelOptions {
    // Device configuration
    DeviceType device = DeviceType::CPU;    // Inference device
    ComputeType compute_type = ComputeType::Int8;  // Precision

    // Threading (0 = auto-detect)
    int intra_threads = 0;                  // Threads per operation (CPU)
    int inter_threads = 1;                  // Parallel operations (workers)

    // GPU options
    int device_index = 0;                   // GPU index for multi-GPU systems

    // Helper to convert enums to strings for CTranslate2
    std::string device_string() const {
        switch (device) {
            case DeviceType::CUDA: return "cuda";
            case DeviceType::CPU: return "cpu";
            default: return "auto";
        }
    }

    std::string compute_type_string() const {
        switch (compute_type) {
            case ComputeType::Float32: return "float32";
            case ComputeType::Float16: return "float16";
            case ComputeType::Int8: return "int8";
            case ComputeType::Int8Float16: return "int8_float16";
            default: return "default";
        }
    }
};

HUGINN_API const char* to_string(ModelStatus status);
HUGINN_API const char* to_string(SegmentKind kind);
HUGINN_API const char* to_string(TranslationState state);

/// True for checking, downloading and loading
HUGINN_API bool is_in_flight(ModelStatus status);

/// Parse "cpu"/"cuda"/"auto" (throws std::invalid_argument)
HUGINN_API DeviceType parse_device(const std::string& value);

/// Parse "float32"/"float16"/"int8"/"int8_float16"/"auto" (throws std::invalid_argument)
HUGINN_API ComputeType parse_compute_type(const std::string& value);

} // namespace huginn
