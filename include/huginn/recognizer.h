#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Text recognized in one chunk
 */
struct RecognizedSegment {
    std::string text;
    float start = 0.0f;     // Seconds from chunk start
    float end = 0.0f;
};

/**
 * @brief Speech-recognition engine seen by the dispatcher
 *
 * Implementations are not required to be thread-safe: the model manager
 * serializes calls per loaded model instance.
 */
class HUGINN_API RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    /**
     * @brief Transcribe one chunk
     *
     * @param samples Mono float32 samples at 16 kHz, normalized to [-1, 1]
     * @param options Language and decoding options
     * @return Recognized segments (empty for silence)
     * @throws std::runtime_error if inference fails
     */
    virtual std::vector<RecognizedSegment> transcribe(
        const std::vector<float>& samples,
        const RecognitionOptions& options) = 0;
};

} // namespace huginn
