#pragma once

#include "export.h"
#include "model_manager.h"
#include "recognizer.h"
#include "types.h"
#include "vad.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Outcome of one dispatched chunk
 */
struct DispatchResult {
    enum class Status {
        Ok,             // Recognized (segments may be empty)
        ModelNotReady,  // Chunk dropped, model still loading or failed
        Failed          // Engine raised; chunk dropped
    };

    Status status = Status::Ok;
    std::vector<RecognizedSegment> segments;
    SegmentKind kind = SegmentKind::Final;
    bool gated = false;         // Skipped by the speech gate
    std::string error;
};

/**
 * @brief Beam width for a VAD level (max(1, 6 - level))
 */
HUGINN_API int beam_size_for_level(int vad_level);

/**
 * @brief Feeds model-ready chunks to the recognition engine
 *
 * Chunks for a model that is not ready are dropped, never queued. Chunks
 * without detected speech are answered with no segments and never reach the
 * engine. Engine exceptions become Status::Failed. Calls against one loaded
 * model are serialized through its handle's mutex, so the dispatcher can be
 * shared by every session.
 */
class HUGINN_API TranscriptionDispatcher {
public:
    TranscriptionDispatcher(ModelManager& models, const VADOptions& vad_options = {});

    /**
     * @brief Recognize one chunk
     *
     * @param model Model name
     * @param chunk Mono float32 samples at 16 kHz
     * @param options Language and decoding options
     * @param kind Whether the chunk came from the instant or the final chunker
     */
    DispatchResult dispatch(const std::string& model,
                            const std::vector<float>& chunk,
                            const RecognitionOptions& options,
                            SegmentKind kind);

    const VAD& speech_gate() const { return vad_; }

private:
    ModelManager& models_;
    VAD vad_;
};

} // namespace huginn
