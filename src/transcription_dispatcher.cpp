#include "huginn/transcription_dispatcher.h"
#include <algorithm>
#include <iostream>
#include <mutex>

namespace huginn {

int beam_size_for_level(int vad_level) {
    return std::max(1, 6 - vad_level);
}

TranscriptionDispatcher::TranscriptionDispatcher(ModelManager& models, const VADOptions& vad_options)
    : models_(models)
    , vad_(vad_options)
{
}

DispatchResult TranscriptionDispatcher::dispatch(const std::string& model,
                                                 const std::vector<float>& chunk,
                                                 const RecognitionOptions& options,
                                                 SegmentKind kind)
{
    DispatchResult result;
    result.kind = kind;

    ModelHandle handle = models_.acquire(model);
    if (!handle) {
        result.status = DispatchResult::Status::ModelNotReady;
        return result;
    }

    if (vad_.options().enabled && !vad_.contains_speech(chunk)) {
        result.gated = true;
        return result;
    }

    try {
        std::lock_guard<std::mutex> lock(handle->mutex);
        result.segments = handle->engine->transcribe(chunk, options);
    } catch (const std::exception& e) {
        std::cerr << "[Huginn] Recognition failed (" << model << ", "
                  << to_string(kind) << " chunk of " << chunk.size() << " samples): "
                  << e.what() << "\n";
        result.status = DispatchResult::Status::Failed;
        result.error = e.what();
        result.segments.clear();
    }

    return result;
}

} // namespace huginn
