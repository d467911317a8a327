#pragma once

#include "chunker.h"
#include "duplicate_filter.h"
#include "export.h"
#include "model_manager.h"
#include "session_event.h"
#include "subtitle_reconciler.h"
#include "transcription_dispatcher.h"
#include "translation_dispatcher.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Per-connection choices (from the streaming channel's query string)
 */
struct SessionOptions {
    std::string model = "small";
    int vad_level = 3;                  // 1 (large chunks) .. 5 (small chunks)
    bool instant = false;               // Also run the quick provisional pass
    std::string language = "sv";        // Spoken language
    std::string target_language;        // Empty: no translation
    std::string translation_model;      // Empty: SessionSettings default
};

/**
 * @brief Process-wide session tuning (from configuration)
 */
struct SessionSettings {
    ChunkPolicy chunking;
    SubtitleOptions subtitles;
    std::chrono::milliseconds duplicate_window{2000};
    RecognitionOptions recognition;
    std::string default_translation_model;
};

/**
 * @brief One streaming connection's transcription state
 *
 * Owns the chunkers, duplicate filter, subtitle history and translation
 * channel of one client. Audio is pushed with ingest() from the session's
 * worker thread, which blocks while chunks are recognized. Model and
 * translation notifications arrive on other threads. Every event is emitted
 * under the session mutex, so the sink sees them in reconciliation order.
 *
 * open(), ingest(), retry_model() and close() must be called from one thread.
 */
class HUGINN_API Session {
public:
    using ClockFn = std::function<TimePoint()>;

    /**
     * @throws std::invalid_argument for an unknown model or a VAD level outside 1..5
     */
    Session(std::string id,
            const SessionOptions& options,
            const SessionSettings& settings,
            ModelManager& models,
            TranscriptionDispatcher& dispatcher,
            TranslationDispatcher* translation,
            EventSink sink,
            ClockFn clock = nullptr);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Attach to the model, start loading it if needed and announce its state
    void open();

    /**
     * @brief Feed captured samples (non-finite values are zeroed)
     *
     * Runs every chunk that became complete through recognition before
     * returning. Instant chunks are handled before final chunks.
     */
    void ingest(const float* samples, std::size_t count);

    void ingest(const std::vector<float>& samples) { ingest(samples.data(), samples.size()); }

    /// Request the model again after a failure (client "reload_model")
    void retry_model();

    /// Stop emitting, cancel translations and discard buffers and history
    void close();

    std::vector<SubtitleEntry> history() const;
    bool translating() const { return translating_; }
    bool closed() const;

    const std::string& id() const { return id_; }
    const SessionOptions& options() const { return options_; }
    std::size_t final_chunk_size() const { return final_chunker_.chunk_size(); }

private:
    void process(const std::vector<float>& chunk, SegmentKind kind);
    void on_model_event(const ModelSnapshot& snapshot);
    void on_translation(const TranslationJob& job);
    void announce_locked(const ModelSnapshot& snapshot);
    void emit_locked(const SessionEvent& event);
    void emit_history_locked();

    std::string id_;
    SessionOptions options_;
    SessionSettings settings_;
    ModelManager& models_;
    TranscriptionDispatcher& dispatcher_;
    TranslationDispatcher* translation_;
    EventSink sink_;
    ClockFn clock_;

    RecognitionOptions recognition_;
    std::string translation_model_;
    bool translating_ = false;

    mutable std::mutex mutex_;
    bool closed_ = false;
    bool opened_ = false;
    bool ready_announced_ = false;
    std::uint64_t next_id_ = 1;

    Chunker final_chunker_;
    std::unique_ptr<Chunker> instant_chunker_;
    DuplicateFilter duplicates_;
    SubtitleReconciler reconciler_;

    Subscription subscription_;
    std::shared_ptr<TranslationChannel> channel_;
};

} // namespace huginn
