#include "huginn/session.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace huginn {

namespace {

int checked_level(int vad_level) {
    if (vad_level < MIN_VAD_LEVEL || vad_level > MAX_VAD_LEVEL) {
        throw std::invalid_argument("VAD level must be between 1 and 5, got " + std::to_string(vad_level));
    }
    return vad_level;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

Session::Session(std::string id,
                 const SessionOptions& options,
                 const SessionSettings& settings,
                 ModelManager& models,
                 TranscriptionDispatcher& dispatcher,
                 TranslationDispatcher* translation,
                 EventSink sink,
                 ClockFn clock)
    : id_(std::move(id))
    , options_(options)
    , settings_(settings)
    , models_(models)
    , dispatcher_(dispatcher)
    , translation_(translation)
    , sink_(std::move(sink))
    , clock_(clock ? std::move(clock) : ClockFn(&Clock::now))
    , final_chunker_(settings.chunking.chunk_samples(checked_level(options.vad_level)),
                     settings.chunking.overlap_samples(options.vad_level))
    , duplicates_(settings.duplicate_window)
    , reconciler_(settings.subtitles)
{
    if (!models_.is_known(options_.model)) {
        throw std::invalid_argument("Unknown model: " + options_.model);
    }

    if (options_.instant) {
        instant_chunker_ = std::make_unique<Chunker>(settings_.chunking.instant_chunk_samples(),
                                                     settings_.chunking.instant_overlap_samples());
    }

    recognition_ = settings_.recognition;
    recognition_.language = options_.language;
    recognition_.beam_size = beam_size_for_level(options_.vad_level);

    translation_model_ = options_.translation_model.empty()
        ? settings_.default_translation_model
        : options_.translation_model;
    translating_ = translation_ != nullptr &&
                   !options_.target_language.empty() &&
                   !translation_model_.empty();
    reconciler_.set_translating(translating_);
}

Session::~Session() {
    close();
}

bool Session::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void Session::open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || opened_) return;
        opened_ = true;
    }

    std::cout << "[Session " << id_ << "] Opened (model=" << options_.model
              << ", vad=" << options_.vad_level
              << ", instant=" << (options_.instant ? "on" : "off")
              << ", translation=" << (translating_ ? options_.target_language : "off") << ")\n";

    models_.attach_session(options_.model);

    // Registered outside the session lock: callbacks take it
    subscription_ = models_.subscribe([this](const ModelSnapshot& snapshot) {
        on_model_event(snapshot);
    });
    if (translating_) {
        channel_ = translation_->open_channel([this](const TranslationJob& job) {
            on_translation(job);
        });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ModelSnapshot snapshot = models_.status(options_.model);
    if (snapshot.status != ModelStatus::Ready && !is_in_flight(snapshot.status)) {
        // Readiness arrives through the subscription, not the future
        models_.request_load(options_.model);
        snapshot = models_.status(options_.model);
    }
    announce_locked(snapshot);
}

void Session::retry_model() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !opened_) return;

    ModelSnapshot snapshot = models_.status(options_.model);
    if (snapshot.status == ModelStatus::Failed || snapshot.status == ModelStatus::Unloaded) {
        std::cout << "[Session " << id_ << "] Retrying model " << options_.model << "\n";
        models_.request_load(options_.model);
        snapshot = models_.status(options_.model);
    }
    ready_announced_ = false;
    announce_locked(snapshot);
}

void Session::close() {
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        was_open = opened_;

        final_chunker_.reset();
        if (instant_chunker_) instant_chunker_->reset();
        duplicates_.reset();
        reconciler_.clear();
    }

    // Both wait for running callbacks, which take the session lock
    if (channel_) {
        channel_->cancel();
    }
    subscription_.reset();

    if (was_open) {
        models_.detach_session(options_.model);
        std::cout << "[Session " << id_ << "] Closed\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Audio
// ═══════════════════════════════════════════════════════════════════════════

void Session::ingest(const float* samples, std::size_t count) {
    std::vector<std::vector<float>> instant_chunks;
    std::vector<std::vector<float>> final_chunks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;

        std::vector<float> clean(samples, samples + count);
        for (auto& sample : clean) {
            if (!std::isfinite(sample)) sample = 0.0f;
        }

        if (instant_chunker_) {
            instant_chunks = instant_chunker_->ingest(clean);
        }
        final_chunks = final_chunker_.ingest(clean);
    }

    for (const auto& chunk : instant_chunks) {
        process(chunk, SegmentKind::Instant);
    }
    for (const auto& chunk : final_chunks) {
        process(chunk, SegmentKind::Final);
    }
}

void Session::process(const std::vector<float>& chunk, SegmentKind kind) {
    // Recognition runs without the session lock; results of a closed session are dropped
    DispatchResult result = dispatcher_.dispatch(options_.model, chunk, recognition_, kind);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    switch (result.status) {
        case DispatchResult::Status::ModelNotReady: {
            ModelSnapshot snapshot = models_.status(options_.model);
            if (is_in_flight(snapshot.status)) {
                emit_locked(ModelLoadingEvent{snapshot});
            }
            return;
        }
        case DispatchResult::Status::Failed:
            std::cerr << "[Session " << id_ << "] Dropped " << to_string(kind)
                      << " chunk: " << result.error << "\n";
            emit_locked(RecognitionErrorEvent{result.error});
            return;
        case DispatchResult::Status::Ok:
            break;
    }

    bool changed = false;
    for (const auto& recognized : result.segments) {
        TranscriptSegment segment;
        segment.text = trim(recognized.text);
        if (segment.text.empty()) continue;

        segment.kind = kind;
        segment.arrival = clock_();
        segment.start = recognized.start;
        segment.end = recognized.end;

        if (kind == SegmentKind::Instant) {
            segment.id = next_id_++;
            reconciler_.add_instant(segment);
            emit_locked(TranscriptEvent{segment});
            changed = true;
            continue;
        }

        if (!duplicates_.accept(segment.text, segment.arrival)) {
            std::cout << "[Session " << id_ << "] Suppressed repeat: " << segment.text << "\n";
            continue;
        }

        segment.id = next_id_++;
        reconciler_.add_final(segment, translating_);
        emit_locked(TranscriptEvent{segment});
        changed = true;

        if (translating_) {
            TranslationJob job;
            job.source_text = segment.text;
            job.segment_id = segment.id;
            job.source_language = options_.language;
            job.target_language = options_.target_language;
            job.model_id = translation_model_;
            if (!channel_ || !channel_->submit(job)) {
                emit_locked(TranslationEvent{segment.id, false, "", "Translation queue full"});
            }
        }
    }

    if (changed) {
        emit_history_locked();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

void Session::on_model_event(const ModelSnapshot& snapshot) {
    if (snapshot.name != options_.model) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !opened_) return;
    announce_locked(snapshot);
}

void Session::on_translation(const TranslationJob& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    if (job.failed) {
        emit_locked(TranslationEvent{job.segment_id, false, "", job.error});
        return;
    }

    bool attached = reconciler_.attach_translation(job.segment_id, job.result);
    emit_locked(TranslationEvent{job.segment_id, true, job.result, ""});
    if (attached) {
        emit_history_locked();
    }
}

void Session::announce_locked(const ModelSnapshot& snapshot) {
    switch (snapshot.status) {
        case ModelStatus::Ready:
            if (!ready_announced_) {
                ready_announced_ = true;
                emit_locked(ModelLoadedEvent{snapshot.name});
            }
            break;
        case ModelStatus::Failed:
            ready_announced_ = false;
            emit_locked(ModelFailedEvent{snapshot.name, snapshot.error});
            break;
        case ModelStatus::Checking:
        case ModelStatus::Downloading:
        case ModelStatus::Loading:
            ready_announced_ = false;
            emit_locked(ModelLoadingEvent{snapshot});
            break;
        case ModelStatus::Unloaded:
            ready_announced_ = false;
            break;
    }
}

void Session::emit_locked(const SessionEvent& event) {
    if (!sink_) return;
    try {
        sink_(event);
    } catch (const std::exception& e) {
        std::cerr << "[Session " << id_ << "] Event sink failed: " << e.what() << "\n";
    }
}

void Session::emit_history_locked() {
    const auto& entries = reconciler_.entries();
    emit_locked(SubtitlesEvent{std::vector<SubtitleEntry>(entries.begin(), entries.end())});
}

std::vector<SubtitleEntry> Session::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& entries = reconciler_.entries();
    return std::vector<SubtitleEntry>(entries.begin(), entries.end());
}

} // namespace huginn
