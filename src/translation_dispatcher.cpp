#include "huginn/translation_dispatcher.h"
#include <iostream>

namespace huginn {

// ═══════════════════════════════════════════════════════════════════════════
// TranslationChannel
// ═══════════════════════════════════════════════════════════════════════════

TranslationChannel::TranslationChannel(TranslationEngine& engine, TaskPool& pool, TranslationCallback callback)
    : engine_(engine)
    , pool_(pool)
    , state_(std::make_shared<State>())
{
    state_->callback = std::move(callback);
}

bool TranslationChannel::submit(TranslationJob job) {
    if (cancelled()) {
        return false;
    }

    // The task owns the state, so a cancelled channel may be destroyed first
    std::shared_ptr<State> state = state_;
    TranslationEngine& engine = engine_;

    return pool_.post([state, &engine, job]() mutable {
        if (state->cancelled) return;

        try {
            job.result = engine.translate(job.source_text, job.source_language,
                                          job.target_language, job.model_id);
        } catch (const std::exception& e) {
            job.failed = true;
            job.error = e.what();
            std::cerr << "[Translator] Segment " << job.segment_id << " failed: " << e.what() << "\n";
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->cancelled && state->callback) {
            state->callback(job);
        }
    });
}

void TranslationChannel::cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
    state_->callback = nullptr;
}

bool TranslationChannel::cancelled() const {
    return state_->cancelled;
}

// ═══════════════════════════════════════════════════════════════════════════
// TranslationDispatcher
// ═══════════════════════════════════════════════════════════════════════════

TranslationDispatcher::TranslationDispatcher(TranslationEngine& engine, TaskPool& pool)
    : engine_(engine)
    , pool_(pool)
{
}

std::shared_ptr<TranslationChannel> TranslationDispatcher::open_channel(TranslationCallback callback) {
    return std::make_shared<TranslationChannel>(engine_, pool_, std::move(callback));
}

std::string TranslationDispatcher::translate(const std::string& text,
                                             const std::string& source_language,
                                             const std::string& target_language,
                                             const std::string& model_id)
{
    return engine_.translate(text, source_language, target_language, model_id);
}

std::vector<std::string> TranslationDispatcher::list_models() const {
    return engine_.list_models();
}

} // namespace huginn
