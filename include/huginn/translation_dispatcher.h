#pragma once

#include "export.h"
#include "task_pool.h"
#include "translator.h"
#include "types.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Receives a resolved or failed translation job
 */
using TranslationCallback = std::function<void(const TranslationJob&)>;

/**
 * @brief One session's view of the translation pipeline
 *
 * Jobs run on the shared task pool. The callback runs on a pool thread, at
 * most once per job, and never after cancel() has returned.
 */
class HUGINN_API TranslationChannel {
public:
    TranslationChannel(TranslationEngine& engine, TaskPool& pool, TranslationCallback callback);

    /**
     * @brief Queue a job
     * @return false if the channel is cancelled or the pool is saturated
     *         (the callback will not be called for this job)
     */
    bool submit(TranslationJob job);

    /// Block until no callback is running, then drop every later result
    void cancel();

    bool cancelled() const;

private:
    struct State {
        std::mutex mutex;           // Held while the callback runs
        std::atomic<bool> cancelled{false};  // Read without the mutex by submitters
        TranslationCallback callback;
    };

    TranslationEngine& engine_;
    TaskPool& pool_;
    std::shared_ptr<State> state_;
};

/**
 * @brief Shared front of the translation engine
 *
 * Sessions open channels for fire-and-forget jobs; the server uses
 * translate() for the one-shot endpoint and list_models() for discovery.
 */
class HUGINN_API TranslationDispatcher {
public:
    TranslationDispatcher(TranslationEngine& engine, TaskPool& pool);

    std::shared_ptr<TranslationChannel> open_channel(TranslationCallback callback);

    /// Synchronous translation (throws like TranslationEngine::translate)
    std::string translate(const std::string& text,
                          const std::string& source_language,
                          const std::string& target_language,
                          const std::string& model_id);

    std::vector<std::string> list_models() const;

    TaskPool& pool() { return pool_; }

private:
    TranslationEngine& engine_;
    TaskPool& pool_;
};

} // namespace huginn
