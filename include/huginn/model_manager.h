#pragma once

#include "export.h"
#include "model_store.h"
#include "recognizer.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace huginn {

/**
 * @brief Model manager configuration
 */
struct ModelManagerOptions {
    std::vector<std::string> models = {"tiny", "base", "small", "medium", "large"};
    std::chrono::milliseconds operation_timeout{300000};  // Per download/load operation
};

/**
 * @brief A ready recognition engine plus the mutex serializing calls to it
 */
struct LoadedModel {
    std::shared_ptr<RecognitionEngine> engine;
    std::mutex mutex;
};

using ModelHandle = std::shared_ptr<LoadedModel>;

/**
 * @brief Builds an engine from a local model directory (throws on failure)
 */
using EngineFactory = std::function<std::shared_ptr<RecognitionEngine>(
    const std::string& name, const std::string& path)>;

/**
 * @brief Receives every state transition and progress change
 */
using ModelListener = std::function<void(const ModelSnapshot&)>;

class ModelManager;

/**
 * @brief RAII listener registration
 *
 * Destroying (or resetting) the subscription unregisters the listener and
 * waits for a callback that is running on another thread. Never destroy a
 * subscription from inside its own callback.
 */
class HUGINN_API Subscription {
public:
    Subscription() = default;
    Subscription(ModelManager* manager, std::uint64_t id) : manager_(manager), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void reset();
    bool active() const { return manager_ != nullptr; }

private:
    ModelManager* manager_ = nullptr;
    std::uint64_t id_ = 0;
};

/**
 * @brief Process-wide registry of recognition model lifecycles
 *
 * State machine per model name:
 *
 *   unloaded -> checking -> loading -> ready
 *                  |           ^
 *                  +-> downloading
 *
 * Any of checking, downloading and loading can end in failed. A new
 * request_load() on a failed model starts over from checking.
 *
 * At most one live download/load operation exists per model name. Callers
 * arriving while one is in flight share its future. Every operation has a
 * deadline; the watchdog fails expired operations and discards whatever they
 * produce afterwards. A retry never waits for an abandoned operation, which
 * keeps running in the background until it returns on its own.
 *
 * All methods are thread-safe. Listeners are called without the registry
 * lock held, so they may call back into the manager. A listener never sees a
 * snapshot older than one it was already given for the same model.
 */
class HUGINN_API ModelManager {
public:
    /**
     * @param store Artifact store (existence, download, paths)
     * @param factory Engine constructor run on the operation thread
     * @param options Known model names and operation timeout
     */
    ModelManager(std::shared_ptr<ModelStore> store,
                 EngineFactory factory,
                 const ModelManagerOptions& options = {});

    /// Stops the watchdog and joins operation threads, abandoned ones included
    ~ModelManager();

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    /**
     * @brief Local availability of a model's artifacts (no state change)
     * @throws std::invalid_argument for unknown model names
     */
    ModelAvailability check_exists(const std::string& name) const;

    /**
     * @brief Make a model ready, or join the operation already doing so
     *
     * @return Future resolving to the terminal snapshot (ready or failed)
     * @throws std::invalid_argument for unknown model names
     */
    std::shared_future<ModelSnapshot> request_load(const std::string& name);

    /**
     * @brief Current state of a model
     * @throws std::invalid_argument for unknown model names
     */
    ModelSnapshot status(const std::string& name) const;

    /// Snapshots of every model currently downloading
    std::vector<ModelSnapshot> downloads() const;

    /// Loaded engine of a ready model, or null
    ModelHandle acquire(const std::string& name) const;

    void attach_session(const std::string& name);
    void detach_session(const std::string& name);

    /**
     * @brief Drop the engine of a ready model no session uses
     * @return true if the model went back to unloaded
     */
    bool unload(const std::string& name);

    /// Register a listener for all models
    Subscription subscribe(ModelListener listener);

    bool is_known(const std::string& name) const;
    const std::vector<std::string>& models() const { return options_.models; }
    const ModelManagerOptions& options() const { return options_; }

private:
    friend class Subscription;

    struct Entry {
        ModelSnapshot snapshot;
        std::uint64_t generation = 0;       // Bumped on every new or abandoned operation
        std::shared_ptr<std::promise<ModelSnapshot>> promise;
        std::shared_future<ModelSnapshot> future;
        TimePoint deadline{};
        ModelHandle handle;
        std::uint64_t sequence = 0;         // Bumped on every announced change
    };

    struct Operation {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    struct Notice {
        ModelSnapshot snapshot;
        std::uint64_t sequence = 0;
    };

    Entry& entry_locked(const std::string& name);
    const Entry* find_locked(const std::string& name) const;
    void require_known(const std::string& name) const;

    void run_operation(const std::string& name, std::uint64_t generation,
                       std::shared_ptr<std::atomic<bool>> finished);
    bool transition(const std::string& name, std::uint64_t generation, ModelStatus status);
    bool report_progress(const std::string& name, std::uint64_t generation,
                         std::uint64_t done, std::uint64_t total);
    void complete(const std::string& name, std::uint64_t generation,
                  std::shared_ptr<RecognitionEngine> engine);
    void fail(const std::string& name, std::uint64_t generation, const std::string& message);
    static void resolve_locked(Entry& entry);
    static Notice notice_locked(Entry& entry);
    void reap_operations_locked();

    void watchdog_loop();
    void notify(const Notice& notice);
    void unsubscribe(std::uint64_t id);

    std::shared_ptr<ModelStore> store_;
    EngineFactory factory_;
    ModelManagerOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::vector<Operation> operations_;
    bool stopping_ = false;
    std::condition_variable watchdog_cv_;
    std::thread watchdog_;

    std::mutex listeners_mutex_;
    std::map<std::uint64_t, ModelListener> listeners_;
    std::map<std::string, std::uint64_t> delivered_;    // Last sequence announced per model
    std::uint64_t next_listener_id_ = 1;
};

} // namespace huginn
