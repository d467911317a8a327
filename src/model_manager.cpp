#include "huginn/model_manager.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace huginn {

namespace {

// "5s" for whole seconds, "300ms" otherwise
std::string format_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + "s";
    }
    return std::to_string(timeout.count()) + "ms";
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Subscription
// ═══════════════════════════════════════════════════════════════════════════

Subscription::Subscription(Subscription&& other) noexcept
    : manager_(other.manager_), id_(other.id_)
{
    other.manager_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        manager_ = other.manager_;
        id_ = other.id_;
        other.manager_ = nullptr;
    }
    return *this;
}

void Subscription::reset() {
    if (manager_) {
        manager_->unsubscribe(id_);
        manager_ = nullptr;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ModelManager
// ═══════════════════════════════════════════════════════════════════════════

ModelManager::ModelManager(std::shared_ptr<ModelStore> store,
                           EngineFactory factory,
                           const ModelManagerOptions& options)
    : store_(std::move(store))
    , factory_(std::move(factory))
    , options_(options)
{
    if (!store_) {
        throw std::invalid_argument("ModelManager requires a model store");
    }
    if (!factory_) {
        throw std::invalid_argument("ModelManager requires an engine factory");
    }
    watchdog_ = std::thread(&ModelManager::watchdog_loop, this);
}

ModelManager::~ModelManager() {
    std::vector<Operation> operations;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;

        // Waiters get a terminal snapshot instead of a broken promise
        for (auto& item : entries_) {
            Entry& e = item.second;
            if (is_in_flight(e.snapshot.status)) {
                e.generation++;
                e.snapshot.status = ModelStatus::Failed;
                e.snapshot.error = "Model manager shutting down";
                resolve_locked(e);
            }
        }
        operations.swap(operations_);
    }
    watchdog_cv_.notify_all();

    if (watchdog_.joinable()) {
        watchdog_.join();
    }
    for (auto& op : operations) {
        if (op.thread.joinable()) {
            op.thread.join();
        }
    }
}

bool ModelManager::is_known(const std::string& name) const {
    return std::find(options_.models.begin(), options_.models.end(), name) != options_.models.end();
}

void ModelManager::require_known(const std::string& name) const {
    if (!is_known(name)) {
        throw std::invalid_argument("Unknown model: " + name);
    }
}

ModelManager::Entry& ModelManager::entry_locked(const std::string& name) {
    require_known(name);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        it = entries_.emplace(name, Entry{}).first;
        it->second.snapshot.name = name;
    }
    return it->second;
}

const ModelManager::Entry* ModelManager::find_locked(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

void ModelManager::resolve_locked(Entry& entry) {
    if (entry.promise) {
        entry.promise->set_value(entry.snapshot);
        entry.promise.reset();
    }
}

ModelManager::Notice ModelManager::notice_locked(Entry& entry) {
    Notice notice;
    notice.snapshot = entry.snapshot;
    notice.sequence = ++entry.sequence;
    return notice;
}

void ModelManager::reap_operations_locked() {
    // A finished flag is the last thing an operation thread touches
    for (auto it = operations_.begin(); it != operations_.end();) {
        if (*it->finished) {
            it->thread.join();
            it = operations_.erase(it);
        } else {
            ++it;
        }
    }
}

ModelAvailability ModelManager::check_exists(const std::string& name) const {
    require_known(name);
    ModelAvailability availability;
    availability.exists = store_->exists(name);
    availability.size = store_->size_label(name);
    return availability;
}

std::shared_future<ModelSnapshot> ModelManager::request_load(const std::string& name) {
    std::shared_future<ModelSnapshot> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Model manager is shutting down");
        }
        Entry& e = entry_locked(name);

        if (e.snapshot.status == ModelStatus::Ready) {
            std::promise<ModelSnapshot> ready;
            ready.set_value(e.snapshot);
            return ready.get_future().share();
        }
        if (is_in_flight(e.snapshot.status)) {
            return e.future;
        }

        // unloaded or failed: start a new operation
        const std::uint64_t generation = ++e.generation;
        e.promise = std::make_shared<std::promise<ModelSnapshot>>();
        e.future = e.promise->get_future().share();
        e.snapshot.status = ModelStatus::Checking;
        e.snapshot.error.clear();
        e.snapshot.progress = DownloadProgress{};
        e.deadline = Clock::now() + options_.operation_timeout;

        // An abandoned operation for this name may still be running; it is left alone
        reap_operations_locked();
        Operation op;
        op.finished = std::make_shared<std::atomic<bool>>(false);
        op.thread = std::thread(&ModelManager::run_operation, this, name, generation, op.finished);
        operations_.push_back(std::move(op));

        future = e.future;
    }
    watchdog_cv_.notify_all();

    std::cout << "[Models] Requested " << name << "\n";
    return future;
}

ModelSnapshot ModelManager::status(const std::string& name) const {
    require_known(name);
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = find_locked(name);
    if (!e) {
        ModelSnapshot snapshot;
        snapshot.name = name;
        return snapshot;
    }
    return e->snapshot;
}

std::vector<ModelSnapshot> ModelManager::downloads() const {
    std::vector<ModelSnapshot> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : entries_) {
        if (item.second.snapshot.status == ModelStatus::Downloading) {
            result.push_back(item.second.snapshot);
        }
    }
    return result;
}

ModelHandle ModelManager::acquire(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* e = find_locked(name);
    if (!e || e->snapshot.status != ModelStatus::Ready) {
        return nullptr;
    }
    return e->handle;
}

void ModelManager::attach_session(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(name).snapshot.sessions++;
}

void ModelManager::detach_session(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& e = entry_locked(name);
    if (e.snapshot.sessions > 0) {
        e.snapshot.sessions--;
    }
}

bool ModelManager::unload(const std::string& name) {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& e = entry_locked(name);
        if (e.snapshot.status != ModelStatus::Ready || e.snapshot.sessions > 0) {
            return false;
        }
        // In-flight recognitions keep their own handle reference
        e.handle.reset();
        e.snapshot.status = ModelStatus::Unloaded;
        e.snapshot.progress = DownloadProgress{};
        notice = notice_locked(e);
    }
    std::cout << "[Models] Unloaded " << name << "\n";
    notify(notice);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Operation thread
// ═══════════════════════════════════════════════════════════════════════════

void ModelManager::run_operation(const std::string& name, std::uint64_t generation,
                                 std::shared_ptr<std::atomic<bool>> finished)
{
    struct MarkFinished {
        std::atomic<bool>& flag;
        ~MarkFinished() { flag = true; }
    } mark{*finished};

    // Announced from this thread so listeners see transitions in order
    if (!transition(name, generation, ModelStatus::Checking)) return;

    try {
        if (!store_->exists(name)) {
            if (!transition(name, generation, ModelStatus::Downloading)) return;
            std::cout << "[Models] " << name << " not found locally, downloading ("
                      << store_->size_label(name) << ")\n";
            store_->download(name, [this, &name, generation](std::uint64_t done, std::uint64_t total) {
                return report_progress(name, generation, done, total);
            });
        }

        if (!transition(name, generation, ModelStatus::Loading)) return;

        std::shared_ptr<RecognitionEngine> engine = factory_(name, store_->model_path(name));
        if (!engine) {
            throw std::runtime_error("Engine factory returned no engine");
        }
        complete(name, generation, std::move(engine));

    } catch (const std::exception& e) {
        fail(name, generation, e.what());
    }
}

bool ModelManager::transition(const std::string& name, std::uint64_t generation, ModelStatus status) {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        Entry& e = entry_locked(name);
        if (e.generation != generation || !is_in_flight(e.snapshot.status)) {
            return false;
        }
        e.snapshot.status = status;
        notice = notice_locked(e);
    }
    notify(notice);
    return true;
}

bool ModelManager::report_progress(const std::string& name, std::uint64_t generation,
                                   std::uint64_t done, std::uint64_t total)
{
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        Entry& e = entry_locked(name);
        if (e.generation != generation || e.snapshot.status != ModelStatus::Downloading) {
            return false;   // Superseded: abort the transfer
        }

        const int before = e.snapshot.progress.percentage();
        const bool total_changed = e.snapshot.progress.bytes_total != total;
        e.snapshot.progress.bytes_done = done;
        e.snapshot.progress.bytes_total = total;

        // Listeners hear about whole-percent steps only
        if (!total_changed && e.snapshot.progress.percentage() == before) {
            return true;
        }
        notice = notice_locked(e);
    }
    notify(notice);
    return true;
}

void ModelManager::complete(const std::string& name, std::uint64_t generation,
                            std::shared_ptr<RecognitionEngine> engine)
{
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        Entry& e = entry_locked(name);
        if (e.generation != generation || !is_in_flight(e.snapshot.status)) {
            std::cerr << "[Models] Discarding late result for " << name << " (superseded)\n";
            return;
        }
        auto handle = std::make_shared<LoadedModel>();
        handle->engine = std::move(engine);
        e.handle = std::move(handle);
        e.snapshot.status = ModelStatus::Ready;
        e.snapshot.error.clear();
        resolve_locked(e);
        notice = notice_locked(e);
    }
    std::cout << "[Models] ✓ " << name << " ready\n";
    notify(notice);
}

void ModelManager::fail(const std::string& name, std::uint64_t generation, const std::string& message) {
    Notice notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        Entry& e = entry_locked(name);
        if (e.generation != generation || !is_in_flight(e.snapshot.status)) {
            return;
        }
        e.snapshot.status = ModelStatus::Failed;
        e.snapshot.error = message;
        e.handle.reset();
        resolve_locked(e);
        notice = notice_locked(e);
    }
    std::cerr << "[Models] ✗ Failed to load " << name << ": " << message << "\n";
    notify(notice);
}

// ═══════════════════════════════════════════════════════════════════════════
// Watchdog
// ═══════════════════════════════════════════════════════════════════════════

void ModelManager::watchdog_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        const TimePoint now = Clock::now();
        TimePoint next = TimePoint::max();
        std::vector<Notice> expired;

        for (auto& item : entries_) {
            Entry& e = item.second;
            if (!is_in_flight(e.snapshot.status)) continue;

            if (e.deadline <= now) {
                // Invalidate the running operation; its result will be discarded
                e.generation++;
                e.snapshot.error = "Timed out after " + format_timeout(options_.operation_timeout) +
                                   " while " + to_string(e.snapshot.status);
                e.snapshot.status = ModelStatus::Failed;
                e.handle.reset();
                resolve_locked(e);
                expired.push_back(notice_locked(e));
            } else {
                next = std::min(next, e.deadline);
            }
        }

        if (!expired.empty()) {
            lock.unlock();
            for (const auto& notice : expired) {
                std::cerr << "[Models] ✗ " << notice.snapshot.name << ": " << notice.snapshot.error << "\n";
                notify(notice);
            }
            lock.lock();
            continue;
        }

        if (next == TimePoint::max()) {
            watchdog_cv_.wait(lock);
        } else {
            watchdog_cv_.wait_until(lock, next);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Listeners
// ═══════════════════════════════════════════════════════════════════════════

Subscription ModelManager::subscribe(ModelListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const std::uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return Subscription(this, id);
}

void ModelManager::unsubscribe(std::uint64_t id) {
    // Holding listeners_mutex_ means no callback is running
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void ModelManager::notify(const Notice& notice) {
    const ModelSnapshot& snapshot = notice.snapshot;
    std::lock_guard<std::mutex> lock(listeners_mutex_);

    // A change announced from another thread may have overtaken this one
    std::uint64_t& delivered = delivered_[snapshot.name];
    if (notice.sequence <= delivered) {
        return;
    }
    delivered = notice.sequence;

    for (auto& item : listeners_) {
        try {
            item.second(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[Models] Listener failed for " << snapshot.name << ": " << e.what() << "\n";
        }
    }
}

} // namespace huginn
