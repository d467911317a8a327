/**
 * @file test_model_manager.cpp
 * @brief Model lifecycle: single-flight loading, failure, retry and timeouts
 */

#include "huginn/model_manager.h"
#include "test_support.h"
#include <algorithm>
#include <iterator>

using namespace huginn;
using std::chrono::milliseconds;

namespace {

struct Harness {
    explicit Harness(milliseconds timeout = milliseconds(5000)) {
        store = std::make_shared<FakeStore>();
        ModelManagerOptions options;
        options.operation_timeout = timeout;
        manager = std::make_unique<ModelManager>(
            store,
            [this](const std::string& name, const std::string& path) -> std::shared_ptr<RecognitionEngine> {
                factory_calls++;
                last_path = path;
                if (fail_factory) {
                    throw std::runtime_error("Corrupt model " + name);
                }
                if (block_factory) {
                    factory_gate.wait();
                }
                return std::make_shared<FakeEngine>();
            },
            options);
    }

    ~Harness() {
        factory_gate.open();
        store->release.open();
        manager.reset();
    }

    std::shared_ptr<FakeStore> store;
    std::unique_ptr<ModelManager> manager;
    std::atomic<int> factory_calls{0};
    std::atomic<bool> fail_factory{false};
    std::atomic<bool> block_factory{false};
    Gate factory_gate;
    std::string last_path;
};

void test_cached_load() {
    section("Load of a cached model");

    Harness h;
    h.store->add("small");

    check(h.manager->check_exists("small").exists, "check_exists sees local artifacts");
    check(h.manager->check_exists("small").size == "500 MB", "check_exists reports the download size");
    check(h.manager->status("small").status == ModelStatus::Unloaded, "models start unloaded");
    check(!h.manager->acquire("small"), "unloaded model yields no engine");

    ModelSnapshot result = h.manager->request_load("small").get();
    check(result.status == ModelStatus::Ready, "load completes as ready");
    check(h.store->downloads == 0, "cached model is not downloaded");
    check(h.last_path == "fake/small", "engine is built from the store path");
    check(h.manager->acquire("small") != nullptr, "ready model yields an engine");

    auto again = h.manager->request_load("small");
    check(again.wait_for(milliseconds(0)) == std::future_status::ready, "request on a ready model resolves at once");
    check(h.factory_calls == 1, "ready model is not rebuilt");

    check(throws([&] { h.manager->request_load("gigantic"); }), "unknown model names are rejected");
    check(throws([&] { h.manager->status("gigantic"); }), "status of an unknown model is rejected");
}

void test_single_flight() {
    section("Concurrent requests share one operation");

    Harness h;
    h.store->add("base");
    h.block_factory = true;

    std::vector<std::shared_future<ModelSnapshot>> futures;
    std::vector<std::thread> callers;
    std::mutex futures_mutex;
    for (int i = 0; i < 5; ++i) {
        callers.emplace_back([&] {
            auto f = h.manager->request_load("base");
            std::lock_guard<std::mutex> lock(futures_mutex);
            futures.push_back(f);
        });
    }
    for (auto& t : callers) t.join();

    check(wait_for([&] { return h.manager->status("base").status == ModelStatus::Loading; }),
          "model reaches loading");
    h.factory_gate.open();

    bool all_ready = true;
    for (auto& f : futures) {
        if (f.get().status != ModelStatus::Ready) all_ready = false;
    }
    check(all_ready, "all five callers observe ready");
    check(h.factory_calls == 1, "engine is built exactly once");
}

void test_download_and_progress() {
    section("Download with progress");

    Harness h;
    std::mutex seen_mutex;
    std::vector<ModelSnapshot> seen;
    Subscription sub = h.manager->subscribe([&](const ModelSnapshot& s) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(s);
    });

    ModelSnapshot result = h.manager->request_load("tiny").get();
    check(result.status == ModelStatus::Ready, "downloaded model becomes ready");
    check(h.store->downloads == 1, "artifacts are downloaded once");
    check(h.manager->check_exists("tiny").exists, "artifacts are local afterwards");

    wait_for([&] {
        std::lock_guard<std::mutex> lock(seen_mutex);
        return !seen.empty() && seen.back().status == ModelStatus::Ready;
    });

    std::lock_guard<std::mutex> lock(seen_mutex);
    std::vector<ModelStatus> order;
    bool saw_half = false;
    for (const auto& s : seen) {
        if (order.empty() || order.back() != s.status) order.push_back(s.status);
        if (s.status == ModelStatus::Downloading && s.progress.percentage() == 50) saw_half = true;
    }
    std::vector<ModelStatus> expected = {
        ModelStatus::Checking, ModelStatus::Downloading, ModelStatus::Loading, ModelStatus::Ready
    };
    check(order == expected, "listeners see checking, downloading, loading, ready in order");
    check(saw_half, "progress is reported while downloading");
}

void test_failure_and_retry() {
    section("Failure and retry");

    Harness h;
    h.store->fail_download = true;

    ModelSnapshot failed = h.manager->request_load("medium").get();
    check(failed.status == ModelStatus::Failed, "failed download ends as failed");
    check(failed.error.find("Network unreachable") != std::string::npos, "failure carries the error message");
    check(!h.manager->acquire("medium"), "failed model yields no engine");

    h.store->fail_download = false;
    ModelSnapshot retried = h.manager->request_load("medium").get();
    check(retried.status == ModelStatus::Ready, "new request after failure starts over and succeeds");
    check(retried.error.empty(), "error is cleared on success");

    Harness broken;
    broken.store->add("small");
    broken.fail_factory = true;
    ModelSnapshot corrupt = broken.manager->request_load("small").get();
    check(corrupt.status == ModelStatus::Failed, "engine construction error ends as failed");
    check(corrupt.error.find("Corrupt model") != std::string::npos, "engine error message is kept");
}

void test_timeout() {
    section("Operation timeout");

    Harness h(milliseconds(200));
    h.store->block_download = true;

    auto first = h.manager->request_load("large");
    auto second = h.manager->request_load("large");

    check(first.wait_for(milliseconds(3000)) == std::future_status::ready, "waiter is released by the deadline");
    ModelSnapshot a = first.get();
    ModelSnapshot b = second.get();
    check(a.status == ModelStatus::Failed && b.status == ModelStatus::Failed, "every waiter observes failed");
    check(a.error == "Timed out after 200ms while downloading", "failure names the timeout and the stage");

    // The abandoned download must not overwrite the failure
    std::this_thread::sleep_for(milliseconds(100));
    check(h.manager->status("large").status == ModelStatus::Failed, "late progress does not revive the model");

    h.store->block_download = false;
    h.store->release.open();
    ModelSnapshot retried = h.manager->request_load("large").get();
    check(retried.status == ModelStatus::Ready, "model can be requested again after a timeout");
}

void test_retry_past_hung_load() {
    section("Retry while an abandoned load never returns");

    Harness h(milliseconds(300));
    h.store->add("small");
    h.block_factory = true;

    ModelSnapshot first = h.manager->request_load("small").get();
    check(first.status == ModelStatus::Failed, "hung load is failed by the deadline");
    check(first.error == "Timed out after 300ms while loading", "timeout is reported in milliseconds");

    // The first engine build stays blocked for the rest of this test
    h.block_factory = false;
    auto retry = h.manager->request_load("small");
    check(retry.wait_for(milliseconds(3000)) == std::future_status::ready, "retry does not wait for the hung load");
    check(retry.get().status == ModelStatus::Ready, "retry reaches ready");
    check(h.factory_calls == 2, "retry builds its own engine");
    check(h.manager->acquire("small") != nullptr, "ready model yields an engine");
}

void test_retry_after_released_load() {
    section("Retry after an abandoned load returns late");

    Harness h(milliseconds(300));
    h.store->add("base");
    h.block_factory = true;

    ModelSnapshot first = h.manager->request_load("base").get();
    check(first.status == ModelStatus::Failed, "hung load is failed by the deadline");

    h.block_factory = false;
    h.factory_gate.open();
    std::this_thread::sleep_for(milliseconds(100));
    check(h.manager->status("base").status == ModelStatus::Failed, "late engine does not revive the model");

    ModelSnapshot retried = h.manager->request_load("base").get();
    check(retried.status == ModelStatus::Ready, "retry reaches ready");
    check(h.factory_calls == 2, "late engine was discarded and rebuilt");
}

void test_no_stale_progress_after_timeout() {
    section("No progress after a timeout is announced");

    for (int round = 0; round < 5; ++round) {
        Harness h(milliseconds(100));
        h.store->flood_progress = true;

        std::mutex seen_mutex;
        std::vector<ModelStatus> seen;
        Subscription sub = h.manager->subscribe([&](const ModelSnapshot& s) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(s.status);
        });

        ModelSnapshot result = h.manager->request_load("medium").get();
        std::this_thread::sleep_for(milliseconds(50));
        sub.reset();

        std::lock_guard<std::mutex> lock(seen_mutex);
        auto failed_at = std::find(seen.begin(), seen.end(), ModelStatus::Failed);
        bool failed_last = failed_at != seen.end() && std::next(failed_at) == seen.end();
        if (!failed_last || result.status != ModelStatus::Failed) {
            check(false, "failed is the last status listeners hear (round " + std::to_string(round) + ")");
            return;
        }
    }
    check(true, "failed is the last status listeners hear");
}

void test_sessions_and_unload() {
    section("Session counting and unload");

    Harness h;
    h.store->add("small");
    h.manager->request_load("small").get();

    h.manager->attach_session("small");
    h.manager->attach_session("small");
    check(h.manager->status("small").sessions == 2, "attached sessions are counted");
    check(!h.manager->unload("small"), "model in use is not unloaded");

    h.manager->detach_session("small");
    h.manager->detach_session("small");
    h.manager->detach_session("small");
    check(h.manager->status("small").sessions == 0, "session count never goes negative");

    check(h.manager->unload("small"), "idle ready model unloads");
    check(h.manager->status("small").status == ModelStatus::Unloaded, "unloaded model reports unloaded");
    check(!h.manager->acquire("small"), "unloaded model yields no engine");
    check(!h.manager->unload("small"), "unloading twice is a no-op");
}

void test_subscription_lifetime() {
    section("Subscription lifetime");

    Harness h;
    h.store->add("small");
    std::atomic<int> calls{0};
    {
        Subscription sub = h.manager->subscribe([&](const ModelSnapshot&) { calls++; });
        check(sub.active(), "subscription is active");
    }
    h.manager->request_load("small").get();
    check(calls == 0, "destroyed subscription receives nothing");
}

} // anonymous namespace

int main() {
    banner("Huginn - Model Manager Tests");

    test_cached_load();
    test_single_flight();
    test_download_and_progress();
    test_failure_and_retry();
    test_timeout();
    test_retry_past_hung_load();
    test_retry_after_released_load();
    test_no_stale_progress_after_timeout();
    test_sessions_and_unload();
    test_subscription_lifetime();

    return summary();
}
