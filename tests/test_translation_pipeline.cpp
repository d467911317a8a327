/**
 * @file test_translation_pipeline.cpp
 * @brief Translation channels, worker pool, audio block queue and model discovery
 */

#include "huginn/block_queue.h"
#include "huginn/task_pool.h"
#include "huginn/translation_dispatcher.h"
#include "huginn/translator.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>

using namespace huginn;
using std::chrono::milliseconds;
namespace fs = std::filesystem;

namespace {

TranslationJob make_job(std::uint64_t id, const std::string& text, const std::string& model = "nllb-fake") {
    TranslationJob job;
    job.segment_id = id;
    job.source_text = text;
    job.source_language = "sv";
    job.target_language = "english";
    job.model_id = model;
    return job;
}

void test_task_pool() {
    section("Task pool");

    TaskPool pool(2, 8);
    check(pool.threads() == 2, "pool starts the requested workers");

    std::atomic<int> done{0};
    for (int i = 0; i < 8; ++i) {
        pool.post([&] { done++; });
    }
    check(wait_for([&] { return done == 8; }), "posted tasks run");

    check(pool.post([] { throw std::runtime_error("boom"); }), "throwing task is accepted");
    check(pool.post([&] { done++; }), "pool keeps working after a task throws");
    check(wait_for([&] { return done == 9; }), "later task still runs");

    Gate gate;
    TaskPool tiny(1, 1);
    tiny.post([&] { gate.wait(); });
    wait_for([&] { return tiny.pending() == 0; });
    check(tiny.post([] {}), "one task may wait");
    check(!tiny.post([] {}), "queue beyond capacity is rejected");
    gate.open();

    tiny.shutdown();
    check(!tiny.post([] {}), "stopped pool rejects tasks");
}

void test_channel_delivery() {
    section("Channel delivery");

    FakeTranslationEngine engine;
    TaskPool pool(2, 16);
    TranslationDispatcher dispatcher(engine, pool);

    std::mutex mutex;
    std::vector<TranslationJob> results;
    auto channel = dispatcher.open_channel([&](const TranslationJob& job) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(job);
    });

    check(channel->submit(make_job(1, "Hej")), "job is accepted");
    check(channel->submit(make_job(2, "Hej", "missing-model")), "job for a missing model is accepted");
    check(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size() == 2;
    }), "both jobs complete");

    std::lock_guard<std::mutex> lock(mutex);
    bool ok = false;
    bool failed = false;
    for (const auto& job : results) {
        if (job.segment_id == 1 && !job.failed && job.result == "english: Hej") ok = true;
        if (job.segment_id == 2 && job.failed && job.error.find("missing-model") != std::string::npos) failed = true;
    }
    check(ok, "successful job carries its result and segment id");
    check(failed, "failed job carries the error");

    check(dispatcher.translate("Hej", "sv", "german", "nllb-fake") == "german: Hej", "synchronous translation");
    check(dispatcher.list_models() == std::vector<std::string>{"nllb-fake"}, "models come from the engine");
}

void test_channel_cancel() {
    section("Cancelled channel");

    FakeTranslationEngine engine;
    engine.block = true;
    TaskPool pool(1, 16);
    TranslationDispatcher dispatcher(engine, pool);

    std::atomic<int> delivered{0};
    auto channel = dispatcher.open_channel([&](const TranslationJob&) { delivered++; });

    channel->submit(make_job(1, "ett"));
    channel->submit(make_job(2, "två"));
    check(wait_for([&] { return engine.calls == 1; }), "first job is translating");

    channel->cancel();
    check(channel->cancelled(), "channel reports cancelled");
    check(!channel->submit(make_job(3, "tre")), "cancelled channel rejects jobs");

    channel.reset();
    engine.release.open();
    pool.shutdown();

    check(delivered == 0, "no result is delivered after cancel");
    check(engine.calls == 1, "queued job is skipped once cancelled");
}

void test_block_queue() {
    section("Audio block queue");

    BlockQueue<int> queue(3);
    for (int i = 1; i <= 5; ++i) {
        queue.push(int(i));
    }
    check(queue.size() == 3, "queue holds at most its capacity");
    check(queue.dropped_count() == 2, "overflow drops are counted");

    int value = 0;
    queue.pop(value);
    check(value == 3, "oldest blocks are the ones dropped");

    std::atomic<bool> returned{false};
    BlockQueue<int> waiting;
    std::thread consumer([&] {
        int v = 0;
        while (waiting.pop(v)) {}
        returned = true;
    });
    waiting.push(1);
    waiting.stop();
    consumer.join();
    check(returned, "stop releases a blocked consumer");
    check(!waiting.push(2), "stopped queue rejects blocks");

    // Negative values stand for control commands that must survive overflow
    BlockQueue<int> mixed(2, [](const int& v) { return v > 0; });
    mixed.push(1);
    mixed.push(-1);
    mixed.push(2);
    mixed.push(3);
    check(mixed.dropped_count() == 2, "overflow drops droppable items only");

    std::vector<int> drained;
    while (mixed.size() > 0) {
        int v = 0;
        mixed.pop(v);
        drained.push_back(v);
    }
    check(drained == std::vector<int>{-1, 3}, "control command is kept in order with the newest block");

    BlockQueue<int> controls(1, [](const int& v) { return v > 0; });
    controls.push(-1);
    controls.push(-2);
    check(controls.size() == 2 && controls.dropped_count() == 0, "control commands are never dropped");
}

void test_model_discovery() {
    section("Translation model discovery");

    fs::path root = fs::temp_directory_path() / "huginn_translation_models_test";
    fs::remove_all(root);
    fs::create_directories(root / "nllb-600m");
    fs::create_directories(root / "nllb-1.3b");
    fs::create_directories(root / "empty-dir");
    std::ofstream(root / "nllb-600m" / "model.bin") << "x";
    std::ofstream(root / "nllb-1.3b" / "model.bin") << "x";

    NllbTranslationEngine engine(root.string());
    std::vector<std::string> expected = {"nllb-1.3b", "nllb-600m"};
    check(engine.list_models() == expected, "directories with model.bin are listed, sorted");

    check(throws([&] { engine.translate("Hej", "sv", "english", "../etc"); }), "path-like model ids are rejected");
    check(throws([&] { engine.translate("Hej", "sv", "english", ".."); }), "parent directory is rejected");
    check(throws([&] { engine.translate("Hej", "sv", "english", "empty-dir"); }), "directory without a model is rejected");

    NllbTranslationEngine missing((root / "does-not-exist").string());
    check(missing.list_models().empty(), "missing models directory lists nothing");

    fs::remove_all(root);
}

} // anonymous namespace

int main() {
    banner("Huginn - Translation Pipeline Tests");

    test_task_pool();
    test_channel_delivery();
    test_channel_cancel();
    test_block_queue();
    test_model_discovery();

    return summary();
}
