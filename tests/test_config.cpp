/**
 * @file test_config.cpp
 * @brief JSON configuration parsing and validation
 */

#include "huginn/config.h"
#include "test_support.h"
#include <cstdio>
#include <fstream>

using namespace huginn;

namespace {

void test_defaults() {
    section("Defaults");

    Config config = parse_config("{}");
    check(config.server.port == 8000, "port defaults to 8000");
    check(config.server.allowed_origin == "http://localhost:3000", "CORS origin defaults to the web client");
    check(config.recognition.default_model == "small", "default model is small");
    check(config.recognition.decoding.language == "sv", "spoken language is Swedish");
    check(config.models.models.size() == 5, "five model sizes are known");
    check(config.duplicate_window == std::chrono::milliseconds(2000), "duplicate window is 2 s");
    check(config.subtitles.capacity == 5 && config.subtitles.translating_capacity == 3, "history capacities 5 and 3");
    check(config.subtitles.supersede_window == std::chrono::milliseconds(3000), "supersede window is 3 s");
    check(!throws([&] { validate_config(config); }), "defaults validate");

    SessionSettings settings = session_settings(config);
    check(settings.chunking.block_samples == 4096, "sessions inherit the chunk policy");
    check(settings.recognition.language == "sv", "sessions inherit the language");
}

void test_overrides() {
    section("Overrides");

    Config config = parse_config(R"({
        "server": {"port": 9001, "io_threads": 4, "load_model_wait_seconds": 5, "preload_default_model": false},
        "models": {"names": ["tiny", "small"], "default": "tiny", "operation_timeout_seconds": 60,
                   "dir": "/var/lib/huginn", "size_labels": {"tiny": "75 MB"}, "stall_timeout_seconds": 10},
        "engine": {"device": "cuda", "compute_type": "float16"},
        "recognition": {"language": "no", "no_speech_threshold": 0.5},
        "chunking": {"block_samples": 2048, "level_blocks": [40, 30, 20, 10, 5]},
        "subtitles": {"capacity": 8, "duplicate_window_ms": 1500},
        "translation": {"models_dir": "/opt/nllb", "default_model": "nllb-600m", "threads": 3},
        "vad": {"enabled": false}
    })");

    check(config.server.port == 9001 && config.server.io_threads == 4, "server section is read");
    check(config.server.load_model_wait == std::chrono::seconds(5), "load wait is read in seconds");
    check(!config.server.preload_default_model, "preload can be switched off");
    check(config.models.models.size() == 2 && config.recognition.default_model == "tiny", "model list and default");
    check(config.models.operation_timeout == std::chrono::seconds(60), "operation timeout in seconds");
    check(config.store.models_dir == "/var/lib/huginn", "models directory");
    check(config.store.size_labels.at("tiny") == "75 MB", "size labels");
    check(config.store.stall_timeout == std::chrono::seconds(10), "download stall timeout in seconds");
    check(config.engine.device == DeviceType::CUDA && config.engine.compute_type == ComputeType::Float16,
          "engine device and precision");
    check(config.recognition.decoding.language == "no", "language override");
    check(config.recognition.decoding.no_speech_threshold == 0.5f, "decoder threshold");
    check(config.chunking.block_samples == 2048 && config.chunking.level_blocks[0] == 40, "chunk policy");
    check(config.subtitles.capacity == 8, "subtitle capacity");
    check(config.duplicate_window == std::chrono::milliseconds(1500), "duplicate window in milliseconds");
    check(config.translation.default_model == "nllb-600m" && config.translation.threads == 3, "translation section");
    check(!config.vad.enabled, "speech gate can be disabled");
    check(!throws([&] { validate_config(config); }), "overridden config validates");

    check(!throws([] { parse_config(R"({"future_section": {"x": 1}})"); }), "unknown sections are ignored");
}

void test_errors() {
    section("Errors");

    check(throws([] { parse_config("{not json"); }), "malformed JSON is rejected");
    check(throws([] { parse_config("[1, 2]"); }), "non-object root is rejected");
    check(throws([] { parse_config(R"({"server": 5})"); }), "non-object section is rejected");
    check(throws([] { parse_config(R"({"server": {"port": "eighty"}})"); }), "type mismatch is rejected");
    check(throws([] { parse_config(R"({"engine": {"device": "tpu"}})"); }), "unknown device is rejected");

    try {
        parse_config(R"({"server": {"port": "eighty"}})");
    } catch (const std::runtime_error& e) {
        check(std::string(e.what()).find("server.port") != std::string::npos, "error names the offending key");
    }

    check(throws([] { load_config("/nonexistent/huginn.json"); }), "missing file is rejected");
}

void test_validation() {
    section("Validation");

    auto invalid = [](const std::function<void(Config&)>& mutate) {
        Config config;
        mutate(config);
        return throws([&] { validate_config(config); });
    };

    check(invalid([](Config& c) { c.server.port = 0; }), "port 0 is rejected");
    check(invalid([](Config& c) { c.server.port = 70000; }), "port above 65535 is rejected");
    check(invalid([](Config& c) { c.server.io_threads = 0; }), "zero I/O threads is rejected");
    check(invalid([](Config& c) { c.models.models.clear(); }), "empty model list is rejected");
    check(invalid([](Config& c) { c.recognition.default_model = "huge"; }), "default outside the list is rejected");
    check(invalid([](Config& c) { c.models.operation_timeout = std::chrono::milliseconds(0); }),
          "zero timeout is rejected");
    check(invalid([](Config& c) { c.store.stall_timeout = std::chrono::seconds(0); }),
          "zero download stall timeout is rejected");
    check(invalid([](Config& c) { c.chunking.level_blocks = {10, 20, 30, 40, 50}; }),
          "chunk sizes growing with the level are rejected");
    check(invalid([](Config& c) { c.subtitles.translating_capacity = 0; }), "zero history capacity is rejected");
    check(invalid([](Config& c) { c.translation.max_queued = 0; }), "zero translation queue is rejected");
    check(invalid([](Config& c) { c.recognition.decoding.language.clear(); }), "empty language is rejected");
}

void test_load_file() {
    section("Config file");

    const std::string path = "huginn_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"port": 8123}})";
    }
    Config config = load_config(path);
    check(config.server.port == 8123, "file contents are parsed");
    std::remove(path.c_str());
}

} // anonymous namespace

int main() {
    banner("Huginn - Config Tests");

    test_defaults();
    test_overrides();
    test_errors();
    test_validation();
    test_load_file();

    return summary();
}
