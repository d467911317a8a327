#include "huginn/config.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace huginn {

using json = nlohmann::json;

namespace {

// Copy `section.key` into `out` if present
template <typename T>
void read(const json& section, const std::string& section_name, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config value " + section_name + "." + key + ": " + e.what());
    }
}

template <typename Rep, typename Period>
void read_duration(const json& section, const std::string& section_name, const char* key,
                   std::chrono::duration<Rep, Period>& out) {
    Rep count = out.count();
    read(section, section_name, key, count);
    out = std::chrono::duration<Rep, Period>(count);
}

const json& section(const json& root, const std::string& name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw std::runtime_error("Config section " + name + " must be an object");
    }
    return *it;
}

} // anonymous namespace

Config parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    static const std::set<std::string> known = {
        "server", "models", "engine", "recognition", "chunking", "subtitles", "translation", "vad"
    };
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!known.count(it.key())) {
            std::cerr << "[Config] Ignoring unknown section: " << it.key() << "\n";
        }
    }

    Config config;

    const json& server = section(root, "server");
    read(server, "server", "address", config.server.address);
    read(server, "server", "port", config.server.port);
    read(server, "server", "io_threads", config.server.io_threads);
    read(server, "server", "allowed_origin", config.server.allowed_origin);
    read(server, "server", "max_pending_blocks", config.server.max_pending_blocks);
    read(server, "server", "max_message_bytes", config.server.max_message_bytes);
    read_duration(server, "server", "load_model_wait_seconds", config.server.load_model_wait);
    read(server, "server", "preload_default_model", config.server.preload_default_model);

    const json& models = section(root, "models");
    read(models, "models", "names", config.models.models);
    read(models, "models", "default", config.recognition.default_model);
    std::int64_t timeout_seconds = config.models.operation_timeout.count() / 1000;
    read(models, "models", "operation_timeout_seconds", timeout_seconds);
    config.models.operation_timeout = std::chrono::seconds(timeout_seconds);
    read(models, "models", "dir", config.store.models_dir);
    read(models, "models", "hub_url", config.store.hub_url);
    read(models, "models", "repository_prefix", config.store.repository_prefix);
    read(models, "models", "revision", config.store.revision);
    read_duration(models, "models", "stall_timeout_seconds", config.store.stall_timeout);
    read(models, "models", "size_labels", config.store.size_labels);

    const json& engine = section(root, "engine");
    std::string device = config.engine.device_string();
    std::string compute_type = config.engine.compute_type_string();
    read(engine, "engine", "device", device);
    read(engine, "engine", "compute_type", compute_type);
    try {
        config.engine.device = parse_device(device);
        config.engine.compute_type = parse_compute_type(compute_type);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value in engine: ") + e.what());
    }
    read(engine, "engine", "intra_threads", config.engine.intra_threads);
    read(engine, "engine", "inter_threads", config.engine.inter_threads);
    read(engine, "engine", "device_index", config.engine.device_index);

    const json& recognition = section(root, "recognition");
    read(recognition, "recognition", "language", config.recognition.decoding.language);
    read(recognition, "recognition", "max_length", config.recognition.decoding.max_length);
    read(recognition, "recognition", "no_speech_threshold", config.recognition.decoding.no_speech_threshold);
    read(recognition, "recognition", "log_prob_threshold", config.recognition.decoding.log_prob_threshold);
    read(recognition, "recognition", "compression_ratio_threshold",
         config.recognition.decoding.compression_ratio_threshold);

    const json& chunking = section(root, "chunking");
    read(chunking, "chunking", "block_samples", config.chunking.block_samples);
    read(chunking, "chunking", "level_blocks", config.chunking.level_blocks);
    read(chunking, "chunking", "overlap_fraction", config.chunking.overlap_fraction);
    read(chunking, "chunking", "instant_blocks", config.chunking.instant_blocks);

    const json& subtitles = section(root, "subtitles");
    read(subtitles, "subtitles", "capacity", config.subtitles.capacity);
    read(subtitles, "subtitles", "translating_capacity", config.subtitles.translating_capacity);
    read_duration(subtitles, "subtitles", "supersede_window_ms", config.subtitles.supersede_window);
    read_duration(subtitles, "subtitles", "duplicate_window_ms", config.duplicate_window);

    const json& translation = section(root, "translation");
    read(translation, "translation", "models_dir", config.translation.models_dir);
    read(translation, "translation", "default_model", config.translation.default_model);
    read(translation, "translation", "threads", config.translation.threads);
    read(translation, "translation", "max_queued", config.translation.max_queued);
    read(translation, "translation", "beam_size", config.translation.decoding.beam_size);
    read(translation, "translation", "max_length", config.translation.decoding.max_length);

    const json& vad = section(root, "vad");
    read(vad, "vad", "enabled", config.vad.enabled);
    read(vad, "vad", "threshold", config.vad.threshold);
    read(vad, "vad", "min_speech_duration_ms", config.vad.min_speech_duration_ms);
    read(vad, "vad", "min_silence_duration_ms", config.vad.min_silence_duration_ms);
    read(vad, "vad", "speech_pad_ms", config.vad.speech_pad_ms);
    read(vad, "vad", "adaptive_threshold", config.vad.adaptive_threshold);
    read(vad, "vad", "silence_amplitude", config.vad.silence_amplitude);
    read(vad, "vad", "verbose", config.vad.verbose);

    return config;
}

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

void validate_config(const Config& config) {
    config.chunking.validate();

    if (config.server.port <= 0 || config.server.port > 65535) {
        throw std::invalid_argument("server.port must be between 1 and 65535");
    }
    if (config.server.io_threads <= 0) {
        throw std::invalid_argument("server.io_threads must be positive");
    }
    if (config.server.max_pending_blocks == 0) {
        throw std::invalid_argument("server.max_pending_blocks must be positive");
    }
    if (config.models.models.empty()) {
        throw std::invalid_argument("models.names must not be empty");
    }
    const auto& names = config.models.models;
    if (std::find(names.begin(), names.end(), config.recognition.default_model) == names.end()) {
        throw std::invalid_argument("models.default '" + config.recognition.default_model +
                                    "' is not in models.names");
    }
    if (config.models.operation_timeout.count() <= 0) {
        throw std::invalid_argument("models.operation_timeout_seconds must be positive");
    }
    if (config.store.stall_timeout.count() <= 0) {
        throw std::invalid_argument("models.stall_timeout_seconds must be positive");
    }
    if (config.subtitles.capacity == 0 || config.subtitles.translating_capacity == 0) {
        throw std::invalid_argument("subtitles capacities must be positive");
    }
    if (config.translation.threads == 0 || config.translation.max_queued == 0) {
        throw std::invalid_argument("translation.threads and translation.max_queued must be positive");
    }
    if (config.recognition.decoding.language.empty()) {
        throw std::invalid_argument("recognition.language must not be empty");
    }
}

SessionSettings session_settings(const Config& config) {
    SessionSettings settings;
    settings.chunking = config.chunking;
    settings.subtitles = config.subtitles;
    settings.duplicate_window = config.duplicate_window;
    settings.recognition = config.recognition.decoding;
    settings.default_translation_model = config.translation.default_model;
    return settings;
}

} // namespace huginn
