#pragma once

#include "chunker.h"
#include "export.h"
#include "model_manager.h"
#include "model_store.h"
#include "session.h"
#include "subtitle_reconciler.h"
#include "translator.h"
#include "types.h"
#include "vad.h"
#include <chrono>
#include <cstddef>
#include <string>

namespace huginn {

/**
 * @brief Network surface of the server
 */
struct ServerOptions {
    std::string address = "0.0.0.0";
    int port = 8000;
    int io_threads = 2;                             // io_context threads
    std::string allowed_origin = "http://localhost:3000";  // CORS origin
    std::size_t max_pending_blocks = 64;            // Audio blocks queued per session before dropping
    std::size_t max_message_bytes = 1 << 20;        // Largest inbound WebSocket message
    std::chrono::seconds load_model_wait{30};       // POST /load-model wait for cached models
    bool preload_default_model = true;              // Load the default model at startup
};

/**
 * @brief Speech recognition defaults
 */
struct RecognitionSettings {
    std::string default_model = "small";
    RecognitionOptions decoding;                    // language, max_length, thresholds
};

/**
 * @brief Translation pipeline
 */
struct TranslationSettings {
    std::string models_dir = "models/translation";  // One NLLB model per subdirectory
    std::string default_model;                      // Used when a session names none
    std::size_t threads = 2;
    std::size_t max_queued = 64;
    TranslationOptions decoding;
};

/**
 * @brief Complete server configuration
 *
 * Every field has a usable default; a configuration file only needs the
 * values it changes.
 */
struct Config {
    ServerOptions server;
    ModelManagerOptions models;
    ModelStoreOptions store;
    ModelOptions engine;
    RecognitionSettings recognition;
    ChunkPolicy chunking;
    SubtitleOptions subtitles;
    std::chrono::milliseconds duplicate_window{2000};
    TranslationSettings translation;
    VADOptions vad;
};

/**
 * @brief Parse a JSON configuration document
 *
 * Missing keys keep their defaults.
 * @throws std::runtime_error naming the offending key on malformed JSON or a type mismatch
 */
HUGINN_API Config parse_config(const std::string& json_text);

/**
 * @brief Read and parse a JSON configuration file
 * @throws std::runtime_error if the file cannot be read or parsed
 */
HUGINN_API Config load_config(const std::string& path);

/**
 * @brief Check cross-field constraints
 * @throws std::invalid_argument describing the first violation
 */
HUGINN_API void validate_config(const Config& config);

/// Session tuning derived from the configuration
HUGINN_API SessionSettings session_settings(const Config& config);

} // namespace huginn
