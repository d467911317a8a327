#pragma once

#include "config.h"
#include "export.h"
#include "model_manager.h"
#include "session.h"
#include "transcription_dispatcher.h"
#include "translation_dispatcher.h"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief HTTP + WebSocket front end (Boost.Beast)
 *
 * Serves the streaming channel `GET /ws/transcribe` and the JSON endpoints
 * for model control and translation:
 *
 *   GET  /                      liveness
 *   GET  /check-model           local availability and download size
 *   GET  /model-status          lifecycle snapshot
 *   POST /load-model            start loading; waits for cached models
 *   GET  /download-progress     first model currently downloading
 *   GET  /translation-models    installed translation models
 *   POST /translate             one-shot translation
 *
 * Each WebSocket connection gets a Session and a worker thread that runs
 * recognition; socket I/O stays on the io_context threads.
 */
class HUGINN_API Server {
public:
    /**
     * @param translation May be null (translation endpoints report an error)
     * @throws std::runtime_error if the listening socket cannot be opened
     */
    Server(const Config& config,
           ModelManager& models,
           TranscriptionDispatcher& dispatcher,
           TranslationDispatcher* translation);

    /// Stops and joins everything still running
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Serve until stop() or SIGINT/SIGTERM
    void run();

    /// Thread-safe
    void stop();

    /// Port actually bound (useful with port 0)
    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Split "/path?a=1&b=x%20y" into path and decoded parameters
 */
HUGINN_API std::map<std::string, std::string> parse_query(const std::string& target, std::string* path = nullptr);

/// Percent-decoding with '+' as space
HUGINN_API std::string url_decode(const std::string& text);

/**
 * @brief Session options from streaming-channel parameters
 *
 * Recognized: model, vad, instant, target_language, translation_model.
 * @throws std::invalid_argument for an unknown model, a VAD level outside
 *         1..5 or a malformed value
 */
HUGINN_API SessionOptions parse_stream_params(const std::map<std::string, std::string>& params,
                                              const Config& config,
                                              const ModelManager& models);

/**
 * @brief Little-endian float32 payload to samples
 * @return false if the length is not a multiple of 4
 */
HUGINN_API bool decode_samples(const void* data, std::size_t bytes, std::vector<float>& out);

} // namespace huginn
