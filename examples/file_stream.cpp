#include "huginn/config.h"
#include "huginn/model_manager.h"
#include "huginn/model_store.h"
#include "huginn/session.h"
#include "huginn/session_event.h"
#include "huginn/transcription_dispatcher.h"
#include "huginn/whisper_engine.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Streams a raw mono float32 16 kHz file through one session, as a client would
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <audio.f32> [model] [vad_level] [config.json]\n";
        std::cout << "\n";
        std::cout << "Convert audio with:\n";
        std::cout << "  ffmpeg -i input.wav -f f32le -ac 1 -ar 16000 audio.f32\n";
        return 1;
    }

    std::string audio_path = argv[1];

    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Huginn - File Stream\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    try {
        huginn::Config config;
        if (argc > 4) {
            config = huginn::load_config(argv[4]);
        }
        huginn::validate_config(config);

        std::ifstream file(audio_path, std::ios::binary);
        if (!file) {
            std::cerr << "[Example] Cannot open audio file: " << audio_path << "\n";
            return 1;
        }
        std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (bytes.size() % sizeof(float) != 0) {
            std::cerr << "[Example] File size is not a multiple of 4 bytes: " << audio_path << "\n";
            return 1;
        }
        std::vector<float> samples(bytes.size() / sizeof(float));
        std::memcpy(samples.data(), bytes.data(), bytes.size());
        std::cout << "[Example] " << samples.size() << " samples ("
                  << static_cast<float>(samples.size()) / huginn::SAMPLE_RATE << "s)\n";

        huginn::SessionOptions options;
        options.model = argc > 2 ? argv[2] : config.recognition.default_model;
        options.vad_level = argc > 3 ? std::stoi(argv[3]) : 3;
        options.language = config.recognition.decoding.language;

        auto store = std::make_shared<huginn::HubModelStore>(config.store);
        const huginn::ModelOptions engine_options = config.engine;
        huginn::ModelManager models(
            store,
            [engine_options](const std::string&, const std::string& path) {
                return std::make_shared<huginn::WhisperEngine>(path, engine_options);
            },
            config.models);
        huginn::TranscriptionDispatcher dispatcher(models, config.vad);

        // Wait for the model up front so no chunk is dropped as not ready
        huginn::ModelSnapshot loaded = models.request_load(options.model).get();
        if (loaded.status != huginn::ModelStatus::Ready) {
            std::cerr << "[Example] Model " << options.model << " failed: " << loaded.error << "\n";
            return 1;
        }

        huginn::Session session("file", options, huginn::session_settings(config), models, dispatcher,
                                nullptr, [](const huginn::SessionEvent& event) {
                                    std::cout << huginn::to_json(event) << "\n";
                                });
        session.open();

        auto start = std::chrono::steady_clock::now();
        const std::size_t block = config.chunking.block_samples;
        for (std::size_t offset = 0; offset < samples.size(); offset += block) {
            std::size_t count = std::min(block, samples.size() - offset);
            session.ingest(samples.data() + offset, count);
        }
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        std::cout << "\n═══════════════════════════════════════════════════════════\n";
        std::cout << "SUBTITLES\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        for (const auto& entry : session.history()) {
            std::cout << "[" << entry.segment.id << "] " << entry.segment.text << "\n";
        }
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "Processed in " << elapsed << "s\n";

        session.close();
    } catch (const std::exception& e) {
        std::cerr << "[Example] ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
