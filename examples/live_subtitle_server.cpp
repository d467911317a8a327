#include "huginn/config.h"
#include "huginn/model_manager.h"
#include "huginn/model_store.h"
#include "huginn/server.h"
#include "huginn/task_pool.h"
#include "huginn/transcription_dispatcher.h"
#include "huginn/translation_dispatcher.h"
#include "huginn/translator.h"
#include "huginn/whisper_engine.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct CliOverrides {
    std::string config_path;
    std::string host;
    int port = -1;
    int threads = -1;
    std::string models_dir;
    std::string model;
    std::string language;
    std::string device;
    bool no_preload = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH       JSON configuration file\n";
    std::cout << "      --host ADDRESS      Listen address (default 0.0.0.0)\n";
    std::cout << "  -p, --port N            Listen port (default 8000)\n";
    std::cout << "  -t, --threads N         I/O threads\n";
    std::cout << "      --models-dir PATH   Local Whisper model root\n";
    std::cout << "  -m, --model NAME        Default model (tiny, base, small, medium, large)\n";
    std::cout << "  -l, --language CODE     Spoken language (default sv)\n";
    std::cout << "      --device NAME       cpu, cuda or auto\n";
    std::cout << "      --no-preload        Do not load the default model at startup\n";
    std::cout << "  -h, --help              Show this help\n";
}

// @return false if the program should exit (help or bad arguments)
bool parse_args(int argc, char* argv[], CliOverrides& cli, int& exit_code) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string("Missing value for ") + name);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return false;
        } else if (arg == "-c" || arg == "--config") {
            cli.config_path = value("--config");
        } else if (arg == "--host") {
            cli.host = value("--host");
        } else if (arg == "-p" || arg == "--port") {
            cli.port = std::stoi(value("--port"));
        } else if (arg == "-t" || arg == "--threads") {
            cli.threads = std::stoi(value("--threads"));
        } else if (arg == "--models-dir") {
            cli.models_dir = value("--models-dir");
        } else if (arg == "-m" || arg == "--model") {
            cli.model = value("--model");
        } else if (arg == "-l" || arg == "--language") {
            cli.language = value("--language");
        } else if (arg == "--device") {
            cli.device = value("--device");
        } else if (arg == "--no-preload") {
            cli.no_preload = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            print_usage(argv[0]);
            exit_code = 1;
            return false;
        }
    }
    return true;
}

void apply(const CliOverrides& cli, huginn::Config& config) {
    if (!cli.host.empty()) config.server.address = cli.host;
    if (cli.port >= 0) config.server.port = cli.port;
    if (cli.threads >= 0) config.server.io_threads = cli.threads;
    if (!cli.models_dir.empty()) config.store.models_dir = cli.models_dir;
    if (!cli.model.empty()) config.recognition.default_model = cli.model;
    if (!cli.language.empty()) config.recognition.decoding.language = cli.language;
    if (!cli.device.empty()) config.engine.device = huginn::parse_device(cli.device);
    if (cli.no_preload) config.server.preload_default_model = false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    huginn::Config config;
    try {
        CliOverrides cli;
        int exit_code = 0;
        if (!parse_args(argc, argv, cli, exit_code)) {
            return exit_code;
        }
        if (!cli.config_path.empty()) {
            config = huginn::load_config(cli.config_path);
        }
        apply(cli, config);
        huginn::validate_config(config);
    } catch (const std::exception& e) {
        std::cerr << "[Config] ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Huginn - Live Swedish Subtitles\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Listen:        " << config.server.address << ":" << config.server.port << "\n";
    std::cout << "Models:        " << config.store.models_dir << " (default "
              << config.recognition.default_model << ")\n";
    std::cout << "Device:        " << config.engine.device_string() << " / "
              << config.engine.compute_type_string() << "\n";
    std::cout << "Language:      " << config.recognition.decoding.language << "\n";
    std::cout << "Translation:   " << config.translation.models_dir << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    try {
        auto store = std::make_shared<huginn::HubModelStore>(config.store);
        const huginn::ModelOptions engine_options = config.engine;
        huginn::ModelManager models(
            store,
            [engine_options](const std::string&, const std::string& path) {
                return std::make_shared<huginn::WhisperEngine>(path, engine_options);
            },
            config.models);

        huginn::TranscriptionDispatcher dispatcher(models, config.vad);

        huginn::NllbTranslationEngine translation_engine(config.translation.models_dir, config.engine,
                                                         config.translation.decoding);
        huginn::TaskPool translation_pool(config.translation.threads, config.translation.max_queued);
        huginn::TranslationDispatcher translation(translation_engine, translation_pool);

        auto installed = translation.list_models();
        std::cout << "[Huginn] " << installed.size() << " translation model(s) installed\n";

        if (config.server.preload_default_model) {
            std::cout << "[Huginn] Preloading model: " << config.recognition.default_model << "\n";
            // Completion is reported through /model-status and session events
            models.request_load(config.recognition.default_model);
        }

        huginn::Server server(config, models, dispatcher, &translation);
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "[Huginn] ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
