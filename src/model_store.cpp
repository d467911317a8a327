#include "huginn/model_store.h"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace huginn {

namespace {

std::atomic<std::uint64_t> download_serial{0};

// "KBLab/kb-whisper-" -> "kb-whisper-"
std::string local_prefix(const std::string& repository_prefix) {
    auto slash = repository_prefix.rfind('/');
    return slash == std::string::npos ? repository_prefix : repository_prefix.substr(slash + 1);
}

std::string format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        unit++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

} // anonymous namespace

HubModelStore::HubModelStore(const ModelStoreOptions& options)
    : options_(options)
{
}

std::string HubModelStore::model_path(const std::string& name) const {
    return (fs::path(options_.models_dir) / (local_prefix(options_.repository_prefix) + name)).string();
}

bool HubModelStore::exists(const std::string& name) const {
    std::error_code ec;
    fs::path dir = model_path(name);
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    for (const auto& file : options_.required_files) {
        if (!fs::is_regular_file(dir / file, ec)) {
            return false;
        }
    }
    return true;
}

std::string HubModelStore::size_label(const std::string& name) const {
    auto it = options_.size_labels.find(name);
    return it != options_.size_labels.end() ? it->second : "Unknown";
}

std::string HubModelStore::file_url(const std::string& name, const std::string& file) const {
    return options_.hub_url + "/" + options_.repository_prefix + name +
           "/resolve/" + options_.revision + "/" + file;
}

void HubModelStore::download(const std::string& name, const DownloadProgressCallback& progress) {
    fs::path dir = model_path(name);
    fs::create_directories(dir);

    // Size every artifact first so progress covers the whole model
    struct Artifact {
        std::string file;
        std::uint64_t size;
    };
    std::vector<Artifact> artifacts;
    std::uint64_t total = 0;

    for (const auto& file : options_.required_files) {
        std::uint64_t size = fetch_content_length(file_url(name, file), 5, options_.stall_timeout);
        artifacts.push_back({file, size});
        total += size;
    }
    for (const auto& file : options_.optional_files) {
        try {
            std::uint64_t size = fetch_content_length(file_url(name, file), 5, options_.stall_timeout);
            artifacts.push_back({file, size});
            total += size;
        } catch (const std::runtime_error& e) {
            std::cout << "[Models] Skipping optional " << file << " for " << name << ": " << e.what() << "\n";
        }
    }

    std::cout << "[Models] Downloading " << options_.repository_prefix << name
              << " (" << format_bytes(total) << ") to " << dir.string() << "\n";

    std::uint64_t completed = 0;
    for (const auto& artifact : artifacts) {
        fs::path target = dir / artifact.file;
        // An abandoned download of the same model may still be writing its own part file
        fs::path part = target;
        part += ".part-" + std::to_string(++download_serial);

        std::error_code ec;
        if (fs::is_regular_file(target, ec)) {
            completed += artifact.size;
            continue;
        }

        FetchProgress file_progress = [&](std::uint64_t done, std::uint64_t) {
            return !progress || progress(completed + done, total);
        };

        try {
            completed += fetch_to_file(file_url(name, artifact.file), part.string(), file_progress, 5,
                                       options_.stall_timeout);
        } catch (const std::exception&) {
            fs::remove(part, ec);
            throw;
        }

        fs::rename(part, target);
    }

    std::cout << "[Models] ✓ " << name << " downloaded\n";
}

} // namespace huginn
