#pragma once

#include "export.h"
#include "http_fetch.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Byte progress of a model download; return false to abort it
 */
using DownloadProgressCallback = std::function<bool(std::uint64_t done, std::uint64_t total)>;

/**
 * @brief Local model artifacts, as seen by the model manager
 *
 * Implementations must be safe to call from the manager's operation threads.
 * Different model names may be queried and downloaded concurrently.
 */
class HUGINN_API ModelStore {
public:
    virtual ~ModelStore() = default;

    /// True if every required artifact of `name` is on disk
    virtual bool exists(const std::string& name) const = 0;

    /// Human-readable download size ("500 MB"), "Unknown" if not catalogued
    virtual std::string size_label(const std::string& name) const = 0;

    /// Directory handed to the recognition engine
    virtual std::string model_path(const std::string& name) const = 0;

    /**
     * @brief Fetch the artifacts of `name`
     *
     * @throws FetchAborted if `progress` returned false
     * @throws std::runtime_error on any other failure (partial files are removed)
     */
    virtual void download(const std::string& name, const DownloadProgressCallback& progress) = 0;
};

/**
 * @brief Where and how the hub store fetches models
 */
struct ModelStoreOptions {
    std::string models_dir = "models";                    // Local root
    std::string hub_url = "https://huggingface.co";
    std::string repository_prefix = "KBLab/kb-whisper-";  // Repository = prefix + model name
    std::string revision = "main";
    std::chrono::seconds stall_timeout{30};               // Per network step

    // CTranslate2 Whisper artifacts
    std::vector<std::string> required_files = {
        "config.json", "model.bin", "tokenizer.json", "vocabulary.json"
    };
    std::vector<std::string> optional_files = {"preprocessor_config.json"};

    std::map<std::string, std::string> size_labels = {
        {"tiny", "80 MB"},
        {"base", "150 MB"},
        {"small", "500 MB"},
        {"medium", "1.5 GB"},
        {"large", "3 GB"},
    };
};

/**
 * @brief Model store backed by a Hugging Face style hub
 *
 * Model `small` lives in `<models_dir>/kb-whisper-small/` and is fetched from
 * `<hub_url>/KBLab/kb-whisper-small/resolve/<revision>/<file>`. Each file is
 * written to `<file>.part-<n>` and renamed once complete, so a model only
 * "exists" after a successful download.
 */
class HUGINN_API HubModelStore : public ModelStore {
public:
    explicit HubModelStore(const ModelStoreOptions& options = {});

    bool exists(const std::string& name) const override;
    std::string size_label(const std::string& name) const override;
    std::string model_path(const std::string& name) const override;
    void download(const std::string& name, const DownloadProgressCallback& progress) override;

    /// Remote URL of one artifact
    std::string file_url(const std::string& name, const std::string& file) const;

    const ModelStoreOptions& options() const { return options_; }

private:
    ModelStoreOptions options_;
};

} // namespace huginn
