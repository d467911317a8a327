#pragma once

#include "huginn/model_store.h"
#include "huginn/recognizer.h"
#include "huginn/translator.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════
// Reporting
// ═══════════════════════════════════════════════════════════════════════════

static int g_passed = 0;
static int g_failed = 0;

inline void check(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "  ✓ " << what << "\n";
        g_passed++;
    } else {
        std::cout << "  ✗ " << what << "\n";
        g_failed++;
    }
}

inline void section(const std::string& title) {
    std::cout << "\n[" << title << "]\n";
}

inline void banner(const std::string& title) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << title << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
}

inline int summary() {
    std::cout << "\n═══════════════════════════════════════════════════════════\n";
    std::cout << "Passed: " << g_passed << "  Failed: " << g_failed << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    return g_failed == 0 ? 0 : 1;
}

template <typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

// Poll until `condition` holds or the timeout passes
template <typename Fn>
bool wait_for(Fn&& condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// ═══════════════════════════════════════════════════════════════════════════
// Fakes
// ═══════════════════════════════════════════════════════════════════════════

/// Gate a test thread opens to release a blocked fake
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    // @return false on timeout
    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

/// In-memory artifact store
class FakeStore : public huginn::ModelStore {
public:
    bool exists(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return present_.count(name) > 0;
    }

    std::string size_label(const std::string& name) const override {
        return name == "small" ? "500 MB" : "Unknown";
    }

    std::string model_path(const std::string& name) const override {
        return "fake/" + name;
    }

    void download(const std::string& name, const huginn::DownloadProgressCallback& progress) override {
        downloads++;
        if (flood_progress) {
            // Announce a new percentage on every call until told to abort
            for (std::uint64_t n = 0;; ++n) {
                if (!progress(n % 100, 100)) {
                    throw std::runtime_error("Download aborted");
                }
            }
        }
        if (block_download) {
            // Keep reporting until released or told to abort
            while (!release.wait_for(std::chrono::milliseconds(10))) {
                if (!progress(10, 100)) {
                    throw std::runtime_error("Download aborted");
                }
            }
        }
        if (fail_download) {
            throw std::runtime_error("Network unreachable");
        }
        if (!progress(50, 100) || !progress(100, 100)) {
            throw std::runtime_error("Download aborted");
        }
        add(name);
    }

    void add(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        present_.insert(name);
    }

    std::atomic<int> downloads{0};
    std::atomic<bool> fail_download{false};
    std::atomic<bool> block_download{false};
    std::atomic<bool> flood_progress{false};
    Gate release;

private:
    mutable std::mutex mutex_;
    std::set<std::string> present_;
};

/// Recognition engine returning scripted segments
class FakeEngine : public huginn::RecognitionEngine {
public:
    std::vector<huginn::RecognizedSegment> transcribe(
        const std::vector<float>& samples,
        const huginn::RecognitionOptions& options) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls++;
        last_size = samples.size();
        last_options = options;
        if (fail_next > 0) {
            fail_next--;
            throw std::runtime_error("Decoder error");
        }
        if (script.empty()) {
            return {};
        }
        std::string text = script.front();
        if (script.size() > 1) {
            script.erase(script.begin());
        }
        if (text.empty()) {
            return {};
        }
        huginn::RecognizedSegment segment;
        segment.text = text;
        segment.start = 0.0f;
        segment.end = static_cast<float>(samples.size()) / huginn::SAMPLE_RATE;
        return {segment};
    }

    // Texts returned by successive calls; the last one repeats
    void set_script(std::vector<std::string> texts) {
        std::lock_guard<std::mutex> lock(mutex_);
        script = std::move(texts);
    }

    void fail_calls(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next = count;
    }

    int call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls;
    }

    huginn::RecognitionOptions options_seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_options;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> script;
    int fail_next = 0;
    int calls = 0;
    std::size_t last_size = 0;
    huginn::RecognitionOptions last_options;
};

/// Translation engine producing "<target>: <text>"
class FakeTranslationEngine : public huginn::TranslationEngine {
public:
    std::vector<std::string> list_models() const override {
        return {"nllb-fake"};
    }

    std::string translate(const std::string& text,
                          const std::string&,
                          const std::string& target_language,
                          const std::string& model_id) override
    {
        calls++;
        if (block) {
            release.wait();
        }
        if (fail) {
            throw std::runtime_error("Translation backend unavailable");
        }
        if (model_id != "nllb-fake") {
            throw std::invalid_argument("Unknown translation model: " + model_id);
        }
        return target_language + ": " + text;
    }

    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
    std::atomic<bool> block{false};
    Gate release;
};

/// Steady 220 Hz sine
inline std::vector<float> tone(std::size_t count, float amplitude = 0.3f) {
    std::vector<float> samples(count);
    for (std::size_t i = 0; i < count; ++i) {
        samples[i] = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 220.0 * i / huginn::SAMPLE_RATE));
    }
    return samples;
}
