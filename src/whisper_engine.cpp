#include "huginn/whisper_engine.h"
#include "huginn/mel_spectrogram.h"
#include <ctranslate2/models/whisper.h>
#include <ctranslate2/utils.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace huginn {

namespace {

constexpr int WHISPER_WINDOW_SAMPLES = 30 * SAMPLE_RATE;   // 30-second input window
constexpr int WHISPER_WINDOW_FRAMES = 3000;                // 10ms mel frames per window

const std::string GPT2_SPACE = "\xC4\xA0";  // Ġ in UTF-8 (U+0120)

bool is_bracketed_token(const std::string& token) {
    return token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

/**
 * @brief Parse a timestamp token like "<|0.00|>" and return the time in seconds
 * @return Time in seconds, or -1.0f if not a valid timestamp token
 */
float parse_timestamp_token(const std::string& token) {
    if (!is_bracketed_token(token)) return -1.0f;

    std::string inner = token.substr(2, token.size() - 4);
    bool has_dot = false;
    for (char c : inner) {
        if (c == '.') {
            if (has_dot) return -1.0f;
            has_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1.0f;
        }
    }
    if (!has_dot) return -1.0f;

    try {
        return std::stof(inner);
    } catch (const std::exception&) {
        return -1.0f;
    }
}

/**
 * @brief Replace GPT-2 space markers only, for text that is not byte-level
 */
std::string replace_gpt2_spaces(const std::string& text) {
    std::string processed = text;
    size_t pos = 0;
    while ((pos = processed.find(GPT2_SPACE, pos)) != std::string::npos) {
        processed.replace(pos, 2, " ");
        pos += 1;
    }
    return processed;
}

/**
 * @brief Read one UTF-8 code point starting at `pos`
 * @return false on a malformed sequence
 */
bool next_code_point(const std::string& text, size_t& pos, std::uint32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    int extra = 0;
    if (lead < 0x80) {
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        extra = 3;
    } else {
        return false;
    }
    if (pos + extra >= text.size() && extra > 0) {
        return false;
    }
    for (int i = 1; i <= extra; i++) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (byte & 0x3F);
    }
    pos += extra + 1;
    return true;
}

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    std::uint32_t cp = 0;
    while (pos < text.size()) {
        if (!next_code_point(text, pos, cp)) return false;
    }
    return true;
}

/**
 * @brief Inverse of GPT-2's bytes_to_unicode table
 *
 * Printable Latin-1 bytes stand for themselves; the other 68 bytes are
 * shifted to U+0100 and up in byte order (space becomes Ġ, newline Ċ).
 */
const std::map<std::uint32_t, unsigned char>& byte_decoder() {
    static const std::map<std::uint32_t, unsigned char> table = [] {
        std::map<std::uint32_t, unsigned char> t;
        std::uint32_t shifted = 256;
        for (int b = 0; b < 256; b++) {
            const bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
            t[printable ? static_cast<std::uint32_t>(b) : shifted++] = static_cast<unsigned char>(b);
        }
        return t;
    }();
    return table;
}

/**
 * @brief Turn concatenated byte-level BPE token text back into UTF-8
 *
 * Decoding happens on whole runs of tokens because one character may be
 * split across tokens. Text that does not decode to valid UTF-8 was not
 * byte-level and only gets its space markers replaced.
 */
std::string decode_byte_level(const std::string& text) {
    const auto& table = byte_decoder();
    std::string bytes;
    bytes.reserve(text.size());

    size_t pos = 0;
    std::uint32_t cp = 0;
    while (pos < text.size()) {
        if (!next_code_point(text, pos, cp)) {
            return replace_gpt2_spaces(text);
        }
        auto it = table.find(cp);
        if (it == table.end()) {
            return replace_gpt2_spaces(text);
        }
        bytes += static_cast<char>(it->second);
    }

    return is_valid_utf8(bytes) ? bytes : replace_gpt2_spaces(text);
}

std::string trim(std::string text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

ctranslate2::Device to_ct_device(DeviceType device) {
    // Auto tries CUDA first
    return device == DeviceType::CPU ? ctranslate2::Device::CPU : ctranslate2::Device::CUDA;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Text helpers
// ═══════════════════════════════════════════════════════════════════════════

std::string extract_text(const std::vector<std::string>& tokens) {
    std::string text;
    for (const auto& token : tokens) {
        // Skip special tokens (timestamps, language tokens, etc.)
        if (is_bracketed_token(token)) continue;
        text += token;
    }
    return trim(decode_byte_level(text));
}

std::vector<RecognizedSegment> split_timestamped_tokens(
    const std::vector<std::string>& tokens, float duration)
{
    std::vector<RecognizedSegment> segments;
    std::string text;
    float seg_start = 0.0f;
    bool open = false;

    auto close_segment = [&](float end) {
        std::string cleaned = trim(decode_byte_level(text));
        if (!cleaned.empty()) {
            RecognizedSegment seg;
            seg.text = cleaned;
            seg.start = seg_start;
            seg.end = std::max(seg_start, std::min(end, duration));
            segments.push_back(seg);
        }
        text.clear();
        open = false;
    };

    for (const auto& token : tokens) {
        float ts = parse_timestamp_token(token);
        if (ts >= 0.0f) {
            if (open && !trim(decode_byte_level(text)).empty()) {
                close_segment(ts);
            } else {
                seg_start = std::min(ts, duration);
                open = true;
            }
            continue;
        }
        if (is_bracketed_token(token)) continue;

        if (!open) {
            open = true;
        }
        text += token;
    }

    if (open) {
        close_segment(duration);
    }

    return segments;
}

bool looks_like_hallucination(const std::string& text) {
    // Punctuation only ("...", "-"); short words like "Hej" are real speech
    bool has_word_char = false;
    for (char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80 || std::isalnum(byte)) {
            has_word_char = true;
            break;
        }
    }
    if (!has_word_char) {
        std::cerr << "[Huginn] Skipping segment without words: '" << text << "'\n";
        return true;
    }

    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }

    if (words.size() < 4) return false;

    // Same word repeated 4+ times in a row ("Tack Tack Tack Tack"); "ja ja ja" is speech
    int max_repeat_count = 1;
    for (size_t i = 0; i < words.size(); i++) {
        int repeat_count = 1;
        for (size_t j = i + 1; j < words.size() && words[j] == words[i]; j++) {
            repeat_count++;
        }
        max_repeat_count = std::max(max_repeat_count, repeat_count);
    }

    if (max_repeat_count >= 4) {
        std::cerr << "[Huginn] Skipping repetitive hallucination: '"
                  << text.substr(0, std::min(size_t(50), text.length()))
                  << "' (repeat: " << max_repeat_count << "/" << words.size() << " words)\n";
        return true;
    }

    // Repeating n-grams (n = 3-6 words) appearing 3+ times
    for (int ngram_size = 3; ngram_size <= 6 && ngram_size <= static_cast<int>(words.size()) / 2; ngram_size++) {
        std::map<std::string, int> ngram_counts;
        for (size_t i = 0; i + ngram_size <= words.size(); i++) {
            std::string ngram;
            for (int j = 0; j < ngram_size; j++) {
                if (j > 0) ngram += " ";
                ngram += words[i + j];
            }
            if (++ngram_counts[ngram] >= 3) {
                std::cerr << "[Huginn] Skipping phrase-repetition hallucination: '"
                          << ngram << "' repeated 3+ times\n";
                return true;
            }
        }
    }

    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// WhisperEngine::Impl
// ═══════════════════════════════════════════════════════════════════════════

class WhisperEngine::Impl {
public:
    std::unique_ptr<ctranslate2::models::Whisper> model;
    MelSpectrogram mel_converter;
    std::string model_path;

    Impl() : mel_converter(SAMPLE_RATE, 400, 80, 160) {}

    ctranslate2::StorageView compute_features(const std::vector<float>& samples) {
        // Pad (or trim) to Whisper's 30-second window plus one FFT frame
        std::vector<float> padded(samples.begin(),
                                  samples.begin() + std::min<size_t>(samples.size(), WHISPER_WINDOW_SAMPLES));
        padded.resize(WHISPER_WINDOW_SAMPLES + 400, 0.0f);

        std::vector<std::vector<float>> mel_features;
        int n_frames = mel_converter.compute(padded, mel_features);
        if (n_frames < WHISPER_WINDOW_FRAMES) {
            throw std::runtime_error("Failed to compute mel-spectrogram");
        }

        const int n_mels = mel_converter.getMelBins();

        // Whisper expects [batch, n_mels, n_frames]; mel_features is [n_frames][n_mels]
        std::vector<float> flat_features;
        flat_features.reserve(static_cast<size_t>(n_mels) * WHISPER_WINDOW_FRAMES);
        for (int mel = 0; mel < n_mels; mel++) {
            for (int frame = 0; frame < WHISPER_WINDOW_FRAMES; frame++) {
                flat_features.push_back(mel_features[frame][mel]);
            }
        }

        return ctranslate2::StorageView(
            ctranslate2::Shape{1, static_cast<ctranslate2::dim_t>(n_mels),
                               static_cast<ctranslate2::dim_t>(WHISPER_WINDOW_FRAMES)},
            flat_features);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// WhisperEngine Public API
// ═══════════════════════════════════════════════════════════════════════════

WhisperEngine::WhisperEngine(const std::string& model_path, const ModelOptions& options)
    : pimpl_(std::make_unique<Impl>())
{
    try {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "HUGINN WHISPER - LOADING MODEL\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "Path: " << model_path << "\n";
        std::cout << "Device: " << options.device_string()
                  << " (compute: " << options.compute_type_string() << ")\n";

        ctranslate2::ReplicaPoolConfig pool_config;
        if (options.intra_threads > 0) {
            pool_config.num_threads_per_replica = static_cast<size_t>(options.intra_threads);
        }

        pimpl_->model = std::make_unique<ctranslate2::models::Whisper>(
            model_path,
            to_ct_device(options.device),
            ctranslate2::str_to_compute_type(options.compute_type_string()),
            std::vector<int>{options.device_index},
            false,
            pool_config
        );
        pimpl_->model_path = model_path;

        size_t n_mels = pimpl_->model->n_mels();
        std::cout << "Languages: " << (pimpl_->model->is_multilingual() ? "Multilingual" : "English-only")
                  << " (" << pimpl_->model->num_languages() << " languages)\n";
        std::cout << "Mel features: " << n_mels << "\n";

        // Match the model's expected mel bins (128 for large-v3)
        if (n_mels != static_cast<size_t>(pimpl_->mel_converter.getMelBins())) {
            pimpl_->mel_converter = MelSpectrogram(SAMPLE_RATE, 400, static_cast<int>(n_mels), 160);
        }

        std::cout << "✓ Model loaded successfully\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

    } catch (const std::exception& e) {
        std::cerr << "✗ Failed to load Whisper model: " << e.what() << "\n";
        std::cerr << "═══════════════════════════════════════════════════════════\n";
        throw std::runtime_error(std::string("Failed to load Whisper model: ") + e.what());
    }
}

WhisperEngine::~WhisperEngine() = default;

WhisperEngine::WhisperEngine(WhisperEngine&&) noexcept = default;
WhisperEngine& WhisperEngine::operator=(WhisperEngine&&) noexcept = default;

std::vector<RecognizedSegment> WhisperEngine::transcribe(
    const std::vector<float>& samples,
    const RecognitionOptions& options)
{
    if (!pimpl_ || !pimpl_->model) {
        throw std::runtime_error("Whisper model not loaded");
    }

    std::vector<RecognizedSegment> segments;
    if (samples.empty()) return segments;

    const float duration = static_cast<float>(std::min<size_t>(samples.size(), WHISPER_WINDOW_SAMPLES)) / SAMPLE_RATE;

    ctranslate2::StorageView features = pimpl_->compute_features(samples);

    // Format: [<|startoftranscript|>, <|sv|>, <|transcribe|>] - timestamps enabled
    std::vector<std::vector<std::string>> prompts = {{
        "<|startoftranscript|>",
        "<|" + options.language + "|>",
        "<|transcribe|>"
    }};

    ctranslate2::models::WhisperOptions whisper_options;
    whisper_options.beam_size = std::max(1, options.beam_size);
    whisper_options.max_length = options.max_length;
    whisper_options.sampling_topk = 1;
    whisper_options.num_hypotheses = 1;
    whisper_options.return_scores = true;
    whisper_options.return_no_speech_prob = true;
    whisper_options.max_initial_timestamp_index = 50;
    whisper_options.suppress_blank = true;

    auto future_results = pimpl_->model->generate(features, prompts, whisper_options);
    if (future_results.empty()) {
        throw std::runtime_error("No results from Whisper inference");
    }

    auto result = future_results[0].get();
    if (result.sequences.empty()) return segments;

    float avg_logprob = 0.0f;
    if (result.has_scores() && !result.scores.empty() && !result.sequences_ids.empty()) {
        size_t seq_len = result.sequences_ids[0].size();
        avg_logprob = result.scores[0] / static_cast<float>(seq_len + 1);
    }

    // No-speech detection (both conditions must be met)
    if (result.no_speech_prob > options.no_speech_threshold && avg_logprob < options.log_prob_threshold) {
        std::cout << "[Huginn] Skipping no-speech chunk (no_speech: " << result.no_speech_prob
                  << ", avg_logprob: " << avg_logprob << ")\n";
        return segments;
    }

    size_t num_tokens = result.sequences_ids.empty() ? 0 : result.sequences_ids[0].size();
    std::string full_text = extract_text(result.sequences[0]);
    float compression_ratio = static_cast<float>(num_tokens) /
        static_cast<float>(std::max<size_t>(1, full_text.length()));
    if (compression_ratio > options.compression_ratio_threshold && avg_logprob < -0.5f) {
        std::cerr << "[Huginn] Skipping high-compression hallucination (ratio: "
                  << compression_ratio << ", logprob: " << avg_logprob << ")\n";
        return segments;
    }

    for (auto& seg : split_timestamped_tokens(result.sequences[0], duration)) {
        if (looks_like_hallucination(seg.text)) continue;
        segments.push_back(std::move(seg));
    }

    return segments;
}

WhisperEngine::ModelInfo WhisperEngine::get_model_info() const {
    if (!pimpl_ || !pimpl_->model) {
        throw std::runtime_error("Model not loaded");
    }
    ModelInfo info;
    info.is_multilingual = pimpl_->model->is_multilingual();
    info.n_mels = static_cast<int>(pimpl_->model->n_mels());
    info.num_languages = static_cast<int>(pimpl_->model->num_languages());
    return info;
}

} // namespace huginn
