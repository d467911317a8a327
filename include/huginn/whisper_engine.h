#pragma once

#include "export.h"
#include "recognizer.h"
#include "types.h"
#include <memory>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Whisper recognizer running on CTranslate2
 *
 * Loads a CTranslate2-converted Whisper model (e.g. KBLab/kb-whisper-small)
 * and transcribes chunks of up to 30 seconds. Each chunk is padded to
 * Whisper's 30-second window, decoded with timestamp tokens, and split into
 * segments at timestamp boundaries. Obvious hallucinations (no-speech
 * output, repeated words and phrases) are filtered out.
 *
 * Example:
 * @code
 *   huginn::WhisperEngine engine("models/kb-whisper-small");
 *   huginn::RecognitionOptions opts;
 *   opts.language = "sv";
 *   for (const auto& seg : engine.transcribe(samples, opts)) {
 *       std::cout << seg.text << std::endl;
 *   }
 * @endcode
 */
class HUGINN_API WhisperEngine : public RecognitionEngine {
public:
    /**
     * @brief Load a Whisper model
     *
     * @param model_path Path to CTranslate2-converted Whisper model directory
     * @param options Device, compute type and threading
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit WhisperEngine(const std::string& model_path, const ModelOptions& options = {});

    ~WhisperEngine() override;

    // Move-only (no copying)
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) noexcept;
    WhisperEngine& operator=(WhisperEngine&&) noexcept;

    std::vector<RecognizedSegment> transcribe(
        const std::vector<float>& samples,
        const RecognitionOptions& options) override;

    /**
     * @brief Model metadata
     */
    struct ModelInfo {
        bool is_multilingual;
        int n_mels;
        int num_languages;
    };
    ModelInfo get_model_info() const;

private:
    class Impl;  // Forward declaration for pimpl idiom
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Hallucination heuristics applied to recognized text
 *
 * Exposed for testing. Returns true for output without letters or digits,
 * a single word repeated 4+ times in a row, or any 3-6 word phrase repeated
 * 3+ times. Short finals such as "Hej" or "Nej" are kept.
 */
HUGINN_API bool looks_like_hallucination(const std::string& text);

/**
 * @brief Strip Whisper special tokens and decode byte-level BPE text to UTF-8
 *
 * Token text like "Ġp" "Ã¥" becomes " på". Text that is already plain UTF-8
 * only has its Ġ space markers replaced.
 */
HUGINN_API std::string extract_text(const std::vector<std::string>& tokens);

/**
 * @brief Split a decoded token sequence at timestamp tokens
 *
 * @param tokens Decoded tokens (with <|x.xx|> timestamp tokens)
 * @param duration Chunk duration used to close a trailing segment
 * @return Non-empty text segments with start/end times
 */
HUGINN_API std::vector<RecognizedSegment> split_timestamped_tokens(
    const std::vector<std::string>& tokens, float duration);

} // namespace huginn
