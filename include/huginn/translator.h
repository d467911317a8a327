#pragma once

#include "export.h"
#include "types.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Language information for translation
 */
struct TranslationLanguage {
    std::string code;       // Short code ("en", "sv", etc.)
    std::string nllb_code;  // NLLB code ("eng_Latn", "swe_Latn", etc.)
    std::string name;       // Lowercase name used by clients ("english")
};

/**
 * @brief Options for text translation
 */
struct TranslationOptions {
    int beam_size = 4;              // Beam search width (1-10)
    float length_penalty = 1.0f;    // Length penalty (>1 = longer, <1 = shorter)
    int max_length = 256;           // Maximum output tokens per segment
    float repetition_penalty = 1.0f;
    int no_repeat_ngram_size = 0;   // Prevent n-gram repetitions (0 = disabled)
};

/**
 * @brief Translation backend seen by the translation dispatcher and the server
 */
class HUGINN_API TranslationEngine {
public:
    virtual ~TranslationEngine() = default;

    /// Identifiers accepted as `model_id` by translate()
    virtual std::vector<std::string> list_models() const = 0;

    /**
     * @brief Translate one text
     *
     * @param text Source text
     * @param source_language Short code or name ("sv", "swedish")
     * @param target_language Short code or name ("en", "english")
     * @param model_id One of list_models()
     * @return Translated text
     * @throws std::invalid_argument for unknown languages or models
     * @throws std::runtime_error if translation fails
     */
    virtual std::string translate(const std::string& text,
                                  const std::string& source_language,
                                  const std::string& target_language,
                                  const std::string& model_id) = 0;
};

/**
 * @brief Text translator using an NLLB-200 model via CTranslate2
 *
 * One instance wraps one model directory. The directory must hold a
 * CTranslate2 conversion (model.bin) and, for proper tokenization, the
 * SentencePiece model (sentencepiece.bpe.model).
 *
 * Thread Safety:
 * - Static methods are thread-safe
 * - translate() is NOT safe for concurrent calls on the same instance
 *
 * Usage:
 * @code
 *   NllbTranslator translator("models/translation/nllb-200-distilled-600M");
 *   std::string english = translator.translate("Hej världen", "sv", "en");
 * @endcode
 */
class HUGINN_API NllbTranslator {
public:
    /**
     * @param model_path Path to CTranslate2-converted NLLB model directory
     * @param options Device, compute type and threading
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit NllbTranslator(const std::string& model_path, const ModelOptions& options = {});

    ~NllbTranslator();

    NllbTranslator(const NllbTranslator&) = delete;
    NllbTranslator& operator=(const NllbTranslator&) = delete;
    NllbTranslator(NllbTranslator&&) noexcept;
    NllbTranslator& operator=(NllbTranslator&&) noexcept;

    /**
     * @brief Translate a single text
     *
     * Same source and target language returns the text unchanged.
     *
     * @throws std::invalid_argument for unsupported languages
     * @throws std::runtime_error if decoding fails or yields nothing
     */
    std::string translate(const std::string& text,
                          const std::string& source_lang,
                          const std::string& target_lang,
                          const TranslationOptions& options = {});

    static std::vector<TranslationLanguage> supported_languages();

    /**
     * @brief Normalize a language given as short code, NLLB code or name
     * @return Short code ("en"), or empty if unsupported
     */
    static std::string resolve_language(const std::string& language);

    /**
     * @brief Convert Whisper/short language code to NLLB code
     * @return NLLB code ("eng_Latn") or empty if unsupported
     */
    static std::string to_nllb_code(const std::string& code);

    /// Strip a leading language token and fix spacing around punctuation
    static std::string clean_output(const std::string& text, const std::string& target_nllb);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief TranslationEngine serving every NLLB model under one directory
 *
 * Each subdirectory holding a model.bin is a model id. Translators are
 * loaded on first use and kept; calls into one model are serialized.
 */
class HUGINN_API NllbTranslationEngine : public TranslationEngine {
public:
    NllbTranslationEngine(const std::string& models_dir, const ModelOptions& options = {},
                          const TranslationOptions& translation_options = {});

    std::vector<std::string> list_models() const override;

    std::string translate(const std::string& text,
                          const std::string& source_language,
                          const std::string& target_language,
                          const std::string& model_id) override;

private:
    struct Slot {
        std::mutex mutex;                       // Serializes load and translate
        std::unique_ptr<NllbTranslator> translator;
    };

    std::shared_ptr<Slot> slot(const std::string& model_id);

    std::string models_dir_;
    ModelOptions options_;
    TranslationOptions translation_options_;
    std::mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace huginn
