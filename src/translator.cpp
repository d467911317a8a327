#include "huginn/translator.h"
#include <ctranslate2/translator.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#ifdef HUGINN_USE_SENTENCEPIECE
#include <sentencepiece_processor.h>
#endif

namespace fs = std::filesystem;

namespace huginn {

// ═══════════════════════════════════════════════════════════════════════════
// Language Mappings
// ═══════════════════════════════════════════════════════════════════════════

// Languages offered to subtitle viewers, plus Swedish as the spoken language
static const std::vector<TranslationLanguage> SUPPORTED_LANGUAGES = {
    {"sv", "swe_Latn", "swedish"},
    {"en", "eng_Latn", "english"},
    {"de", "deu_Latn", "german"},
    {"it", "ita_Latn", "italian"},
    {"el", "ell_Grek", "greek"},
    {"fr", "fra_Latn", "french"},
    {"uk", "ukr_Cyrl", "ukrainian"},
    {"zh", "zho_Hans", "chinese"},
    {"ja", "jpn_Jpan", "japanese"},
    {"ar", "arb_Arab", "arabic"},
    {"es", "spa_Latn", "spanish"},
    {"da", "dan_Latn", "danish"},
    {"no", "nob_Latn", "norwegian"},
    {"fi", "fin_Latn", "finnish"},
    {"pl", "pol_Latn", "polish"},
    {"ru", "rus_Cyrl", "russian"},
};

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// NllbTranslator::Impl
// ═══════════════════════════════════════════════════════════════════════════

class NllbTranslator::Impl {
public:
    std::unique_ptr<ctranslate2::Translator> model;
    std::string model_path;

#ifdef HUGINN_USE_SENTENCEPIECE
    sentencepiece::SentencePieceProcessor sp_processor;
    bool sp_loaded = false;
#endif

    Impl(const std::string& path, const ModelOptions& options)
        : model_path(path)
    {
        try {
            ctranslate2::Device ct_device = options.device == DeviceType::CPU
                ? ctranslate2::Device::CPU
                : ctranslate2::Device::CUDA;

            ctranslate2::ReplicaPoolConfig pool_config;
            if (options.intra_threads > 0) {
                pool_config.num_threads_per_replica = static_cast<size_t>(options.intra_threads);
            }

            model = std::make_unique<ctranslate2::Translator>(
                path,
                ct_device,
                ctranslate2::str_to_compute_type(options.compute_type_string()),
                std::vector<int>{options.device_index},
                false,
                pool_config
            );

            std::cout << "[Translator] Loaded: " << path
                      << " (device=" << options.device_string()
                      << ", compute=" << options.compute_type_string() << ")\n";

#ifdef HUGINN_USE_SENTENCEPIECE
            fs::path sp_model_path = fs::path(path) / "sentencepiece.bpe.model";
            if (fs::exists(sp_model_path)) {
                auto status = sp_processor.Load(sp_model_path.string());
                if (status.ok()) {
                    sp_loaded = true;
                    std::cout << "[Translator] SentencePiece tokenizer loaded: " << sp_model_path.string() << "\n";
                } else {
                    std::cerr << "[Translator] SentencePiece load failed: " << status.ToString() << "\n";
                }
            } else {
                std::cerr << "[Translator] SentencePiece model not found: " << sp_model_path.string() << "\n";
                std::cerr << "[Translator] Translation will use basic tokenization (may produce poor results)\n";
            }
#endif

        } catch (const std::exception& e) {
            std::cerr << "[Translator] Failed to load " << path << ": " << e.what() << "\n";
            throw std::runtime_error(std::string("Failed to load translation model: ") + e.what());
        }
    }

    // Tokenize text using SentencePiece (or fallback to whitespace)
    std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> tokens;

#ifdef HUGINN_USE_SENTENCEPIECE
        if (sp_loaded) {
            auto status = sp_processor.Encode(text, &tokens);
            if (!status.ok()) {
                throw std::runtime_error("SentencePiece encode failed: " + status.ToString());
            }
            return tokens;
        }
#endif

        std::istringstream iss(text);
        std::string word;
        while (iss >> word) {
            tokens.push_back(word);
        }
        return tokens;
    }

    // Detokenize using SentencePiece (or fallback to space-join)
    std::string detokenize(const std::vector<std::string>& tokens) {
#ifdef HUGINN_USE_SENTENCEPIECE
        if (sp_loaded) {
            std::string result;
            auto status = sp_processor.Decode(tokens, &result);
            if (!status.ok()) {
                throw std::runtime_error("SentencePiece decode failed: " + status.ToString());
            }
            return result;
        }
#endif

        std::string result;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i > 0) result += " ";
            result += tokens[i];
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// NllbTranslator Public API
// ═══════════════════════════════════════════════════════════════════════════

NllbTranslator::NllbTranslator(const std::string& model_path, const ModelOptions& options)
    : pimpl_(std::make_unique<Impl>(model_path, options))
{}

NllbTranslator::~NllbTranslator() = default;

NllbTranslator::NllbTranslator(NllbTranslator&&) noexcept = default;
NllbTranslator& NllbTranslator::operator=(NllbTranslator&&) noexcept = default;

std::string NllbTranslator::translate(const std::string& text,
                                      const std::string& source_lang,
                                      const std::string& target_lang,
                                      const TranslationOptions& options)
{
    if (!pimpl_ || !pimpl_->model) {
        throw std::runtime_error("Translator not loaded");
    }

    std::string src_nllb = to_nllb_code(resolve_language(source_lang));
    std::string tgt_nllb = to_nllb_code(resolve_language(target_lang));
    if (src_nllb.empty() || tgt_nllb.empty()) {
        throw std::invalid_argument("Unsupported language pair: " + source_lang + " -> " + target_lang);
    }

    if (trim(text).empty() || src_nllb == tgt_nllb) {
        return text;
    }

    ctranslate2::TranslationOptions ct_options;
    ct_options.beam_size = options.beam_size;
    ct_options.length_penalty = options.length_penalty;
    ct_options.repetition_penalty = options.repetition_penalty;
    ct_options.no_repeat_ngram_size = options.no_repeat_ngram_size;
    ct_options.max_decoding_length = options.max_length;

    // NLLB format: [source_lang_token, tokens..., </s>]
    std::vector<std::string> tokens;
    tokens.push_back(src_nllb);
    auto text_tokens = pimpl_->tokenize(text);
    tokens.insert(tokens.end(), text_tokens.begin(), text_tokens.end());
    tokens.push_back("</s>");

    // Target prefix: [</s>, target_lang_token] - NLLB decoder starts with </s>
    std::vector<std::vector<std::string>> target_prefix = {{"</s>", tgt_nllb}};

    auto results = pimpl_->model->translate_batch({tokens}, target_prefix, ct_options);
    if (results.empty() || results[0].hypotheses.empty()) {
        throw std::runtime_error("Translation produced no hypothesis");
    }

    std::string translated = clean_output(pimpl_->detokenize(results[0].hypotheses[0]), tgt_nllb);
    if (translated.empty()) {
        throw std::runtime_error("Translation produced empty output");
    }
    return translated;
}

std::vector<TranslationLanguage> NllbTranslator::supported_languages() {
    return SUPPORTED_LANGUAGES;
}

std::string NllbTranslator::resolve_language(const std::string& language) {
    const std::string key = to_lower(trim(language));
    for (const auto& lang : SUPPORTED_LANGUAGES) {
        if (key == lang.code || key == lang.name || key == to_lower(lang.nllb_code)) {
            return lang.code;
        }
    }
    return "";
}

std::string NllbTranslator::to_nllb_code(const std::string& code) {
    for (const auto& lang : SUPPORTED_LANGUAGES) {
        if (lang.code == code) return lang.nllb_code;
    }
    return "";
}

// NOTE: Simple string operations instead of std::regex (std::regex is very slow)
std::string NllbTranslator::clean_output(const std::string& text, const std::string& target_nllb) {
    std::string result = text;

    // Remove target language token if it appears at the start
    if (!target_nllb.empty() && result.find(target_nllb) == 0) {
        result = result.substr(target_nllb.length());
    }

    result = trim(result);
    if (result.empty()) {
        return "";
    }

    std::string cleaned;
    cleaned.reserve(result.size());

    auto is_punct = [](char c) {
        return c == '.' || c == ',' || c == '!' || c == '?' || c == ';' || c == ':';
    };

    for (size_t i = 0; i < result.size(); ++i) {
        char c = result[i];

        // " ." -> "."
        if (c == ' ' && i + 1 < result.size() && is_punct(result[i + 1])) {
            continue;
        }

        cleaned += c;

        // "a.B" -> "a. B"
        if (is_punct(c) && i + 1 < result.size()) {
            char next = result[i + 1];
            if ((next >= 'A' && next <= 'Z') || (next >= 'a' && next <= 'z')) {
                cleaned += ' ';
            }
        }
    }

    return cleaned;
}

// ═══════════════════════════════════════════════════════════════════════════
// NllbTranslationEngine
// ═══════════════════════════════════════════════════════════════════════════

NllbTranslationEngine::NllbTranslationEngine(const std::string& models_dir,
                                             const ModelOptions& options,
                                             const TranslationOptions& translation_options)
    : models_dir_(models_dir)
    , options_(options)
    , translation_options_(translation_options)
{
}

std::vector<std::string> NllbTranslationEngine::list_models() const {
    std::vector<std::string> models;
    std::error_code ec;
    if (!fs::is_directory(models_dir_, ec)) {
        return models;
    }
    for (const auto& entry : fs::directory_iterator(models_dir_, ec)) {
        if (entry.is_directory(ec) && fs::is_regular_file(entry.path() / "model.bin", ec)) {
            models.push_back(entry.path().filename().string());
        }
    }
    std::sort(models.begin(), models.end());
    return models;
}

std::shared_ptr<NllbTranslationEngine::Slot> NllbTranslationEngine::slot(const std::string& model_id) {
    // Model ids are directory names, never paths
    if (model_id.empty() || model_id == "." || model_id == ".." ||
        model_id.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Invalid translation model: " + model_id);
    }

    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& entry = slots_[model_id];
    if (!entry) {
        entry = std::make_shared<Slot>();
    }
    return entry;
}

std::string NllbTranslationEngine::translate(const std::string& text,
                                             const std::string& source_language,
                                             const std::string& target_language,
                                             const std::string& model_id)
{
    auto target = slot(model_id);

    std::lock_guard<std::mutex> lock(target->mutex);
    if (!target->translator) {
        fs::path path = fs::path(models_dir_) / model_id;
        std::error_code ec;
        if (!fs::is_regular_file(path / "model.bin", ec)) {
            throw std::invalid_argument("Translation model not installed: " + model_id);
        }
        target->translator = std::make_unique<NllbTranslator>(path.string(), options_);
    }
    return target->translator->translate(text, source_language, target_language, translation_options_);
}

} // namespace huginn
