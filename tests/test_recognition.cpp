/**
 * @file test_recognition.cpp
 * @brief Decoder output handling, speech gate and transcription dispatch
 */

#include "huginn/transcription_dispatcher.h"
#include "huginn/translator.h"
#include "huginn/vad.h"
#include "huginn/whisper_engine.h"
#include "test_support.h"

using namespace huginn;

namespace {

void test_token_text() {
    section("Token text");

    std::vector<std::string> tokens = {
        "<|startoftranscript|>", "<|sv|>", "<|transcribe|>", "God", "\xC4\xA0morgon", "\xC4\xA0Sverige", "<|endoftext|>"
    };
    check(extract_text(tokens) == "God morgon Sverige", "special tokens dropped and BPE spaces restored");
    check(extract_text({}).empty(), "no tokens, no text");

    // Byte-level BPE: "Ã¥" is the two bytes of å
    check(extract_text({"Hej", "\xC4\xA0p", "\xC3\x83\xC2\xA5"}) == "Hej p\xC3\xA5",
          "byte-level tokens decode to Swedish letters");
    check(extract_text({"\xC4\xA0Gr", "\xC3\x83\xC2\xB6", "n", "\xC4\xA0s", "\xC3\x83\xC2\xA4", "l"}) ==
              "Gr\xC3\xB6n s\xC3\xA4l",
          "\xC3\xB6 and \xC3\xA4 decode across token boundaries");
    check(extract_text({"Hej", "\xC4\xA0p\xC3\xA5"}) == "Hej p\xC3\xA5", "already decoded text is kept");
}

void test_timestamp_segments() {
    section("Timestamped segments");

    std::vector<std::string> tokens = {
        "<|0.00|>", "Hej", "\xC4\xA0allihop", "<|1.50|>",
        "<|1.50|>", "Vad", "\xC4\xA0kul", "<|3.20|>",
    };
    auto segments = split_timestamped_tokens(tokens, 5.0f);
    check(segments.size() == 2, "two timestamp pairs give two segments");
    if (segments.size() == 2) {
        check(segments[0].text == "Hej allihop", "first segment text");
        check(segments[0].start == 0.0f && segments[0].end == 1.5f, "first segment times");
        check(segments[1].text == "Vad kul", "second segment text");
        check(segments[1].start == 1.5f && segments[1].end == 3.2f, "second segment times");
    }

    auto open_ended = split_timestamped_tokens({"<|2.00|>", "Slut"}, 4.0f);
    check(open_ended.size() == 1 && open_ended[0].end == 4.0f, "unterminated segment ends at the chunk duration");

    auto untimed = split_timestamped_tokens({"Bara", "\xC4\xA0text"}, 3.0f);
    check(untimed.size() == 1 && untimed[0].text == "Bara text" && untimed[0].start == 0.0f,
          "tokens without timestamps form one segment");

    auto swedish = split_timestamped_tokens({"<|0.00|>", "Tack", "\xC4\xA0s", "\xC3\x83\xC2\xA5", "<|1.00|>"}, 2.0f);
    check(swedish.size() == 1 && swedish[0].text == "Tack s\xC3\xA5", "segment text is decoded to UTF-8");

    auto clamped = split_timestamped_tokens({"<|0.00|>", "Hej", "<|29.00|>"}, 2.0f);
    check(clamped.size() == 1 && clamped[0].end == 2.0f, "end time is clamped to the chunk duration");

    check(split_timestamped_tokens({"<|0.00|>", "<|1.00|>"}, 2.0f).empty(), "empty segments are dropped");
}

void test_hallucination_filter() {
    section("Hallucination filter");

    check(looks_like_hallucination("..."), "punctuation-only output is rejected");
    check(!looks_like_hallucination("Hej"), "short greeting passes");
    check(!looks_like_hallucination("Nej"), "short answer passes");
    check(!looks_like_hallucination("Ja.") && !looks_like_hallucination("OK"), "short finals with punctuation pass");
    check(!looks_like_hallucination("\xC3\x85h"), "short word with a Swedish letter passes");
    check(!looks_like_hallucination("ja ja ja"), "three repeats of a word pass");
    check(looks_like_hallucination("Tack Tack Tack Tack"), "one word repeated four times is rejected");
    check(looks_like_hallucination("tack för att ni tittade tack för att ni tittade tack för att ni tittade"),
          "phrase repeated three times is rejected");
    check(!looks_like_hallucination("Det här är en helt vanlig mening om vädret."), "normal sentence passes");
    check(!looks_like_hallucination("Ja, ja. Det stämmer."), "short natural repetition passes");
}

std::vector<float> speech_like(std::size_t silence, std::size_t voiced) {
    std::vector<float> samples(silence, 0.0005f);
    auto burst = tone(voiced, 0.4f);
    samples.insert(samples.end(), burst.begin(), burst.end());
    samples.insert(samples.end(), silence, 0.0005f);
    return samples;
}

void test_speech_gate() {
    section("Speech gate");

    VAD vad;
    check(!vad.contains_speech(std::vector<float>(32000, 0.0f)), "digital silence is gated");
    check(!vad.contains_speech(std::vector<float>(32000, 0.0002f)), "near-silence is gated");
    check(vad.contains_speech(speech_like(8000, 16000)), "voiced burst between quiet passes");

    auto segments = vad.detect_speech(speech_like(8000, 16000));
    check(segments.size() == 1, "one speech region found");
    if (!segments.empty()) {
        check(segments[0].start < 0.6f && segments[0].end > 1.4f, "speech region covers the burst");
    }

    VADOptions fixed;
    fixed.adaptive_threshold = false;
    fixed.threshold = 0.5f;
    VAD strict(fixed);
    check(!strict.contains_speech(speech_like(8000, 16000)), "fixed threshold above the signal gates it");
}

void test_dispatcher() {
    section("Transcription dispatch");

    check(beam_size_for_level(1) == 5 && beam_size_for_level(3) == 3 && beam_size_for_level(5) == 1,
          "beam width shrinks as the VAD level rises");

    auto store = std::make_shared<FakeStore>();
    auto engine = std::make_shared<FakeEngine>();
    ModelManager models(store, [engine](const std::string&, const std::string&) -> std::shared_ptr<RecognitionEngine> {
        return engine;
    });
    TranscriptionDispatcher dispatcher(models);
    RecognitionOptions options;

    DispatchResult not_ready = dispatcher.dispatch("small", speech_like(8000, 16000), options, SegmentKind::Final);
    check(not_ready.status == DispatchResult::Status::ModelNotReady, "unloaded model reports not ready");

    store->add("small");
    models.request_load("small").get();

    engine->set_script({"Hej"});
    DispatchResult silent = dispatcher.dispatch("small", std::vector<float>(32000, 0.0f), options, SegmentKind::Final);
    check(silent.status == DispatchResult::Status::Ok && silent.gated, "silent chunk is gated");
    check(engine->call_count() == 0, "gated chunk never reaches the engine");

    DispatchResult spoken = dispatcher.dispatch("small", speech_like(8000, 16000), options, SegmentKind::Instant);
    check(spoken.status == DispatchResult::Status::Ok && !spoken.gated, "speech reaches the engine");
    check(spoken.segments.size() == 1 && spoken.segments[0].text == "Hej", "engine segments are returned");
    check(spoken.kind == SegmentKind::Instant, "result keeps the chunk kind");

    engine->fail_calls(1);
    DispatchResult failed = dispatcher.dispatch("small", speech_like(8000, 16000), options, SegmentKind::Final);
    check(failed.status == DispatchResult::Status::Failed, "engine exception becomes a failed result");
    check(failed.error == "Decoder error", "failure keeps the engine message");
}

void test_translation_languages() {
    section("Translation languages");

    check(NllbTranslator::resolve_language("english") == "en", "language names resolve");
    check(NllbTranslator::resolve_language("EN") == "en", "codes resolve case-insensitively");
    check(NllbTranslator::resolve_language("swe_Latn") == "sv", "NLLB codes resolve");
    check(NllbTranslator::resolve_language("klingon").empty(), "unknown languages do not resolve");
    check(NllbTranslator::to_nllb_code("uk") == "ukr_Cyrl", "short code maps to NLLB code");

    const char* viewers[] = {"english", "german", "italian", "greek", "french",
                             "ukrainian", "chinese", "japanese", "arabic"};
    bool all_supported = true;
    for (const char* name : viewers) {
        if (NllbTranslator::resolve_language(name).empty()) all_supported = false;
    }
    check(all_supported, "every subtitle viewer language is supported");

    check(NllbTranslator::clean_output("eng_Latn Hello , world !", "eng_Latn") == "Hello, world!",
          "language token and spaces before punctuation are removed");
}

} // anonymous namespace

int main() {
    banner("Huginn - Recognition Tests");

    test_token_text();
    test_timestamp_segments();
    test_hallucination_filter();
    test_speech_gate();
    test_dispatcher();
    test_translation_languages();

    return summary();
}
