#include "huginn/session_event.h"
#include <nlohmann/json.hpp>

namespace huginn {

using json = nlohmann::json;

namespace {

json progress_json(const DownloadProgress& progress) {
    return json{
        {"downloaded", progress.bytes_done},
        {"total", progress.bytes_total},
        {"percentage", progress.percentage()},
    };
}

struct EventToJson {
    json operator()(const TranscriptEvent& e) const {
        return json{
            {"type", "transcription"},
            {"mode", to_string(e.segment.kind)},
            {"id", e.segment.id},
            {"data", {
                {"text", e.segment.text},
                {"start", e.segment.start},
                {"end", e.segment.end},
            }},
        };
    }

    json operator()(const ModelLoadingEvent& e) const {
        return json{
            {"type", "model_loading"},
            {"model", e.snapshot.name},
            {"status", to_string(e.snapshot.status)},
            {"progress", progress_json(e.snapshot.progress)},
        };
    }

    json operator()(const ModelLoadedEvent& e) const {
        return json{{"type", "model_loaded"}, {"model", e.model}};
    }

    json operator()(const ModelFailedEvent& e) const {
        return json{{"type", "model_failed"}, {"model", e.model}, {"message", e.message}};
    }

    json operator()(const TranslationEvent& e) const {
        json j{{"type", "translation"}, {"id", e.id}};
        if (e.success) {
            j["status"] = "success";
            j["translation"] = e.translation;
        } else {
            j["status"] = "error";
            j["message"] = e.message;
        }
        return j;
    }

    json operator()(const RecognitionErrorEvent& e) const {
        return json{{"type", "error"}, {"message", e.message}};
    }

    json operator()(const SubtitlesEvent& e) const {
        json items = json::array();
        for (const auto& entry : e.items) {
            items.push_back({
                {"id", entry.segment.id},
                {"mode", to_string(entry.segment.kind)},
                {"text", entry.segment.text},
                {"translation_state", to_string(entry.translation_state)},
                {"translation", entry.translation},
            });
        }
        return json{{"type", "subtitles"}, {"items", items}};
    }
};

} // anonymous namespace

std::string to_json(const SessionEvent& event) {
    return std::visit(EventToJson{}, event).dump();
}

} // namespace huginn
