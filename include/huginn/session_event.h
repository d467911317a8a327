#pragma once

#include "export.h"
#include "types.h"
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace huginn {

/// A recognized instant or final segment
struct TranscriptEvent {
    TranscriptSegment segment;
};

/// The session's model is checking, downloading or loading
struct ModelLoadingEvent {
    ModelSnapshot snapshot;
};

struct ModelLoadedEvent {
    std::string model;
};

struct ModelFailedEvent {
    std::string model;
    std::string message;
};

/// Outcome of a translation job for segment `id`
struct TranslationEvent {
    std::uint64_t id = 0;
    bool success = false;
    std::string translation;
    std::string message;
};

/// A chunk could not be recognized; the session goes on
struct RecognitionErrorEvent {
    std::string message;
};

/// The reconciled subtitle history after a change
struct SubtitlesEvent {
    std::vector<SubtitleEntry> items;
};

/**
 * @brief Everything a session reports to its client
 */
using SessionEvent = std::variant<
    TranscriptEvent,
    ModelLoadingEvent,
    ModelLoadedEvent,
    ModelFailedEvent,
    TranslationEvent,
    RecognitionErrorEvent,
    SubtitlesEvent>;

using EventSink = std::function<void(const SessionEvent&)>;

/**
 * @brief Wire form of an event (one JSON object per message)
 */
HUGINN_API std::string to_json(const SessionEvent& event);

} // namespace huginn
