#include "huginn/subtitle_reconciler.h"
#include <algorithm>

namespace huginn {

SubtitleReconciler::SubtitleReconciler(const SubtitleOptions& options, bool translating)
    : options_(options), translating_(translating)
{
}

std::size_t SubtitleReconciler::capacity() const {
    return translating_ ? options_.translating_capacity : options_.capacity;
}

void SubtitleReconciler::add_instant(const TranscriptSegment& segment) {
    SubtitleEntry entry;
    entry.segment = segment;
    entry.segment.kind = SegmentKind::Instant;
    entries_.push_back(std::move(entry));
    evict();
}

std::size_t SubtitleReconciler::add_final(const TranscriptSegment& segment, bool translation_pending) {
    const TimePoint now = segment.arrival;
    const auto window = options_.supersede_window;

    auto superseded = [&](const SubtitleEntry& entry) {
        return entry.segment.kind == SegmentKind::Instant &&
               now - entry.segment.arrival <= window;
    };

    auto first_removed = std::remove_if(entries_.begin(), entries_.end(), superseded);
    auto removed = static_cast<std::size_t>(std::distance(first_removed, entries_.end()));
    entries_.erase(first_removed, entries_.end());

    SubtitleEntry entry;
    entry.segment = segment;
    entry.segment.kind = SegmentKind::Final;
    entry.translation_state = translation_pending ? TranslationState::Pending : TranslationState::None;
    entries_.push_back(std::move(entry));
    evict();

    return removed;
}

bool SubtitleReconciler::attach_translation(std::uint64_t segment_id, const std::string& translation) {
    for (auto& entry : entries_) {
        if (entry.segment.id == segment_id) {
            entry.translation = translation;
            entry.translation_state = TranslationState::Translated;
            return true;
        }
    }
    return false;
}

void SubtitleReconciler::set_translating(bool translating) {
    translating_ = translating;
    evict();
}

void SubtitleReconciler::evict() {
    const std::size_t cap = capacity();
    while (entries_.size() > cap) {
        entries_.pop_front();
    }
}

} // namespace huginn
