#pragma once

#include "export.h"
#include "types.h"
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace huginn {

/**
 * @brief History sizing for the subtitle reconciler
 */
struct SubtitleOptions {
    std::size_t capacity = 5;               // Entries kept without translation
    std::size_t translating_capacity = 3;   // Entries kept while translating
    std::chrono::milliseconds supersede_window{3000};  // Instant entries a final replaces
};

/**
 * @brief Bounded, ordered subtitle history of one session
 *
 * Instant segments are appended as they come. A final segment first removes
 * every instant entry that arrived within `supersede_window` before it, then
 * is appended, so the confirmed text replaces the provisional text it
 * corrected. Older instant entries are left alone. The oldest entries are
 * evicted once the history exceeds its capacity.
 */
class HUGINN_API SubtitleReconciler {
public:
    explicit SubtitleReconciler(const SubtitleOptions& options = {}, bool translating = false);

    void add_instant(const TranscriptSegment& segment);

    /**
     * @brief Reconcile a final segment
     *
     * @param segment Final segment; its arrival time is "now"
     * @param translation_pending Mark the entry's translation slot pending
     * @return Number of instant entries removed
     */
    std::size_t add_final(const TranscriptSegment& segment, bool translation_pending);

    /**
     * @brief Fill the translation slot of an entry
     * @return false if the entry has already been evicted
     */
    bool attach_translation(std::uint64_t segment_id, const std::string& translation);

    /// Switch between normal and translating capacity (evicts if needed)
    void set_translating(bool translating);

    void clear() { entries_.clear(); }

    const std::deque<SubtitleEntry>& entries() const { return entries_; }
    std::size_t capacity() const;

private:
    void evict();

    SubtitleOptions options_;
    bool translating_;
    std::deque<SubtitleEntry> entries_;
};

} // namespace huginn
