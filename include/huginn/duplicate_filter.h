#pragma once

#include "export.h"
#include "types.h"
#include <chrono>
#include <string>

namespace huginn {

/**
 * @brief Anti-hallucination filter for final transcripts
 *
 * Whisper occasionally re-emits the previous sentence for the overlapping
 * tail of the next chunk. A final whose normalized text equals the last
 * accepted final, arriving less than `window` after it, is discarded.
 *
 * Only final segments go through the filter; instant segments never do.
 */
class HUGINN_API DuplicateFilter {
public:
    explicit DuplicateFilter(std::chrono::milliseconds window = std::chrono::milliseconds(2000));

    /**
     * @brief Decide whether a final transcript is accepted
     *
     * Accepting updates the last text and timestamp. Empty text is never accepted.
     *
     * @param text Raw transcript text
     * @param now Arrival time of the transcript
     * @return true if the segment should be delivered
     */
    bool accept(const std::string& text, TimePoint now);

    /// Forget the last accepted text
    void reset();

    /// Lowercase ASCII and Latin-1 letters (Å, Ä, Ö, É...), collapse whitespace runs, trim
    static std::string normalize(const std::string& text);

    const std::string& last_text() const { return last_text_; }
    std::chrono::milliseconds window() const { return window_; }

private:
    std::chrono::milliseconds window_;
    std::string last_text_;         // Normalized
    TimePoint last_time_{};
    bool has_last_ = false;
};

} // namespace huginn
