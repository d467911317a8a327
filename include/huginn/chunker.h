#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <vector>

namespace huginn {

/**
 * @brief VAD-level to chunk-size mapping
 *
 * Sizes are expressed in capture blocks (the 4096-sample frames the capture
 * side delivers). Level 1 buffers the most audio per chunk, level 5 the least.
 */
struct ChunkPolicy {
    std::size_t block_samples = 4096;                   // Samples per capture block
    std::vector<int> level_blocks = {28, 26, 24, 22, 20};  // Blocks per chunk, VAD levels 1..5
    float overlap_fraction = 0.25f;                     // Tail carried into the next chunk
    int instant_blocks = 8;                             // Blocks per instant-mode chunk

    /**
     * @brief Chunk size for a VAD level
     * @throws std::out_of_range if level is outside 1..5
     */
    std::size_t chunk_samples(int vad_level) const;

    /// Overlap retained after emitting a chunk of this level
    std::size_t overlap_samples(int vad_level) const;

    std::size_t instant_chunk_samples() const;
    std::size_t instant_overlap_samples() const;

    /**
     * @brief Check the policy invariants
     *
     * Five positive, non-increasing level sizes and 0 <= overlap < 1.
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;
};

/**
 * @brief Fixed-size chunker with overlap retention
 *
 * Accumulates samples and emits a chunk each time the buffer reaches
 * chunk_size. The last `overlap` samples of each emitted chunk stay buffered
 * as the start of the next one, so chunk N+1 begins with the same samples
 * chunk N ended with. Partial buffers are never emitted.
 *
 * Not thread-safe: a chunker belongs to one session.
 */
class HUGINN_API Chunker {
public:
    /**
     * @param chunk_size Samples per emitted chunk (> 0)
     * @param overlap Samples retained after each emission (< chunk_size)
     * @throws std::invalid_argument on invalid sizes
     */
    Chunker(std::size_t chunk_size, std::size_t overlap);

    /**
     * @brief Append samples and collect every chunk that became complete
     *
     * @param samples Mono float32 samples
     * @param count Number of samples
     * @return Emitted chunks in order (often empty)
     */
    std::vector<std::vector<float>> ingest(const float* samples, std::size_t count);

    std::vector<std::vector<float>> ingest(const std::vector<float>& samples) {
        return ingest(samples.data(), samples.size());
    }

    /// Discard the partial buffer (session close)
    void reset();

    std::size_t buffered() const { return buffer_.size(); }
    std::size_t chunk_size() const { return chunk_size_; }
    std::size_t overlap() const { return overlap_; }
    std::size_t emitted() const { return emitted_; }

private:
    std::size_t chunk_size_;
    std::size_t overlap_;
    std::size_t emitted_ = 0;
    std::vector<float> buffer_;
};

} // namespace huginn
