#include "huginn/chunker.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace huginn {

// ═══════════════════════════════════════════════════════════════════════════
// ChunkPolicy
// ═══════════════════════════════════════════════════════════════════════════

std::size_t ChunkPolicy::chunk_samples(int vad_level) const {
    if (vad_level < MIN_VAD_LEVEL || vad_level > MAX_VAD_LEVEL ||
        level_blocks.size() < static_cast<std::size_t>(vad_level)) {
        throw std::out_of_range("VAD level out of range: " + std::to_string(vad_level));
    }
    return block_samples * static_cast<std::size_t>(level_blocks[vad_level - 1]);
}

std::size_t ChunkPolicy::overlap_samples(int vad_level) const {
    return static_cast<std::size_t>(chunk_samples(vad_level) * static_cast<double>(overlap_fraction));
}

std::size_t ChunkPolicy::instant_chunk_samples() const {
    return block_samples * static_cast<std::size_t>(instant_blocks);
}

std::size_t ChunkPolicy::instant_overlap_samples() const {
    return static_cast<std::size_t>(instant_chunk_samples() * static_cast<double>(overlap_fraction));
}

void ChunkPolicy::validate() const {
    if (block_samples == 0) {
        throw std::invalid_argument("chunking.block_samples must be positive");
    }
    if (level_blocks.size() != static_cast<std::size_t>(MAX_VAD_LEVEL)) {
        throw std::invalid_argument("chunking.level_blocks must have exactly 5 entries");
    }
    for (std::size_t i = 0; i < level_blocks.size(); ++i) {
        if (level_blocks[i] <= 0) {
            throw std::invalid_argument("chunking.level_blocks entries must be positive");
        }
        if (i > 0 && level_blocks[i] > level_blocks[i - 1]) {
            throw std::invalid_argument(
                "chunking.level_blocks must not increase with VAD level (level " +
                std::to_string(i + 1) + ")");
        }
    }
    if (instant_blocks <= 0) {
        throw std::invalid_argument("chunking.instant_blocks must be positive");
    }
    if (!(overlap_fraction >= 0.0f && overlap_fraction < 1.0f)) {
        throw std::invalid_argument("chunking.overlap_fraction must be in [0, 1)");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Chunker
// ═══════════════════════════════════════════════════════════════════════════

Chunker::Chunker(std::size_t chunk_size, std::size_t overlap)
    : chunk_size_(chunk_size), overlap_(overlap)
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (overlap_ >= chunk_size_) {
        throw std::invalid_argument("Chunk overlap must be smaller than the chunk size");
    }
    buffer_.reserve(chunk_size_);
}

std::vector<std::vector<float>> Chunker::ingest(const float* samples, std::size_t count) {
    std::vector<std::vector<float>> chunks;
    if (samples == nullptr || count == 0) {
        return chunks;
    }

    std::size_t consumed = 0;
    while (consumed < count) {
        // Fill up to exactly one chunk so emission happens the moment the
        // buffer reaches chunk_size
        std::size_t room = chunk_size_ - buffer_.size();
        std::size_t take = std::min(room, count - consumed);
        buffer_.insert(buffer_.end(), samples + consumed, samples + consumed + take);
        consumed += take;

        if (buffer_.size() == chunk_size_) {
            chunks.push_back(buffer_);
            ++emitted_;

            // Carry the tail over as the start of the next chunk
            std::vector<float> tail(buffer_.end() - static_cast<std::ptrdiff_t>(overlap_), buffer_.end());
            buffer_.swap(tail);
            buffer_.reserve(chunk_size_);
        }
    }

    return chunks;
}

void Chunker::reset() {
    buffer_.clear();
}

} // namespace huginn
