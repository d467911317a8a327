/**
 * @file test_chunker.cpp
 * @brief Fixed-size chunking with overlap
 */

#include "huginn/chunker.h"
#include "test_support.h"
#include <numeric>

using namespace huginn;

namespace {

std::vector<float> ramp(std::size_t count, float start = 0.0f) {
    std::vector<float> samples(count);
    std::iota(samples.begin(), samples.end(), start);
    return samples;
}

void test_basic_emission() {
    section("Emission and retained overlap");

    Chunker chunker(4096, 1024);
    auto chunks = chunker.ingest(ramp(10000));

    check(chunks.size() == 2, "10000 samples with chunk 4096 / overlap 1024 emit 2 chunks");
    check(chunks.size() == 2 && chunks[0].size() == 4096 && chunks[1].size() == 4096,
          "every chunk has exactly the chunk size");
    check(chunker.buffered() == 3856, "3856 samples remain buffered");
    check(chunker.emitted() == 2, "emitted counter tracks chunks");

    if (chunks.size() == 2) {
        check(chunks[0].front() == 0.0f && chunks[0].back() == 4095.0f, "first chunk is samples 0..4095");
        check(chunks[1].front() == 3072.0f, "second chunk starts with the 1024-sample tail of the first");
        bool overlap_identical = std::equal(chunks[0].end() - 1024, chunks[0].end(), chunks[1].begin());
        check(overlap_identical, "overlap region is identical in consecutive chunks");
    }
}

void test_split_delivery() {
    section("Delivery in capture blocks");

    Chunker whole(8192, 2048);
    Chunker pieces(8192, 2048);
    auto input = ramp(40000);

    auto expected = whole.ingest(input);
    std::vector<std::vector<float>> actual;
    for (std::size_t offset = 0; offset < input.size(); offset += 4096) {
        std::size_t count = std::min<std::size_t>(4096, input.size() - offset);
        auto chunks = pieces.ingest(input.data() + offset, count);
        actual.insert(actual.end(), chunks.begin(), chunks.end());
    }

    check(expected == actual, "block-wise ingest matches one-shot ingest");
    check(whole.buffered() == pieces.buffered(), "same partial buffer either way");

    bool monotonic = true;
    for (std::size_t i = 1; i < actual.size(); ++i) {
        if (actual[i].front() <= actual[i - 1].front()) monotonic = false;
    }
    check(monotonic, "chunk start positions increase");
}

void test_edge_cases() {
    section("Edge cases");

    Chunker chunker(4096, 1024);
    check(chunker.ingest(nullptr, 0).empty(), "empty input emits nothing");
    check(chunker.ingest(ramp(4095)).empty(), "one sample short emits nothing");
    auto chunks = chunker.ingest(ramp(1, 4095.0f));
    check(chunks.size() == 1, "chunk is emitted the moment the buffer is full");
    check(chunker.buffered() == 1024, "only the overlap remains after emission");

    chunker.reset();
    check(chunker.buffered() == 0, "reset discards the partial buffer");

    Chunker no_overlap(100, 0);
    check(no_overlap.ingest(ramp(250)).size() == 2, "zero overlap emits back-to-back chunks");
    check(no_overlap.buffered() == 50, "zero overlap keeps only the remainder");

    check(throws([] { Chunker bad(0, 0); }), "zero chunk size is rejected");
    check(throws([] { Chunker bad(100, 100); }), "overlap equal to chunk size is rejected");
}

void test_policy() {
    section("Chunk policy");

    ChunkPolicy policy;
    check(policy.chunk_samples(1) == 4096u * 28, "level 1 is the largest chunk");
    check(policy.chunk_samples(5) == 4096u * 20, "level 5 is the smallest chunk");
    bool non_increasing = true;
    for (int level = 2; level <= 5; ++level) {
        if (policy.chunk_samples(level) > policy.chunk_samples(level - 1)) non_increasing = false;
    }
    check(non_increasing, "chunk size never grows with the level");
    check(policy.overlap_samples(3) == policy.chunk_samples(3) / 4, "overlap is a quarter of the chunk");
    check(policy.instant_chunk_samples() == 4096u * 8, "instant chunk is 8 blocks");
    check(policy.instant_chunk_samples() < policy.chunk_samples(5), "instant chunks are shorter than any final chunk");

    check(throws([&] { policy.chunk_samples(0); }), "level 0 is rejected");
    check(throws([&] { policy.chunk_samples(6); }), "level 6 is rejected");

    check(!throws([&] { policy.validate(); }), "default policy validates");

    ChunkPolicy increasing = policy;
    increasing.level_blocks = {20, 22, 24, 26, 28};
    check(throws([&] { increasing.validate(); }), "increasing level sizes are rejected");

    ChunkPolicy short_list = policy;
    short_list.level_blocks = {28, 26};
    check(throws([&] { short_list.validate(); }), "fewer than five levels are rejected");

    ChunkPolicy bad_overlap = policy;
    bad_overlap.overlap_fraction = 1.0f;
    check(throws([&] { bad_overlap.validate(); }), "overlap fraction of 1 is rejected");
}

} // anonymous namespace

int main() {
    banner("Huginn - Chunker Tests");

    test_basic_emission();
    test_split_delivery();
    test_edge_cases();
    test_policy();

    return summary();
}
