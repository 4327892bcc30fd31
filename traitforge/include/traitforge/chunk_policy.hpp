#ifndef TRAITFORGE_CHUNK_POLICY_HPP
#define TRAITFORGE_CHUNK_POLICY_HPP

#include <traitforge/memory_probe.hpp>
#include <cstddef>

namespace traitforge {

struct ChunkBounds {
    std::size_t initial_min = 10;
    std::size_t initial_max = 200;
    std::size_t large_collection = 10000;        // Above this the initial chunk is capped
    std::size_t large_collection_cap = 100;
    std::size_t small_collection = 50;           // Below this a chunk never exceeds the count
};

/**
 * Starting chunk size for chunked delivery:
 * min(memory_mb / 64, cores * 10), halved on constrained devices, capped for
 * very large collections, clamped to [initial_min, initial_max].
 */
std::size_t initial_chunk_size(const DeviceProfile& device, std::size_t collection_size,
                               const ChunkBounds& bounds = {});

/**
 * Next chunk size from the memory pressure observed after a flush.
 *   ratio > 0.9 -> 30%, at least 5
 *   ratio > 0.8 -> 50%, at least 10
 *   ratio > 0.7 -> 70%, at least 15
 *   ratio < 0.5 -> 120%, at most 200
 * Anything in between keeps the current size.
 */
std::size_t adapt_chunk_size(std::size_t current, double memory_ratio);

} // namespace traitforge

#endif // TRAITFORGE_CHUNK_POLICY_HPP
