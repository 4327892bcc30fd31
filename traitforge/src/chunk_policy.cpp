#include <traitforge/chunk_policy.hpp>
#include <algorithm>
#include <cmath>

namespace traitforge {

std::size_t initial_chunk_size(const DeviceProfile& device, std::size_t collection_size,
                               const ChunkBounds& bounds) {
    double by_memory = std::floor(device.memory_gb * 1024.0 / 64.0);
    double by_cores = static_cast<double>(device.cores) * 10.0;
    double size = std::min(by_memory, by_cores);

    if (device.constrained) {
        size = std::floor(size * 0.5);
    }
    if (collection_size > bounds.large_collection) {
        size = std::min(size, static_cast<double>(bounds.large_collection_cap));
    }

    size = std::clamp(size, static_cast<double>(bounds.initial_min), static_cast<double>(bounds.initial_max));
    auto chunk = static_cast<std::size_t>(size);

    if (collection_size < bounds.small_collection) {
        chunk = std::min(chunk, std::max<std::size_t>(collection_size, 1));
    }
    return chunk;
}

std::size_t adapt_chunk_size(std::size_t current, double memory_ratio) {
    double c = static_cast<double>(current);
    if (memory_ratio > 0.9) {
        return std::max<std::size_t>(5, static_cast<std::size_t>(std::floor(c * 0.3)));
    }
    if (memory_ratio > 0.8) {
        return std::max<std::size_t>(10, static_cast<std::size_t>(std::floor(c * 0.5)));
    }
    if (memory_ratio > 0.7) {
        return std::max<std::size_t>(15, static_cast<std::size_t>(std::floor(c * 0.7)));
    }
    if (memory_ratio < 0.5 && current < 200) {
        return std::min<std::size_t>(200, static_cast<std::size_t>(std::floor(c * 1.2)));
    }
    return current;
}

} // namespace traitforge
