#ifndef TRAITFORGE_MEMORY_PROBE_HPP
#define TRAITFORGE_MEMORY_PROBE_HPP

#include <cstddef>
#include <functional>
#include <optional>

namespace traitforge {

struct MemorySnapshot {
    std::size_t used_bytes = 0;
    std::size_t limit_bytes = 0;

    double ratio() const {
        return limit_bytes == 0 ? 0.0 : static_cast<double>(used_bytes) / static_cast<double>(limit_bytes);
    }
};

// Returns nullopt when the platform can't report memory usage
using MemoryProbe = std::function<std::optional<MemorySnapshot>()>;

/**
 * System-wide usage from /proc/meminfo (MemTotal - MemAvailable).
 */
std::optional<MemorySnapshot> read_system_memory();

MemoryProbe system_memory_probe();

struct DeviceProfile {
    std::size_t cores = 1;
    double memory_gb = 4.0;
    bool constrained = false;   // Low-power or memory-starved device

    /**
     * Probe hardware_concurrency and physical memory. Devices with at most
     * 2 cores or 2 GB count as constrained.
     */
    static DeviceProfile detect();
};

} // namespace traitforge

#endif // TRAITFORGE_MEMORY_PROBE_HPP
