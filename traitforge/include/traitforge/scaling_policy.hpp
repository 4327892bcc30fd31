#ifndef TRAITFORGE_SCALING_POLICY_HPP
#define TRAITFORGE_SCALING_POLICY_HPP

#include <traitforge/memory_probe.hpp>
#include <traitforge/types.hpp>
#include <chrono>
#include <cstddef>

namespace traitforge {

enum class TaskComplexity {
    Simple,
    Medium,
    Complex
};

const char* complexity_name(TaskComplexity complexity);

struct ComplexityProfile {
    TaskComplexity tier = TaskComplexity::Simple;
    std::size_t layers = 0;
    std::size_t traits = 0;
    bool complex_rules = false;                       // Some trait carries more than two rules
    std::chrono::milliseconds estimated_duration{0};
};

/**
 * Simple:  <= 12 layers, <= 100 traits, <= 15000 items, no complex rules
 * Medium:  <= 20 layers, <= 300 traits, <= 25000 items
 * Complex: anything else
 * The duration estimate scales with item count and output pixel count.
 */
ComplexityProfile classify_task(const GenerationRequest& request);

struct ScalingPolicy {
    std::size_t min_workers = 1;
    std::size_t max_workers = 0;            // 0 = derive from the device
    double scale_up_pressure = 1.0;         // (queued + busy) per worker above which to grow
    double scale_down_pressure = 0.25;      // Below which idle workers may retire
    std::chrono::milliseconds idle_timeout{30000};
};

struct PoolSnapshot {
    std::size_t workers = 0;                // Live (not removed) workers
    std::size_t busy = 0;
    std::size_t queued = 0;
    std::size_t idle_expired = 0;           // Idle workers past the idle timeout
    bool complex_pending = false;           // A complex task is queued or running

    double pressure() const {
        return workers == 0 ? static_cast<double>(busy + queued)
                            : static_cast<double>(busy + queued) / static_cast<double>(workers);
    }
};

/**
 * Device-derived ceiling: min(cores * 0.75, memory_mb / 128), halved on
 * constrained devices, clamped to [1, 4].
 */
std::size_t max_workers_for(const DeviceProfile& device);

/**
 * Desired live worker count. Under pressure it grows toward the ceiling by
 * as many workers as there are queued tasks; it shrinks by retiring expired idle
 * workers when pressure is low, never below min_workers. Complex work on a
 * constrained device halves the ceiling.
 */
std::size_t target_worker_count(const PoolSnapshot& pool, const DeviceProfile& device,
                                const ScalingPolicy& policy);

} // namespace traitforge

#endif // TRAITFORGE_SCALING_POLICY_HPP
