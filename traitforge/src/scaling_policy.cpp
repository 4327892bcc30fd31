#include <traitforge/scaling_policy.hpp>
#include <algorithm>
#include <cmath>

namespace traitforge {

const char* complexity_name(TaskComplexity complexity) {
    switch (complexity) {
        case TaskComplexity::Simple: return "simple";
        case TaskComplexity::Medium: return "medium";
        case TaskComplexity::Complex: return "complex";
    }
    return "unknown";
}

ComplexityProfile classify_task(const GenerationRequest& request) {
    ComplexityProfile profile;
    profile.layers = request.layers.size();
    for (const auto& layer : request.layers) {
        profile.traits += layer.traits.size();
        for (const auto& trait : layer.traits) {
            if (trait.is_ruler() && trait.rules.size() > 2) profile.complex_rules = true;
        }
    }

    if (profile.layers <= 12 && profile.traits <= 100 && request.count <= 15000 && !profile.complex_rules) {
        profile.tier = TaskComplexity::Simple;
    } else if (profile.layers <= 20 && profile.traits <= 300 && request.count <= 25000) {
        profile.tier = TaskComplexity::Medium;
    } else {
        profile.tier = TaskComplexity::Complex;
    }

    // Rough per-item cost: 2 ms at 1 megapixel per layer, scaled by tier
    double megapixels = static_cast<double>(request.output.width) * request.output.height / 1.0e6;
    double per_item_ms = 2.0 * std::max(1.0, megapixels) * std::max<std::size_t>(1, profile.layers) / 4.0;
    double tier_factor = profile.tier == TaskComplexity::Simple ? 1.0
                       : profile.tier == TaskComplexity::Medium ? 1.5 : 2.5;
    profile.estimated_duration = std::chrono::milliseconds(
        static_cast<long long>(per_item_ms * tier_factor * static_cast<double>(request.count)));
    return profile;
}

std::size_t max_workers_for(const DeviceProfile& device) {
    auto by_cores = static_cast<std::size_t>(std::floor(static_cast<double>(device.cores) * 0.75));
    auto by_memory = static_cast<std::size_t>(std::floor(device.memory_gb * 1024.0 / 128.0));
    std::size_t count = std::min(by_cores, by_memory);
    if (device.constrained) {
        count = std::max<std::size_t>(1, count / 2);
    }
    return std::clamp<std::size_t>(count, 1, 4);
}

std::size_t target_worker_count(const PoolSnapshot& pool, const DeviceProfile& device,
                                const ScalingPolicy& policy) {
    std::size_t ceiling = policy.max_workers > 0 ? policy.max_workers : max_workers_for(device);
    if (pool.complex_pending && device.constrained) {
        ceiling = std::max<std::size_t>(1, ceiling / 2);
    }
    std::size_t minimum = std::min(policy.min_workers, ceiling);

    std::size_t target = pool.workers;
    if (pool.workers < minimum) {
        target = minimum;
    } else if (pool.pressure() > policy.scale_up_pressure && pool.queued > 0) {
        target = std::min(ceiling, pool.workers + std::max<std::size_t>(1, pool.queued));
        target = std::max(target, pool.workers);
    } else if (pool.pressure() < policy.scale_down_pressure && pool.idle_expired > 0) {
        std::size_t retire = std::min(pool.idle_expired, pool.workers - minimum);
        target = pool.workers - retire;
    }

    // Over the ceiling (e.g. after it was lowered): shed idle workers first
    if (target > ceiling && pool.workers > ceiling) {
        target = std::max(ceiling, pool.busy);
    }
    return target;
}

} // namespace traitforge
