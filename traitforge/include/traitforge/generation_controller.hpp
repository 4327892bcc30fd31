#ifndef TRAITFORGE_GENERATION_CONTROLLER_HPP
#define TRAITFORGE_GENERATION_CONTROLLER_HPP

#include <traitforge/chunk_policy.hpp>
#include <traitforge/compositor.hpp>
#include <traitforge/constraint_solver.hpp>
#include <traitforge/image_codec.hpp>
#include <traitforge/memory_probe.hpp>
#include <traitforge/messages.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace traitforge {

enum class RunState {
    Idle,
    Validating,
    Streaming,
    Chunked,
    Completed,
    Cancelled,
    Failed
};

const char* run_state_name(RunState state);

struct ControllerConfig {
    std::size_t streaming_threshold = 1000;       // Counts at or below stream item by item
    std::size_t max_consecutive_failures = 1000;
    std::size_t streaming_progress_interval = 5;
    std::size_t chunked_progress_interval = 50;
    std::size_t preview_interval = 50;            // Streaming only
    std::uint32_t preview_size = Compositor::PREVIEW_SIZE;
    int jpeg_quality = Compositor::DEFAULT_JPEG_QUALITY;
    bool check_feasibility = true;
    std::size_t feasibility_budget = 100000;
    std::size_t decode_cache_bytes = 64 * 1024 * 1024;
    ChunkBounds chunk_bounds;
    SolverOptions solver;
};

struct RunContext {
    std::function<void(WorkerOutbound)> emit;
    YieldHook yield;                          // Suspension points inside rendering
    std::function<bool()> is_cancelled;
};

/**
 * Drives one generation run: validate, pre-check feasibility, then loop
 * solve -> render -> commit -> deliver until the requested count is reached,
 * the run is cancelled, or the solver is exhausted.
 *
 * Every run ends with exactly one terminal message (complete, error or
 * cancelled). Artifacts are emitted in strictly increasing index order.
 * Per-run state (tracker, solver memo, decode cache, canvas) is rebuilt on
 * every call to run().
 */
class GenerationController {
public:
    explicit GenerationController(ImageCodec& codec,
                                  ControllerConfig config = {},
                                  DeviceProfile device = DeviceProfile::detect(),
                                  MemoryProbe probe = system_memory_probe());

    /**
     * @param resume items already delivered by an earlier run of the same
     *        task; their selections count against uniqueness and numbering
     *        continues after them
     */
    RunState run(TaskId task, std::shared_ptr<const GenerationRequest> request, const RunContext& context,
                 const std::optional<ResumePoint>& resume = std::nullopt);

    RunState state() const { return state_.load(std::memory_order_acquire); }
    const ControllerConfig& config() const { return config_; }

private:
    void set_state(RunState state) { state_.store(state, std::memory_order_release); }
    ProgressMessage progress(TaskId task, std::size_t generated, std::size_t total, const char* status) const;

    ImageCodec& codec_;
    ControllerConfig config_;
    DeviceProfile device_;
    MemoryProbe probe_;
    std::atomic<RunState> state_{RunState::Idle};
};

} // namespace traitforge

#endif // TRAITFORGE_GENERATION_CONTROLLER_HPP
