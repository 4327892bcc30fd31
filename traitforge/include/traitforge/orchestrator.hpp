#ifndef TRAITFORGE_ORCHESTRATOR_HPP
#define TRAITFORGE_ORCHESTRATOR_HPP

#include <traitforge/mailbox.hpp>
#include <traitforge/messages.hpp>
#include <traitforge/scaling_policy.hpp>
#include <traitforge/worker.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace traitforge {

enum class WorkerHealth {
    Initializing,
    Healthy,
    Degraded,       // Answering pings, but slowly
    Unresponsive,
    Removed,        // Restart budget spent
    Retired         // Scaled down
};

const char* worker_health_name(WorkerHealth health);

struct OrchestratorConfig {
    std::size_t initial_workers = 0;                      // 0 = device-derived ceiling
    std::chrono::milliseconds tick{20};
    std::chrono::milliseconds health_interval{30000};
    std::chrono::milliseconds ping_timeout{5000};
    std::chrono::milliseconds init_timeout{5000};
    std::chrono::milliseconds task_timeout{300000};
    std::chrono::milliseconds scaling_interval{1000};
    std::size_t max_restarts = 3;                         // Per worker slot
    std::size_t max_task_attempts = 3;                    // Worker failures a task survives
    ScalingPolicy scaling;
    DeviceProfile device = DeviceProfile::detect();
};

// Invoked on the dispatcher thread; artifacts are moved into the callback
using TaskCallback = std::function<void(WorkerOutbound)>;

struct WorkerStatus {
    std::size_t slot = 0;
    WorkerHealth health = WorkerHealth::Initializing;
    std::optional<TaskId> task;
    std::size_t restarts = 0;
    std::size_t errors = 0;
    std::size_t completed = 0;
    double average_task_ms = 0.0;
};

struct PoolStatus {
    std::vector<WorkerStatus> workers;
    std::size_t live_workers = 0;
    std::size_t queued = 0;
    std::size_t active = 0;
    bool exhausted = false;       // Every worker was removed
};

/**
 * Owns the worker pool and routes tasks and messages between callers and
 * workers.
 *
 * All pool state lives on one dispatcher thread fed by a mailbox; callers and
 * workers only ever post events to it. Each task occupies one worker for its
 * whole run. Workers that stop answering pings, fail to start, fault or
 * exceed the task timeout are replaced and their task is requeued from the
 * start, up to max_restarts per slot; after that the slot is removed.
 */
class Orchestrator {
public:
    explicit Orchestrator(WorkerFactory factory, OrchestratorConfig config = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Queue a request. The callback receives every message for the task and
     * exactly one terminal message (complete, error or cancelled).
     */
    TaskId submit(std::shared_ptr<const GenerationRequest> request, TaskCallback callback);
    TaskId submit(GenerationRequest request, TaskCallback callback);

    void cancel(TaskId task);

    PoolStatus status() const;

    // @return true if the pool drained (nothing queued or running) in time
    bool wait_idle(std::chrono::milliseconds timeout);

    // Cancels outstanding work and stops all workers. Idempotent.
    void shutdown();

private:
    using Clock = std::chrono::steady_clock;

    struct WorkerEvent {
        std::size_t slot;
        std::uint64_t incarnation;
        WorkerOutbound message;
    };
    struct SubmitEvent {
        TaskId task;
        std::shared_ptr<const GenerationRequest> request;
        TaskCallback callback;
    };
    struct CancelEvent {
        TaskId task;
    };
    struct StopEvent {};

    using Event = std::variant<WorkerEvent, SubmitEvent, CancelEvent, StopEvent>;

    struct TaskRecord {
        TaskId id = INVALID_TASK;
        std::shared_ptr<const GenerationRequest> request;
        TaskCallback callback;
        ComplexityProfile complexity;
        std::optional<std::size_t> slot;
        Clock::time_point submitted;
        Clock::time_point started;
        std::size_t attempts = 0;
        std::size_t generated = 0;
        ResumePoint delivered;                  // Artifacts already handed to the caller
        bool cancel_requested = false;
        bool overdue_logged = false;
    };

    struct WorkerSlot {
        std::size_t index = 0;
        std::uint64_t incarnation = 0;
        std::unique_ptr<Worker> worker;
        WorkerHealth health = WorkerHealth::Initializing;
        std::optional<TaskId> task;
        std::optional<std::uint64_t> outstanding_ping;
        Clock::time_point created;
        Clock::time_point ping_sent;
        Clock::time_point idle_since;
        std::size_t restarts = 0;
        std::size_t errors = 0;
        std::size_t completed = 0;
        double average_task_ms = 0.0;

        bool live() const { return health != WorkerHealth::Removed && health != WorkerHealth::Retired; }
        bool available() const {
            return worker && !task && (health == WorkerHealth::Healthy || health == WorkerHealth::Degraded);
        }
    };

    void dispatcher_loop();
    bool handle_event(Event& event);
    void handle_worker_event(WorkerEvent& event);
    void handle_submit(SubmitEvent& event);
    void handle_cancel(TaskId task);

    std::size_t spawn_slot();
    void start_worker(WorkerSlot& slot);
    void restart_worker(std::size_t slot, const char* reason);
    void requeue_task(TaskId task);
    void finish_task(TaskId task, std::size_t slot, bool failed);
    void deliver(TaskRecord& record, WorkerOutbound message);
    void fail_task(TaskId task, ErrorCode code, const std::string& message, bool recoverable);
    void check_pool_alive();

    void dispatch();
    std::optional<std::size_t> choose_worker() const;
    void check_health(Clock::time_point now);
    void check_task_timeouts(Clock::time_point now);
    void rescale(Clock::time_point now);
    void drain_on_shutdown();
    void publish_status();
    std::size_t live_worker_count() const;

    WorkerFactory factory_;
    OrchestratorConfig config_;
    std::shared_ptr<Mailbox<Event>> events_;
    std::atomic<TaskId> next_task_{1};
    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<bool> stopped_{false};
    std::thread dispatcher_;

    // Dispatcher thread only
    std::vector<WorkerSlot> slots_;
    std::unordered_map<TaskId, TaskRecord> tasks_;
    std::deque<TaskId> queue_;
    std::uint64_t next_ping_ = 1;
    bool exhausted_ = false;
    std::uint64_t accepted_ = 0;          // Submit events handled
    Clock::time_point last_scale_;

    mutable std::mutex status_mutex_;
    std::condition_variable status_cv_;
    PoolStatus status_;
    std::uint64_t published_accepted_ = 0;
};

} // namespace traitforge

#endif // TRAITFORGE_ORCHESTRATOR_HPP
