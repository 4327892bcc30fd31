#include <traitforge/orchestrator.hpp>
#include <traitforge/debug_log.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>

namespace traitforge {

const char* worker_health_name(WorkerHealth health) {
    switch (health) {
        case WorkerHealth::Initializing: return "initializing";
        case WorkerHealth::Healthy: return "healthy";
        case WorkerHealth::Degraded: return "degraded";
        case WorkerHealth::Unresponsive: return "unresponsive";
        case WorkerHealth::Removed: return "removed";
        case WorkerHealth::Retired: return "retired";
    }
    return "unknown";
}

Orchestrator::Orchestrator(WorkerFactory factory, OrchestratorConfig config)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      events_(std::make_shared<Mailbox<Event>>()) {
    if (!factory_) {
        throw std::invalid_argument("Orchestrator requires a worker factory");
    }
    dispatcher_ = std::thread(&Orchestrator::dispatcher_loop, this);
}

Orchestrator::~Orchestrator() {
    shutdown();
}

TaskId Orchestrator::submit(std::shared_ptr<const GenerationRequest> request, TaskCallback callback) {
    TaskId id = next_task_.fetch_add(1, std::memory_order_relaxed);
    submitted_.fetch_add(1, std::memory_order_acq_rel);
    if (!events_->push(SubmitEvent{id, std::move(request), callback})) {
        submitted_.fetch_sub(1, std::memory_order_acq_rel);
        if (callback) {
            callback(ErrorMessage{id, "Orchestrator has shut down", ErrorCode::WorkerUnavailable, false, 0});
        }
    }
    return id;
}

TaskId Orchestrator::submit(GenerationRequest request, TaskCallback callback) {
    return submit(std::make_shared<const GenerationRequest>(std::move(request)), std::move(callback));
}

void Orchestrator::cancel(TaskId task) {
    events_->push(CancelEvent{task});
}

PoolStatus Orchestrator::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

bool Orchestrator::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(status_mutex_);
    return status_cv_.wait_for(lock, timeout, [this] {
        if (stopped_.load()) return true;
        return status_.queued == 0 && status_.active == 0 &&
               published_accepted_ == submitted_.load(std::memory_order_acquire);
    });
}

void Orchestrator::shutdown() {
    if (stopped_.exchange(true)) return;
    events_->push(StopEvent{});
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    status_cv_.notify_all();
}

// ---- dispatcher thread ----

void Orchestrator::dispatcher_loop() {
    std::size_t initial = config_.initial_workers;
    if (initial == 0) {
        initial = config_.scaling.max_workers > 0 ? config_.scaling.max_workers
                                                  : max_workers_for(config_.device);
    }
    for (std::size_t i = 0; i < initial; ++i) {
        spawn_slot();
    }
    last_scale_ = Clock::now();
    publish_status();

    bool running = true;
    while (running) {
        if (auto event = events_->pop_for(config_.tick)) {
            running = handle_event(*event);
        }
        while (running) {
            auto more = events_->try_pop();
            if (!more) break;
            running = handle_event(*more);
        }
        if (!running) break;

        auto now = Clock::now();
        check_health(now);
        check_task_timeouts(now);
        rescale(now);
        dispatch();
        publish_status();
    }

    drain_on_shutdown();
    publish_status();
}

bool Orchestrator::handle_event(Event& event) {
    return std::visit(overloaded{
        [this](WorkerEvent& e) { handle_worker_event(e); return true; },
        [this](SubmitEvent& e) { handle_submit(e); return true; },
        [this](CancelEvent& e) { handle_cancel(e.task); return true; },
        [](StopEvent&) { return false; },
    }, event);
}

void Orchestrator::handle_submit(SubmitEvent& event) {
    ++accepted_;
    TaskRecord record;
    record.id = event.task;
    record.request = std::move(event.request);
    record.callback = std::move(event.callback);
    record.submitted = Clock::now();

    if (!record.request) {
        deliver(record, ErrorMessage{record.id, "Missing generation request", ErrorCode::Validation, false, 0});
        return;
    }
    if (exhausted_) {
        deliver(record, ErrorMessage{record.id, "No workers available", ErrorCode::WorkerUnavailable, true, 0});
        return;
    }

    record.complexity = classify_task(*record.request);
    TRAITFORGE_DEBUG("Task %llu queued: %s, %zu items",
                     static_cast<unsigned long long>(record.id),
                     complexity_name(record.complexity.tier), record.request->count);

    TaskId id = record.id;
    tasks_.emplace(id, std::move(record));
    queue_.push_back(id);
    dispatch();
}

void Orchestrator::handle_cancel(TaskId task) {
    auto it = tasks_.find(task);
    if (it == tasks_.end()) {
        TRAITFORGE_DEBUG("Cancel for unknown task %llu", static_cast<unsigned long long>(task));
        return;
    }
    TaskRecord& record = it->second;

    if (!record.slot) {
        queue_.erase(std::remove(queue_.begin(), queue_.end(), task), queue_.end());
        deliver(record, CancelledMessage{task, 0, record.request->count});
        tasks_.erase(it);
        return;
    }

    record.cancel_requested = true;
    WorkerSlot& slot = slots_[*record.slot];
    if (slot.worker) {
        slot.worker->post(CancelMessage{task});
    }
}

void Orchestrator::handle_worker_event(WorkerEvent& event) {
    if (event.slot >= slots_.size()) return;
    WorkerSlot& slot = slots_[event.slot];
    if (slot.incarnation != event.incarnation || !slot.worker) {
        TRAITFORGE_DEBUG("Dropping %s from stale worker %zu/%llu", message_name(event.message),
                         event.slot, static_cast<unsigned long long>(event.incarnation));
        return;
    }

    auto now = Clock::now();

    if (std::holds_alternative<ReadyMessage>(event.message)) {
        if (slot.health == WorkerHealth::Initializing) {
            slot.health = WorkerHealth::Healthy;
            slot.idle_since = now;
            slot.ping_sent = now;
            TRAITFORGE_DEBUG("Worker %zu ready", slot.index);
        }
        return;
    }
    if (auto* pong = std::get_if<PongMessage>(&event.message)) {
        if (slot.outstanding_ping && *slot.outstanding_ping == pong->ping_id) {
            auto latency = now - slot.ping_sent;
            slot.outstanding_ping.reset();
            slot.health = latency > config_.ping_timeout / 2 ? WorkerHealth::Degraded : WorkerHealth::Healthy;
        }
        return;
    }
    if (auto* fault = std::get_if<WorkerFaultMessage>(&event.message)) {
        TRAITFORGE_WARN("Worker %zu fault: %s", slot.index, fault->message.c_str());
        restart_worker(event.slot, "faulted");
        return;
    }

    // Task-scoped: route by task id, fall back to the worker's current task
    TaskId id = task_of(event.message);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        if (!slot.task) {
            TRAITFORGE_DEBUG("Dropping %s for unknown task %llu", message_name(event.message),
                             static_cast<unsigned long long>(id));
            return;
        }
        id = *slot.task;
        it = tasks_.find(id);
        if (it == tasks_.end()) return;
        set_task(event.message, id);
    } else if (it->second.slot != event.slot) {
        TRAITFORGE_WARN("Worker %zu sent %s for task %llu it does not own", slot.index,
                        message_name(event.message), static_cast<unsigned long long>(id));
        return;
    }

    TaskRecord& record = it->second;
    std::visit(overloaded{
        [&record](const ProgressMessage& m) { record.generated = std::max(record.generated, m.generated); },
        [&record](const ArtifactBatchMessage& m) {
            for (const auto& artifact : m.artifacts) {
                record.generated = std::max(record.generated, artifact.index);
                if (artifact.index > record.delivered.generated) {
                    record.delivered.generated = artifact.index;
                    record.delivered.delivered.push_back(artifact.assignment);
                }
            }
        },
        [](const auto&) {},
    }, event.message);

    bool terminal = is_terminal(event.message);
    bool failed = std::holds_alternative<ErrorMessage>(event.message);
    deliver(record, std::move(event.message));
    if (terminal) {
        finish_task(id, event.slot, failed);
        dispatch();
    }
}

void Orchestrator::deliver(TaskRecord& record, WorkerOutbound message) {
    if (!record.callback) return;
    try {
        record.callback(std::move(message));
    } catch (const std::exception& e) {
        TRAITFORGE_WARN("Callback for task %llu threw: %s",
                        static_cast<unsigned long long>(record.id), e.what());
    }
}

void Orchestrator::finish_task(TaskId task, std::size_t slot_index, bool failed) {
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return;

    WorkerSlot& slot = slots_[slot_index];
    auto now = Clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(now - it->second.started).count();

    ++slot.completed;
    slot.average_task_ms += (elapsed_ms - slot.average_task_ms) / static_cast<double>(slot.completed);
    if (failed) ++slot.errors;
    slot.task.reset();
    slot.idle_since = now;

    tasks_.erase(it);
}

void Orchestrator::fail_task(TaskId task, ErrorCode code, const std::string& message, bool recoverable) {
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return;
    TaskRecord& record = it->second;
    deliver(record, ErrorMessage{task, message, code, recoverable, record.generated});
    queue_.erase(std::remove(queue_.begin(), queue_.end(), task), queue_.end());
    tasks_.erase(it);
}

std::size_t Orchestrator::spawn_slot() {
    WorkerSlot slot;
    slot.index = slots_.size();
    slots_.push_back(std::move(slot));
    start_worker(slots_.back());
    return slots_.back().index;
}

void Orchestrator::start_worker(WorkerSlot& slot) {
    ++slot.incarnation;
    slot.health = WorkerHealth::Initializing;
    slot.created = Clock::now();
    slot.outstanding_ping.reset();

    auto events = events_;
    std::size_t index = slot.index;
    std::uint64_t incarnation = slot.incarnation;
    WorkerSink sink = [events, index, incarnation](WorkerOutbound message) {
        events->push(WorkerEvent{index, incarnation, std::move(message)});
    };

    try {
        slot.worker = factory_(index, std::move(sink));
    } catch (const std::exception& e) {
        TRAITFORGE_WARN("Failed to create worker %zu: %s", index, e.what());
        slot.worker.reset();
    }
    if (!slot.worker) {
        slot.health = WorkerHealth::Removed;
        check_pool_alive();
        return;
    }
    slot.worker->post(InitializeMessage{});
}

void Orchestrator::restart_worker(std::size_t slot_index, const char* reason) {
    WorkerSlot& slot = slots_[slot_index];
    if (slot.worker) {
        slot.worker->terminate();
        slot.worker.reset();
    }
    ++slot.errors;

    std::optional<TaskId> orphan = slot.task;
    slot.task.reset();

    // Queued before the replacement is built, so a failed rebuild that
    // empties the pool fails it along with the rest of the queue
    if (orphan) requeue_task(*orphan);

    if (slot.restarts >= config_.max_restarts) {
        TRAITFORGE_WARN("Worker %zu %s; restart budget spent, removing it", slot.index, reason);
        slot.health = WorkerHealth::Removed;
    } else {
        ++slot.restarts;
        TRAITFORGE_WARN("Worker %zu %s; restarting (%zu/%zu)", slot.index, reason,
                        slot.restarts, config_.max_restarts);
        start_worker(slot);
    }

    check_pool_alive();
}

void Orchestrator::requeue_task(TaskId task) {
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return;
    TaskRecord& record = it->second;

    record.slot.reset();
    ++record.attempts;
    if (record.cancel_requested) {
        deliver(record, CancelledMessage{task, record.generated, record.request->count});
        tasks_.erase(it);
        return;
    }
    if (record.attempts >= config_.max_task_attempts) {
        fail_task(task, ErrorCode::WorkerUnavailable,
                  "Task lost " + std::to_string(record.attempts) + " workers", true);
        return;
    }
    if (exhausted_) {
        fail_task(task, ErrorCode::WorkerUnavailable, "No workers available", true);
        return;
    }

    // The replacement continues after the last artifact the caller received;
    // anything the lost worker buffered but never sent is produced again
    record.generated = record.delivered.generated;
    deliver(record, ProgressMessage{task, record.generated, record.request->count,
                                    "Resuming on another worker", std::nullopt});
    queue_.push_front(task);
}

std::size_t Orchestrator::live_worker_count() const {
    return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(),
                                                  [](const WorkerSlot& s) { return s.live(); }));
}

void Orchestrator::check_pool_alive() {
    if (exhausted_ || live_worker_count() > 0 || slots_.empty()) return;

    bool any_removed = std::any_of(slots_.begin(), slots_.end(),
                                   [](const WorkerSlot& s) { return s.health == WorkerHealth::Removed; });
    if (!any_removed) return;

    exhausted_ = true;
    TRAITFORGE_WARN("All workers removed; failing %zu queued tasks", queue_.size());
    std::vector<TaskId> pending(queue_.begin(), queue_.end());
    for (TaskId task : pending) {
        fail_task(task, ErrorCode::WorkerUnavailable, "No workers available", true);
    }
}

std::optional<std::size_t> Orchestrator::choose_worker() const {
    std::optional<std::size_t> best;
    for (const auto& slot : slots_) {
        if (!slot.available()) continue;
        if (!best) {
            best = slot.index;
            continue;
        }
        const WorkerSlot& current = slots_[*best];
        auto rank = [](const WorkerSlot& s) {
            return std::make_tuple(s.health == WorkerHealth::Healthy ? 0 : 1,
                                   s.task ? 1 : 0,
                                   s.average_task_ms,
                                   s.errors);
        };
        if (rank(slot) < rank(current)) best = slot.index;
    }
    return best;
}

void Orchestrator::dispatch() {
    while (!queue_.empty()) {
        auto chosen = choose_worker();
        if (!chosen) return;

        TaskId id = queue_.front();
        queue_.pop_front();
        auto it = tasks_.find(id);
        if (it == tasks_.end()) continue;

        TaskRecord& record = it->second;
        WorkerSlot& slot = slots_[*chosen];
        record.slot = *chosen;
        record.started = Clock::now();
        record.overdue_logged = false;
        slot.task = id;
        StartMessage start;
        start.task = id;
        start.request = record.request;
        if (record.delivered.generated > 0) start.resume = record.delivered;
        slot.worker->post(std::move(start));
        TRAITFORGE_DEBUG("Task %llu -> worker %zu", static_cast<unsigned long long>(id), slot.index);
    }
}

void Orchestrator::check_health(Clock::time_point now) {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        WorkerSlot& slot = slots_[i];
        if (!slot.worker) continue;

        if (slot.health == WorkerHealth::Initializing) {
            if (now - slot.created > config_.init_timeout) {
                slot.health = WorkerHealth::Unresponsive;
                restart_worker(i, "never became ready");
            }
            continue;
        }

        if (slot.outstanding_ping) {
            if (now - slot.ping_sent > config_.ping_timeout) {
                slot.health = WorkerHealth::Unresponsive;
                restart_worker(i, "missed a health check");
            }
            continue;
        }

        if (now - slot.ping_sent >= config_.health_interval) {
            slot.outstanding_ping = next_ping_++;
            slot.ping_sent = now;
            slot.worker->post(PingMessage{*slot.outstanding_ping});
        }
    }
}

void Orchestrator::check_task_timeouts(Clock::time_point now) {
    std::vector<std::pair<TaskId, std::size_t>> expired;
    for (auto& [id, record] : tasks_) {
        if (!record.slot) continue;
        auto running = now - record.started;
        if (running > config_.task_timeout) {
            expired.emplace_back(id, *record.slot);
        } else if (!record.overdue_logged && record.complexity.estimated_duration.count() > 0 &&
                   running > record.complexity.estimated_duration * 2) {
            record.overdue_logged = true;
            TRAITFORGE_WARN("Task %llu is running well past its %s estimate",
                            static_cast<unsigned long long>(id), complexity_name(record.complexity.tier));
        }
    }

    for (const auto& [id, slot_index] : expired) {
        fail_task(id, ErrorCode::TaskTimeout, "Task timed out", true);
        WorkerSlot& slot = slots_[slot_index];
        slot.task.reset();
        slot.health = WorkerHealth::Degraded;
        restart_worker(slot_index, "exceeded the task timeout");
    }
}

void Orchestrator::rescale(Clock::time_point now) {
    if (exhausted_ || now - last_scale_ < config_.scaling_interval) return;
    last_scale_ = now;

    PoolSnapshot snapshot;
    snapshot.workers = live_worker_count();
    snapshot.queued = queue_.size();
    for (const auto& slot : slots_) {
        if (!slot.live()) continue;
        if (slot.task) {
            ++snapshot.busy;
        } else if (slot.available() && now - slot.idle_since > config_.scaling.idle_timeout) {
            ++snapshot.idle_expired;
        }
    }
    for (const auto& [id, record] : tasks_) {
        if (record.complexity.tier == TaskComplexity::Complex) snapshot.complex_pending = true;
    }

    std::size_t target = target_worker_count(snapshot, config_.device, config_.scaling);
    if (target > snapshot.workers) {
        TRAITFORGE_INFO("Scaling up from %zu to %zu workers", snapshot.workers, target);
        for (std::size_t i = snapshot.workers; i < target; ++i) spawn_slot();
    } else if (target < snapshot.workers) {
        std::size_t retire = snapshot.workers - target;
        TRAITFORGE_INFO("Scaling down from %zu to %zu workers", snapshot.workers, target);
        for (auto& slot : slots_) {
            if (retire == 0) break;
            if (!slot.available() || now - slot.idle_since <= config_.scaling.idle_timeout) continue;
            slot.worker.reset();
            slot.health = WorkerHealth::Retired;
            --retire;
        }
    }
}

void Orchestrator::drain_on_shutdown() {
    events_->close();

    for (TaskId id : queue_) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) continue;
        deliver(it->second, CancelledMessage{id, 0, it->second.request->count});
        tasks_.erase(it);
    }
    queue_.clear();

    for (auto& [id, record] : tasks_) {
        deliver(record, CancelledMessage{id, record.generated, record.request->count});
    }
    tasks_.clear();

    for (auto& slot : slots_) {
        if (!slot.worker) continue;
        // A busy worker may be stuck; don't wait for it
        if (slot.task) {
            slot.worker->terminate();
        }
        slot.worker.reset();
        slot.task.reset();
        slot.health = WorkerHealth::Retired;
    }
}

void Orchestrator::publish_status() {
    PoolStatus status;
    status.workers.reserve(slots_.size());
    for (const auto& slot : slots_) {
        WorkerStatus ws;
        ws.slot = slot.index;
        ws.health = slot.health;
        ws.task = slot.task;
        ws.restarts = slot.restarts;
        ws.errors = slot.errors;
        ws.completed = slot.completed;
        ws.average_task_ms = slot.average_task_ms;
        status.workers.push_back(ws);
        if (slot.live()) ++status.live_workers;
        if (slot.task) ++status.active;
    }
    status.queued = queue_.size();
    status.exhausted = exhausted_;

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = std::move(status);
        published_accepted_ = accepted_;
    }
    status_cv_.notify_all();
}

} // namespace traitforge
