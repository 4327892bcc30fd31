#include <traitforge/worker.hpp>
#include <traitforge/debug_log.hpp>
#include <deque>

namespace traitforge {

ThreadWorker::ThreadWorker(WorkerSink sink, CodecFactory codecs, ControllerConfig config,
                           DeviceProfile device, MemoryProbe probe)
    : state_(std::make_shared<State>()) {
    state_->sink = std::move(sink);
    state_->codecs = std::move(codecs);
    state_->config = std::move(config);
    state_->device = device;
    state_->probe = std::move(probe);
    thread_ = std::thread(&ThreadWorker::worker_loop, state_);
}

ThreadWorker::~ThreadWorker() {
    state_->inbox.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ThreadWorker::post(WorkerInbound message) {
    if (!state_->inbox.push(std::move(message))) {
        TRAITFORGE_DEBUG("Dropped message for a closed worker");
    }
}

void ThreadWorker::terminate() {
    state_->terminated.store(true, std::memory_order_release);
    state_->inbox.close();
    // The thread owns a reference to the state and exits at its next check
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void ThreadWorker::worker_loop(std::shared_ptr<State> state) {
    auto send = [&state](WorkerOutbound message) {
        if (state->terminated.load(std::memory_order_acquire)) return;
        state->sink(std::move(message));
    };

    try {
        std::unique_ptr<ImageCodec> codec = state->codecs();
        if (!codec) {
            send(WorkerFaultMessage{"Codec factory returned no codec"});
            return;
        }
        GenerationController controller(*codec, state->config, state->device, state->probe);

        std::deque<StartMessage> pending;
        TaskId current = INVALID_TASK;
        bool cancel_requested = false;

        auto handle_control = [&](WorkerInbound& message) {
            std::visit(overloaded{
                [&](const InitializeMessage&) { send(ReadyMessage{}); },
                [&](const PingMessage& ping) { send(PongMessage{ping.ping_id}); },
                [&](const CancelMessage& cancel) {
                    if (cancel.task == current) {
                        cancel_requested = true;
                        return;
                    }
                    // Held starts are dropped and acknowledged right away
                    for (auto it = pending.begin(); it != pending.end(); ++it) {
                        if (it->task != cancel.task) continue;
                        std::size_t total = it->request ? it->request->count : 0;
                        std::size_t done = it->resume ? it->resume->generated : 0;
                        send(CancelledMessage{cancel.task, done, total});
                        pending.erase(it);
                        break;
                    }
                },
                [&](StartMessage& start) { pending.push_back(std::move(start)); },
            }, message);
        };

        auto pump = [&]() {
            while (auto message = state->inbox.try_pop()) {
                handle_control(*message);
            }
        };

        RunContext context;
        context.emit = send;
        context.yield = pump;
        context.is_cancelled = [&]() {
            pump();
            return cancel_requested || state->inbox.closed();
        };

        while (true) {
            if (pending.empty()) {
                auto message = state->inbox.pop();
                if (!message) break;
                handle_control(*message);
                continue;
            }

            StartMessage start = std::move(pending.front());
            pending.pop_front();
            current = start.task;
            cancel_requested = false;

            RunState result = controller.run(start.task, std::move(start.request), context, start.resume);
            TRAITFORGE_DEBUG("Task %llu finished: %s",
                             static_cast<unsigned long long>(start.task), run_state_name(result));
            current = INVALID_TASK;
        }
    } catch (const std::exception& e) {
        TRAITFORGE_WARN("Worker loop failed: %s", e.what());
        send(WorkerFaultMessage{e.what()});
    }
}

WorkerFactory thread_worker_factory(CodecFactory codecs, ControllerConfig config,
                                    DeviceProfile device, MemoryProbe probe) {
    return [codecs = std::move(codecs), config = std::move(config), device, probe = std::move(probe)](
               std::size_t slot, WorkerSink sink) -> std::unique_ptr<Worker> {
        TRAITFORGE_DEBUG("Spawning thread worker for slot %zu", slot);
        (void)slot;
        return std::make_unique<ThreadWorker>(std::move(sink), codecs, config, device, probe);
    };
}

} // namespace traitforge
