#ifndef TRAITFORGE_WORKER_HPP
#define TRAITFORGE_WORKER_HPP

#include <traitforge/generation_controller.hpp>
#include <traitforge/image_codec.hpp>
#include <traitforge/mailbox.hpp>
#include <traitforge/messages.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

namespace traitforge {

// Delivers a worker's outbound messages; bound to one worker incarnation
using WorkerSink = std::function<void(WorkerOutbound)>;

/**
 * Handle to an isolated generation worker. All interaction is by message:
 * the orchestrator posts WorkerInbound messages and hears back through the
 * sink the worker was created with.
 */
class Worker {
public:
    virtual ~Worker() = default;

    virtual void post(WorkerInbound message) = 0;

    // Abandon the worker without waiting for it; later output is ignored
    virtual void terminate() = 0;
};

using WorkerFactory = std::function<std::unique_ptr<Worker>(std::size_t slot, WorkerSink sink)>;
using CodecFactory = std::function<std::unique_ptr<ImageCodec>()>;

/**
 * Worker backed by a dedicated thread with its own codec and controller.
 *
 * While a run is in progress the inbox is pumped at every suspension point,
 * so pings are answered and cancels observed mid-run. A Start that arrives
 * during a run is held until the run finishes.
 */
class ThreadWorker : public Worker {
public:
    ThreadWorker(WorkerSink sink, CodecFactory codecs, ControllerConfig config,
                 DeviceProfile device, MemoryProbe probe);

    // Closes the inbox and waits for the current run to notice
    ~ThreadWorker() override;

    ThreadWorker(const ThreadWorker&) = delete;
    ThreadWorker& operator=(const ThreadWorker&) = delete;

    void post(WorkerInbound message) override;
    void terminate() override;

private:
    struct State {
        Mailbox<WorkerInbound> inbox;
        WorkerSink sink;
        CodecFactory codecs;
        ControllerConfig config;
        DeviceProfile device;
        MemoryProbe probe;
        std::atomic<bool> terminated{false};
    };

    static void worker_loop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread thread_;
};

WorkerFactory thread_worker_factory(CodecFactory codecs,
                                    ControllerConfig config = {},
                                    DeviceProfile device = DeviceProfile::detect(),
                                    MemoryProbe probe = system_memory_probe());

} // namespace traitforge

#endif // TRAITFORGE_WORKER_HPP
