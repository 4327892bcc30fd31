#ifndef TRAITFORGE_MESSAGES_HPP
#define TRAITFORGE_MESSAGES_HPP

#include <traitforge/errors.hpp>
#include <traitforge/memory_probe.hpp>
#include <traitforge/types.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace traitforge {

// Orchestrator -> worker

struct InitializeMessage {};

struct PingMessage {
    std::uint64_t ping_id = 0;
};

struct CancelMessage {
    TaskId task = INVALID_TASK;
};

/**
 * Progress a previous worker already delivered for a reassigned task. The
 * new run re-seeds uniqueness from the delivered selections and continues at
 * generated + 1.
 */
struct ResumePoint {
    std::size_t generated = 0;
    std::vector<Assignment> delivered;
};

// The request is shared read-only between the orchestrator and one worker
struct StartMessage {
    TaskId task = INVALID_TASK;
    std::shared_ptr<const GenerationRequest> request;
    std::optional<ResumePoint> resume;
};

using WorkerInbound = std::variant<InitializeMessage, PingMessage, CancelMessage, StartMessage>;

// Worker -> orchestrator -> caller

struct ReadyMessage {};

struct PongMessage {
    std::uint64_t ping_id = 0;
};

struct ProgressMessage {
    TaskId task = INVALID_TASK;
    std::size_t generated = 0;
    std::size_t total = 0;
    std::string status;
    std::optional<MemorySnapshot> memory;
};

struct PreviewMessage {
    TaskId task = INVALID_TASK;
    std::vector<std::size_t> indexes;
    std::vector<std::vector<std::uint8_t>> previews;   // PNG thumbnails, parallel to indexes
};

// One artifact in streaming mode, a whole chunk in chunked mode
struct ArtifactBatchMessage {
    TaskId task = INVALID_TASK;
    std::vector<Artifact> artifacts;
    bool chunked = false;
};

struct ItemFailedMessage {
    TaskId task = INVALID_TASK;
    std::size_t index = 0;
    std::string message;
    ErrorCode code = ErrorCode::Codec;
};

struct CompleteMessage {
    TaskId task = INVALID_TASK;
    std::size_t generated = 0;
    std::size_t total = 0;
};

struct ErrorMessage {
    TaskId task = INVALID_TASK;
    std::string message;
    ErrorCode code = ErrorCode::Internal;
    bool recoverable = false;
    std::size_t generated = 0;
};

struct CancelledMessage {
    TaskId task = INVALID_TASK;
    std::size_t generated = 0;
    std::size_t total = 0;
};

// Worker infrastructure failure, never forwarded to callers
struct WorkerFaultMessage {
    std::string message;
};

using WorkerOutbound = std::variant<ReadyMessage, PongMessage, ProgressMessage, PreviewMessage,
                                    ArtifactBatchMessage, ItemFailedMessage, CompleteMessage,
                                    ErrorMessage, CancelledMessage, WorkerFaultMessage>;

// Complete, error or cancelled
bool is_terminal(const WorkerOutbound& message);

// Task the message belongs to, INVALID_TASK for control messages
TaskId task_of(const WorkerOutbound& message);

// Overwrite the task id of task-scoped messages
void set_task(WorkerOutbound& message, TaskId task);

const char* message_name(const WorkerOutbound& message);

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace traitforge

#endif // TRAITFORGE_MESSAGES_HPP
