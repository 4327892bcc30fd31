#include <traitforge/messages.hpp>
#include <type_traits>

namespace traitforge {

namespace {

template<typename T>
constexpr bool has_task_v =
    !std::is_same_v<T, ReadyMessage> && !std::is_same_v<T, PongMessage> &&
    !std::is_same_v<T, WorkerFaultMessage>;

} // namespace

bool is_terminal(const WorkerOutbound& message) {
    return std::holds_alternative<CompleteMessage>(message) ||
           std::holds_alternative<ErrorMessage>(message) ||
           std::holds_alternative<CancelledMessage>(message);
}

TaskId task_of(const WorkerOutbound& message) {
    return std::visit([](const auto& m) -> TaskId {
        using T = std::decay_t<decltype(m)>;
        if constexpr (has_task_v<T>) {
            return m.task;
        } else {
            return INVALID_TASK;
        }
    }, message);
}

void set_task(WorkerOutbound& message, TaskId task) {
    std::visit([task](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (has_task_v<T>) {
            m.task = task;
        }
    }, message);
}

const char* message_name(const WorkerOutbound& message) {
    return std::visit(overloaded{
        [](const ReadyMessage&) { return "ready"; },
        [](const PongMessage&) { return "pong"; },
        [](const ProgressMessage&) { return "progress"; },
        [](const PreviewMessage&) { return "preview"; },
        [](const ArtifactBatchMessage&) { return "batch"; },
        [](const ItemFailedMessage&) { return "item_failed"; },
        [](const CompleteMessage&) { return "complete"; },
        [](const ErrorMessage&) { return "error"; },
        [](const CancelledMessage&) { return "cancelled"; },
        [](const WorkerFaultMessage&) { return "worker_fault"; },
    }, message);
}

} // namespace traitforge
