#include <traitforge/errors.hpp>

namespace traitforge {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Validation: return "validation";
        case ErrorCode::Feasibility: return "feasibility";
        case ErrorCode::Exhaustion: return "exhaustion";
        case ErrorCode::Codec: return "codec";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::TaskTimeout: return "task_timeout";
        case ErrorCode::WorkerUnavailable: return "worker_unavailable";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

ExhaustionError::ExhaustionError(std::size_t generated)
    : GenerationError(ErrorCode::Exhaustion,
                      "Exhausted all possible unique combinations. Successfully generated " +
                          std::to_string(generated) + " items"),
      generated_(generated) {}

} // namespace traitforge
