#include <traitforge/generation_controller.hpp>
#include <traitforge/catalog.hpp>
#include <traitforge/debug_log.hpp>
#include <traitforge/errors.hpp>
#include <traitforge/feasibility.hpp>
#include <traitforge/metadata.hpp>
#include <traitforge/uniqueness_tracker.hpp>
#include <algorithm>
#include <cstdio>
#include <new>
#include <string>
#include <vector>

namespace traitforge {

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Validating: return "validating";
        case RunState::Streaming: return "streaming";
        case RunState::Chunked: return "chunked";
        case RunState::Completed: return "completed";
        case RunState::Cancelled: return "cancelled";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

GenerationController::GenerationController(ImageCodec& codec, ControllerConfig config,
                                           DeviceProfile device, MemoryProbe probe)
    : codec_(codec), config_(std::move(config)), device_(device), probe_(std::move(probe)) {}

ProgressMessage GenerationController::progress(TaskId task, std::size_t generated, std::size_t total,
                                               const char* status) const {
    ProgressMessage msg;
    msg.task = task;
    msg.generated = generated;
    msg.total = total;
    msg.status = status;
    if (probe_) msg.memory = probe_();
    return msg;
}

RunState GenerationController::run(TaskId task, std::shared_ptr<const GenerationRequest> request,
                                   const RunContext& context, const std::optional<ResumePoint>& resume) {
    auto emit = [&context](WorkerOutbound message) {
        if (context.emit) context.emit(std::move(message));
    };
    auto cancelled = [&context]() { return context.is_cancelled && context.is_cancelled(); };

    if (!request) {
        emit(ErrorMessage{task, "Missing generation request", ErrorCode::Validation, false, 0});
        set_state(RunState::Failed);
        return RunState::Failed;
    }

    const std::size_t total = request->count;
    if (total == 0) {
        emit(CompleteMessage{task, 0, 0});
        set_state(RunState::Completed);
        return RunState::Completed;
    }

    set_state(RunState::Validating);
    std::size_t generated = resume ? std::min(resume->generated, total) : 0;
    std::vector<Artifact> buffer;
    bool chunked = false;

    auto flush = [&]() {
        if (buffer.empty()) return;
        ArtifactBatchMessage batch;
        batch.task = task;
        batch.chunked = true;
        batch.artifacts = std::move(buffer);
        buffer.clear();
        emit(std::move(batch));
    };

    try {
        emit(progress(task, 0, total, "Validating"));

        Catalog catalog(request);
        catalog.validate();

        SolverOptions solver_options = config_.solver;
        if (request->seed) solver_options.seed = request->seed;
        ConstraintSolver solver(catalog, solver_options);

        if (config_.check_feasibility) {
            FeasibilityEstimator estimator(catalog, solver, config_.feasibility_budget);
            estimator.check(total);
        }

        UniquenessTracker tracker(catalog);
        if (resume) {
            for (const auto& delivered : resume->delivered) {
                if (!solver.is_valid(delivered)) {
                    throw ValidationError("Resume point does not match the catalog");
                }
                tracker.commit(delivered);
            }
            TRAITFORGE_INFO("Task %llu resuming after item %zu",
                            static_cast<unsigned long long>(task), generated);
        }
        auto decode_cache = make_decode_cache(config_.decode_cache_bytes);
        Compositor compositor(catalog, codec_, decode_cache.get(), config_.jpeg_quality);
        auto formatter = make_formatter(request->metadata_format, request->naming);

        chunked = total > config_.streaming_threshold;
        std::size_t chunk_size = initial_chunk_size(device_, total, config_.chunk_bounds);
        set_state(chunked ? RunState::Chunked : RunState::Streaming);
        TRAITFORGE_DEBUG("Task %llu: %zu items, %s, chunk %zu",
                         static_cast<unsigned long long>(task), total,
                         chunked ? "chunked" : "streaming", chunk_size);

        std::size_t solver_failures = 0;
        std::size_t render_failures = 0;

        while (generated < total) {
            if (cancelled()) {
                flush();
                emit(CancelledMessage{task, generated, total});
                set_state(RunState::Cancelled);
                return RunState::Cancelled;
            }

            const std::size_t index = generated + 1;

            auto assignment = solver.solve(&tracker);
            if (!assignment) {
                if (++solver_failures > config_.max_consecutive_failures) {
                    throw ExhaustionError(generated);
                }
                continue;
            }
            solver_failures = 0;

            Composition composition;
            try {
                composition = compositor.render(*assignment, context.yield);
            } catch (const TraitCodecError& e) {
                TRAITFORGE_WARN("Item %zu abandoned: %s", index, e.what());
                if (!e.transient()) {
                    emit(ItemFailedMessage{task, index, e.what(), e.code()});
                    solver.exclude_trait(e.trait_id());
                }
                if (++render_failures > config_.max_consecutive_failures) throw;
                continue;
            } catch (const CodecError& e) {
                TRAITFORGE_WARN("Item %zu abandoned: %s", index, e.what());
                if (!e.transient()) {
                    emit(ItemFailedMessage{task, index, e.what(), e.code()});
                }
                if (++render_failures > config_.max_consecutive_failures) throw;
                continue;
            }
            render_failures = 0;

            tracker.commit(*assignment);
            generated = index;

            Artifact artifact;
            artifact.index = index;
            artifact.format = composition.format;
            artifact.image_name = image_file_name(index, composition.format);
            artifact.metadata_name = metadata_file_name(index);
            artifact.image = std::move(composition.image);
            artifact.attributes = std::move(composition.attributes);
            artifact.assignment = std::move(*assignment);

            ArtifactDescriptor descriptor;
            descriptor.index = index;
            descriptor.name = artifact_name(request->naming.collection_name, index);
            descriptor.description = request->naming.description;
            descriptor.image_name = artifact.image_name;
            descriptor.format = artifact.format;
            descriptor.attributes = &artifact.attributes;
            artifact.metadata = formatter->format(descriptor);

            const bool last = generated == total;

            if (!chunked) {
                ArtifactBatchMessage single;
                single.task = task;
                single.chunked = false;
                single.artifacts.push_back(std::move(artifact));
                emit(std::move(single));

                if (generated % config_.preview_interval == 0 || last) {
                    PreviewMessage preview;
                    preview.task = task;
                    preview.indexes.push_back(index);
                    preview.previews.push_back(compositor.preview(config_.preview_size));
                    emit(std::move(preview));
                }
                if (generated % config_.streaming_progress_interval == 0 || last) {
                    emit(progress(task, generated, total, "Generating"));
                }
                continue;
            }

            buffer.push_back(std::move(artifact));
            if (buffer.size() >= chunk_size || last) {
                flush();
                emit(progress(task, generated, total, "Chunk delivered"));
                if (probe_) {
                    if (auto memory = probe_()) {
                        std::size_t next = adapt_chunk_size(chunk_size, memory->ratio());
                        if (next != chunk_size) {
                            TRAITFORGE_DEBUG("Chunk size %zu -> %zu at memory ratio %.2f",
                                             chunk_size, next, memory->ratio());
                        }
                        chunk_size = next;
                    }
                }
            } else if (generated % config_.chunked_progress_interval == 0) {
                emit(progress(task, generated, total, "Generating"));
            }
        }

        flush();
        emit(CompleteMessage{task, generated, total});
        set_state(RunState::Completed);
        return RunState::Completed;

    } catch (const GenerationError& e) {
        flush();
        if (e.code() == ErrorCode::Cancelled) {
            emit(CancelledMessage{task, generated, total});
            set_state(RunState::Cancelled);
            return RunState::Cancelled;
        }
        TRAITFORGE_WARN("Task %llu failed: %s", static_cast<unsigned long long>(task), e.what());
        emit(ErrorMessage{task, e.what(), e.code(), e.recoverable(), generated});
    } catch (const std::bad_alloc&) {
        flush();
        TRAITFORGE_WARN("Task %llu ran out of memory after %zu items",
                        static_cast<unsigned long long>(task), generated);
        emit(ErrorMessage{task, "Out of memory", ErrorCode::Internal, true, generated});
    } catch (const std::exception& e) {
        flush();
        TRAITFORGE_WARN("Task %llu failed: %s", static_cast<unsigned long long>(task), e.what());
        emit(ErrorMessage{task, e.what(), ErrorCode::Internal, false, generated});
    }

    set_state(RunState::Failed);
    return RunState::Failed;
}

} // namespace traitforge
