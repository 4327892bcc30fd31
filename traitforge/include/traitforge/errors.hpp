#ifndef TRAITFORGE_ERRORS_HPP
#define TRAITFORGE_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace traitforge {

enum class ErrorCode {
    None = 0,
    Validation,          // Malformed catalog or request
    Feasibility,         // Requested count exceeds the unique-combination ceiling
    Exhaustion,          // Solver kept failing mid-run
    Codec,               // Decode or encode failure
    Cancelled,
    TaskTimeout,
    WorkerUnavailable,   // No workers left in the pool
    Internal
};

const char* error_code_name(ErrorCode code);

class GenerationError : public std::runtime_error {
public:
    GenerationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    // Whether retrying the same request could succeed
    bool recoverable() const {
        return code_ == ErrorCode::TaskTimeout || code_ == ErrorCode::WorkerUnavailable;
    }

private:
    ErrorCode code_;
};

class ValidationError : public GenerationError {
public:
    explicit ValidationError(const std::string& message)
        : GenerationError(ErrorCode::Validation, message) {}
};

class FeasibilityError : public GenerationError {
public:
    FeasibilityError(const std::string& message, std::size_t ceiling)
        : GenerationError(ErrorCode::Feasibility, message), ceiling_(ceiling) {}

    std::size_t ceiling() const { return ceiling_; }

private:
    std::size_t ceiling_;
};

class ExhaustionError : public GenerationError {
public:
    explicit ExhaustionError(std::size_t generated);

    std::size_t generated() const { return generated_; }

private:
    std::size_t generated_;
};

/**
 * Raised by image codecs. Transient failures (e.g. allocation pressure) may
 * succeed on a later item; non-transient ones mean the payload itself is bad.
 */
class CodecError : public GenerationError {
public:
    CodecError(const std::string& message, bool transient)
        : GenerationError(ErrorCode::Codec, message), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// CodecError attributed to the trait whose payload failed
class TraitCodecError : public CodecError {
public:
    TraitCodecError(const std::string& message, bool transient, std::uint32_t trait_id)
        : CodecError(message, transient), trait_id_(trait_id) {}

    std::uint32_t trait_id() const { return trait_id_; }

private:
    std::uint32_t trait_id_;
};

} // namespace traitforge

#endif // TRAITFORGE_ERRORS_HPP
