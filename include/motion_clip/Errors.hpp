#pragma once
#include <stdexcept>
#include <string>

namespace motion_clip {

enum class ErrorCode {
    SourceUnavailable,   // no current frame, skip this cycle
    AlreadyRecording,    // start() while a session is live
    DecodeFailure,       // intermediate clip unreadable or empty
    EncodeFailure,       // artifact encoder failed
    Cancelled            // pipeline stopped before delivery
};

const char* to_string(ErrorCode code);

/**
 * @brief Failure scoped to one detection/recording/encode attempt.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace motion_clip
