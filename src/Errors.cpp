#include "motion_clip/Errors.hpp"

namespace motion_clip {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::SourceUnavailable: return "SourceUnavailable";
    case ErrorCode::AlreadyRecording:  return "AlreadyRecording";
    case ErrorCode::DecodeFailure:     return "DecodeFailure";
    case ErrorCode::EncodeFailure:     return "EncodeFailure";
    case ErrorCode::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

} // namespace motion_clip
