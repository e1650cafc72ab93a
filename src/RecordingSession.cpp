#include "motion_clip/RecordingSession.hpp"

namespace motion_clip {

bool RecordingSession::append(Chunk&& chunk)
{
    if (sealed_) return false;
    bytes_ += chunk.size();
    chunks_.push_back(std::move(chunk));
    return true;
}

void RecordingSession::seal(int64_t frame_count)
{
    frame_count_ = frame_count;
    sealed_ = true;
}

std::vector<uint8_t> RecordingSession::concatenate() const
{
    std::vector<uint8_t> out;
    out.reserve(bytes_);
    for (const auto& c : chunks_) out.insert(out.end(), c.begin(), c.end());
    return out;
}

} // namespace motion_clip
