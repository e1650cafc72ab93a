#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "motion_clip/Chunk.hpp"

namespace motion_clip {

/**
 * @brief Ordered chunks of one recording, append-only until sealed.
 */
class RecordingSession {
public:
    RecordingSession(uint64_t id, uint64_t start_ms, int duration_ms)
        : id_(id), start_ms_(start_ms), duration_ms_(duration_ms) {}

    /// Returns false once the session is sealed.
    bool append(Chunk&& chunk);
    void seal(int64_t frame_count);

    bool sealed() const { return sealed_; }
    uint64_t id() const { return id_; }
    uint64_t start_ms() const { return start_ms_; }
    int duration_ms() const { return duration_ms_; }
    int64_t frame_count() const { return frame_count_; }

    const std::vector<Chunk>& chunks() const { return chunks_; }
    size_t byte_size() const { return bytes_; }

    /// The chunks joined in arrival order: one playable container.
    std::vector<uint8_t> concatenate() const;

private:
    uint64_t id_;
    uint64_t start_ms_;
    int duration_ms_;
    bool sealed_ = false;
    int64_t frame_count_ = 0;
    size_t bytes_ = 0;
    std::vector<Chunk> chunks_;
};

} // namespace motion_clip
