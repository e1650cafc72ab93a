#pragma once
#include <cstdint>
#include <vector>

namespace motion_clip {

/// One flush of the capture muxer's output buffer.
using Chunk = std::vector<uint8_t>;

} // namespace motion_clip
