#pragma once
#include <optional>
#include <string>
#include "motion_clip/Frame.hpp"

namespace motion_clip {

/**
 * @brief Anything that can hand out its current frame on demand.
 *
 * The core only pulls. std::nullopt means the source has nothing decodable
 * right now (not attached yet, stream stalled); callers skip the cycle.
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual std::optional<Frame> current_frame() = 0;
  virtual std::string name() const = 0;
};

} // namespace motion_clip
