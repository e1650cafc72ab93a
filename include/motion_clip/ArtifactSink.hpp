#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "motion_clip/ClipEncoder.hpp"

namespace motion_clip {

/// Receives every finished artifact, in completion order.
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;
    virtual void on_artifact_ready(const ClipArtifact& artifact) = 0;
};

/**
 * @brief Writes artifacts to <dir>/clip_<YYYYmmdd_HHMMSS>_<n>.gif.
 *
 * Write errors are logged; they never propagate into the pipeline.
 */
class FileSink : public ArtifactSink {
public:
    explicit FileSink(std::string dir);

    void on_artifact_ready(const ClipArtifact& artifact) override;

    std::string last_path() const;
    uint64_t written() const;

private:
    std::string dir_;
    mutable std::mutex mtx_;
    std::string last_path_;
    uint64_t written_ = 0;
    uint64_t counter_ = 0;
};

} // namespace motion_clip
