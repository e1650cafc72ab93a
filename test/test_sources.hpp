#pragma once
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "motion_clip/ArtifactSink.hpp"
#include "motion_clip/FrameSource.hpp"

namespace motion_clip::test {

inline cv::Mat solid(int w, int h, uint8_t b, uint8_t g, uint8_t r)
{
    return cv::Mat(h, w, CV_8UC4, cv::Scalar(b, g, r, 255));
}

inline cv::Mat gray(int w, int h, int v)
{
    const auto c = static_cast<uint8_t>(std::clamp(v, 0, 255));
    return solid(w, h, c, c, c);
}

/// Frame n is whatever the script returns for call n; nullopt = unavailable.
class ScriptedSource : public FrameSource {
public:
    using Script = std::function<std::optional<cv::Mat>(int call)>;

    explicit ScriptedSource(Script script, std::string name = "scripted")
        : script_(std::move(script)), name_(std::move(name)) {}

    std::optional<Frame> current_frame() override
    {
        const int n = calls_++;
        auto m = script_(n);
        if (!m) return std::nullopt;
        Frame f;
        f.pixels = *m;
        f.timestamp_ns = static_cast<uint64_t>(n);
        return f;
    }
    std::string name() const override { return name_; }

    int calls() const { return calls_; }

private:
    Script script_;
    std::string name_;
    std::atomic<int> calls_{0};
};

/// Gray level rises by `step` on every call.
inline std::shared_ptr<ScriptedSource> ramp_source(int w, int h, int base = 0, int step = 3)
{
    return std::make_shared<ScriptedSource>(
        [=](int n) -> std::optional<cv::Mat> { return gray(w, h, base + n * step); }, "ramp");
}

class CollectingSink : public ArtifactSink {
public:
    void on_artifact_ready(const ClipArtifact& a) override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        artifacts_.push_back(a);
    }
    std::vector<ClipArtifact> artifacts() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return artifacts_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<ClipArtifact> artifacts_;
};

inline double mean_luma(const cv::Mat& bgra)
{
    const cv::Scalar s = cv::mean(bgra);
    return (s[0] + s[1] + s[2]) / 3.0;
}

} // namespace motion_clip::test
