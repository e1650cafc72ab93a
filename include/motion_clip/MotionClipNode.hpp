#pragma once

#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <memory>
#include <string>
#include <vector>

#include "motion_clip/ArtifactSink.hpp"
#include "motion_clip/Pipeline.hpp"
#include "motion_clip/ThreadScheduler.hpp"
#include "motion_clip/VideoCaptureSource.hpp"

namespace motion_clip
{

/**
 * @brief Lifecycle node that wraps the motion clip pipeline.
 *
 * When configured, it reads parameters and builds the sources and sink.
 * When activated, it opens the sources and starts sampling.
 * When deactivated, it stops the pipeline and closes the sources.
 */
class MotionClipNode : public rclcpp_lifecycle::LifecycleNode
{
public:
    explicit MotionClipNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    ~MotionClipNode() override;

    using CallbackReturn =
        rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

protected:
    CallbackReturn on_configure(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_activate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override;

private:
    PipelineConfig read_config();
    /// "fake", a device index ("0") or a stream URL.
    std::shared_ptr<FrameSource> make_source(const std::string& location);
    void teardown();

    std::vector<std::shared_ptr<VideoCaptureSource>> captures_;
    std::shared_ptr<FileSink> sink_;
    std::unique_ptr<ThreadScheduler> scheduler_;
    std::unique_ptr<Pipeline> pipeline_;
};

}  // namespace motion_clip
