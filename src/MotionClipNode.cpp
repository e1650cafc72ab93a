#include "motion_clip/MotionClipNode.hpp"

#include <cctype>
#include <algorithm>
#include <stdexcept>
#include "motion_clip/SyntheticSource.hpp"

namespace motion_clip
{

MotionClipNode::MotionClipNode(const rclcpp::NodeOptions& options)
    : rclcpp_lifecycle::LifecycleNode("motion_clip", options)
{
    const PipelineConfig defaults;

    declare_parameter<int>("sample_interval_ms", defaults.detector.sample_interval_ms);
    declare_parameter<int64_t>("diff_threshold", static_cast<int64_t>(defaults.detector.diff_threshold));
    declare_parameter<int>("width", defaults.detector.width);
    declare_parameter<int>("height", defaults.detector.height);

    declare_parameter<int>("duration_ms", defaults.recorder.duration_ms);
    declare_parameter<int>("capture_fps", defaults.recorder.capture_fps);
    declare_parameter<std::string>("container", defaults.recorder.container);
    declare_parameter<std::string>("codec", defaults.recorder.codec);
    declare_parameter<int64_t>("bit_rate", defaults.recorder.bit_rate);

    declare_parameter<int>("frame_delay_ms", defaults.encoder.frame_delay_ms);
    declare_parameter<int>("capture_duration_ms", defaults.encoder.capture_duration_ms);
    declare_parameter<int>("workers", defaults.encoder.workers);

    // Sources: "fake", a camera index, or a stream URL. Empty remote = none.
    declare_parameter<std::string>("local_source", "fake");
    declare_parameter<std::string>("remote_source", "");
    declare_parameter<std::string>("output_dir", "clips");
}

MotionClipNode::~MotionClipNode()
{
    teardown();
}

PipelineConfig MotionClipNode::read_config()
{
    PipelineConfig cfg;
    cfg.detector.sample_interval_ms = get_parameter("sample_interval_ms").as_int();
    const int64_t threshold = get_parameter("diff_threshold").as_int();
    if (threshold <= 0) throw std::invalid_argument("diff_threshold must be positive");
    cfg.detector.diff_threshold = static_cast<uint64_t>(threshold);
    cfg.detector.width = get_parameter("width").as_int();
    cfg.detector.height = get_parameter("height").as_int();

    cfg.recorder.duration_ms = get_parameter("duration_ms").as_int();
    cfg.recorder.capture_fps = get_parameter("capture_fps").as_int();
    cfg.recorder.container = get_parameter("container").as_string();
    cfg.recorder.codec = get_parameter("codec").as_string();
    cfg.recorder.bit_rate = get_parameter("bit_rate").as_int();

    cfg.encoder.frame_delay_ms = get_parameter("frame_delay_ms").as_int();
    cfg.encoder.capture_duration_ms = get_parameter("capture_duration_ms").as_int();
    cfg.encoder.workers = get_parameter("workers").as_int();
    return cfg;
}

std::shared_ptr<FrameSource> MotionClipNode::make_source(const std::string& location)
{
    if (location == "fake") return std::make_shared<SyntheticSource>();

    const bool is_index = !location.empty()
        && std::all_of(location.begin(), location.end(), [](unsigned char c) { return std::isdigit(c); });
    auto cap = std::make_shared<VideoCaptureSource>(
        is_index ? VideoCaptureSource::camera(std::stoi(location)) : VideoCaptureSource::stream(location));
    captures_.push_back(cap);
    return cap;
}

rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn
MotionClipNode::on_configure(const rclcpp_lifecycle::State &)
{
    teardown();

    const std::string local = get_parameter("local_source").as_string();
    const std::string remote = get_parameter("remote_source").as_string();
    const std::string output_dir = get_parameter("output_dir").as_string();

    try {
        const PipelineConfig cfg = read_config();
        validate(cfg.detector);
        validate(cfg.recorder);
        validate(cfg.encoder);

        scheduler_ = std::make_unique<ThreadScheduler>();
        sink_ = std::make_shared<FileSink>(output_dir);
        pipeline_ = std::make_unique<Pipeline>(*scheduler_, cfg, sink_);

        pipeline_->add_source(make_source(local), true);
        if (!remote.empty()) pipeline_->add_source(make_source(remote), false);

        pipeline_->on_failure([this](const PipelineError& e) {
            RCLCPP_WARN(get_logger(), "Attempt failed: %s", e.what());
        });

        RCLCPP_INFO(get_logger(), "Configured local=%s remote=%s, clips go to %s",
                    local.c_str(), remote.empty() ? "(none)" : remote.c_str(), output_dir.c_str());
        return CallbackReturn::SUCCESS;
    } catch (const std::exception& e) {
        RCLCPP_ERROR(get_logger(), "Configure failed: %s", e.what());
        teardown();
        return CallbackReturn::FAILURE;
    }
}

rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn
MotionClipNode::on_activate(const rclcpp_lifecycle::State &)
{
    if (!pipeline_) {
        RCLCPP_ERROR(get_logger(), "Pipeline not configured.");
        return CallbackReturn::FAILURE;
    }

    try {
        for (auto& cap : captures_) cap->open();
    } catch (const std::exception& e) {
        RCLCPP_ERROR(get_logger(), "Source open failed: %s", e.what());
        for (auto& cap : captures_) cap->close();
        return CallbackReturn::FAILURE;
    }

    scheduler_->start();
    pipeline_->start();

    RCLCPP_INFO(get_logger(), "Sampling %zu source(s)", pipeline_->source_count());
    return CallbackReturn::SUCCESS;
}

rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn
MotionClipNode::on_deactivate(const rclcpp_lifecycle::State &)
{
    if (pipeline_) pipeline_->stop();
    if (scheduler_) scheduler_->stop();
    for (auto& cap : captures_) cap->close();

    RCLCPP_INFO(get_logger(), "Pipeline deactivated, %lu clip(s) saved.",
                static_cast<unsigned long>(sink_ ? sink_->written() : 0));
    return CallbackReturn::SUCCESS;
}

rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn
MotionClipNode::on_cleanup(const rclcpp_lifecycle::State &)
{
    teardown();
    return CallbackReturn::SUCCESS;
}

void MotionClipNode::teardown()
{
    if (pipeline_) pipeline_->stop();
    if (scheduler_) scheduler_->stop();
    for (auto& cap : captures_) cap->close();

    pipeline_.reset();
    scheduler_.reset();
    captures_.clear();
    sink_.reset();
}

}  // namespace motion_clip
