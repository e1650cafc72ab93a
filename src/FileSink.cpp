#include "motion_clip/ArtifactSink.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include "rclcpp/rclcpp.hpp"

namespace motion_clip {

namespace fs = std::filesystem;

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("FileSink"); }

std::string timestamp()
{
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return os.str();
}
}

FileSink::FileSink(std::string dir) : dir_(std::move(dir))
{
    if (dir_.empty()) dir_ = ".";
}

void FileSink::on_artifact_ready(const ClipArtifact& artifact)
{
    std::lock_guard<std::mutex> lk(mtx_);

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        RCLCPP_ERROR(logger(), "Cannot create %s: %s", dir_.c_str(), ec.message().c_str());
        return;
    }

    const fs::path path = fs::path(dir_) / ("clip_" + timestamp() + "_" + std::to_string(++counter_) + ".gif");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        RCLCPP_ERROR(logger(), "Cannot open %s", path.c_str());
        return;
    }
    out.write(reinterpret_cast<const char*>(artifact.bytes.data()),
              static_cast<std::streamsize>(artifact.bytes.size()));
    out.close();
    if (!out) {
        RCLCPP_ERROR(logger(), "Short write to %s", path.c_str());
        return;
    }

    last_path_ = path.string();
    ++written_;
    RCLCPP_INFO(logger(), "Saved %s (%d frames, %zu bytes)", last_path_.c_str(),
                artifact.frame_count, artifact.bytes.size());
}

std::string FileSink::last_path() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return last_path_;
}

uint64_t FileSink::written() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return written_;
}

} // namespace motion_clip
