#include "core/video_sampler.hpp"
#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace
{
    // Decoded frames kept in memory before a parallel encode pass
    constexpr size_t ENCODE_BATCH = 16;

    void encodeBatch(const std::vector<cv::Mat> &frames, const fs::path &frame_dir, const std::string &prefix,
                     size_t first_index, ScopedFrameFiles &out)
    {
        std::vector<fs::path> paths(frames.size());
        for (size_t i = 0; i < frames.size(); ++i)
            paths[i] = frame_dir / (prefix + std::to_string(first_index + i) + ".jpg");

        std::atomic<bool> failed{false};
        tbb::parallel_for(tbb::blocked_range<size_t>(0, frames.size()),
                          [&](const tbb::blocked_range<size_t> &range)
                          {
                              for (size_t i = range.begin(); i != range.end(); ++i)
                              {
                                  try
                                  {
                                      if (!cv::imwrite(paths[i].string(), frames[i]))
                                          failed.store(true);
                                  }
                                  catch (const cv::Exception &)
                                  {
                                      failed.store(true);
                                  }
                              }
                          });

        // Take ownership first so partial output is cleaned up with the rest
        for (auto &path : paths)
        {
            std::error_code ec;
            if (fs::exists(path, ec))
                out.add(std::move(path));
        }
        if (failed.load())
            throw InternalFailure("Failed to write sampled video frame to " + frame_dir.string());
    }
}

ScopedFrameFiles::ScopedFrameFiles(ScopedFrameFiles &&other) noexcept : frames_(std::move(other.frames_))
{
    other.frames_.clear();
}

ScopedFrameFiles &ScopedFrameFiles::operator=(ScopedFrameFiles &&other) noexcept
{
    if (this != &other)
    {
        clear();
        frames_ = std::move(other.frames_);
        other.frames_.clear();
    }
    return *this;
}

void ScopedFrameFiles::clear() noexcept
{
    for (const auto &frame : frames_)
        FileUtils::removeQuietly(frame);
    frames_.clear();
}

OpenCvVideoSampler::OpenCvVideoSampler(fs::path frame_dir) : frame_dir_(std::move(frame_dir))
{
}

double OpenCvVideoSampler::duration(const fs::path &video)
{
    cv::VideoCapture capture;
    try
    {
        if (!capture.open(video.string()))
            return 0.0;
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not open video " + video.filename().string() + ": " + e.what());
        return 0.0;
    }

    double fps = capture.get(cv::CAP_PROP_FPS);
    double frame_count = capture.get(cv::CAP_PROP_FRAME_COUNT);
    capture.release();

    if (fps <= 0)
    {
        Logger::warn("Video " + video.filename().string() + " reports no frame rate, duration unknown");
        return 0.0;
    }
    return frame_count / fps;
}

long OpenCvVideoSampler::frameStep(double fps, double interval)
{
    return std::max(1L, std::lround(fps * interval));
}

ScopedFrameFiles OpenCvVideoSampler::extractFrames(const fs::path &video, double interval, int max_frames)
{
    ScopedFrameFiles frames;

    cv::VideoCapture capture;
    try
    {
        if (!capture.open(video.string()))
            return frames;
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not open video " + video.filename().string() + ": " + e.what());
        return frames;
    }

    double fps = capture.get(cv::CAP_PROP_FPS);
    if (fps <= 0)
    {
        Logger::warn("Video " + video.filename().string() + " reports no frame rate, no frames sampled");
        return frames;
    }

    const long frame_interval = frameStep(fps, interval);
    const size_t limit = max_frames > 0 ? static_cast<size_t>(max_frames) : 0;
    const std::string prefix = "frame-" + FileUtils::generateRandomString(8) + "-";

    std::vector<cv::Mat> pending;
    size_t sampled = 0;
    long frame_index = 0;
    cv::Mat frame;
    while (limit == 0 || sampled < limit)
    {
        if (!capture.read(frame) || frame.empty())
            break;

        if (frame_index % frame_interval == 0)
        {
            pending.push_back(frame.clone());
            ++sampled;
            if (pending.size() == ENCODE_BATCH)
            {
                encodeBatch(pending, frame_dir_, prefix, frames.size(), frames);
                pending.clear();
            }
        }
        ++frame_index;
    }
    capture.release();

    if (!pending.empty())
        encodeBatch(pending, frame_dir_, prefix, frames.size(), frames);

    Logger::debug("Sampled " + std::to_string(frames.size()) + " frames from " + video.filename().string() +
                  " every " + std::to_string(frame_interval) + " frames");
    return frames;
}
