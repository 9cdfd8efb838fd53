#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Owns a set of transient frame images and removes them on destruction
 */
class ScopedFrameFiles
{
public:
    ScopedFrameFiles() = default;
    ~ScopedFrameFiles() { clear(); }

    ScopedFrameFiles(const ScopedFrameFiles &) = delete;
    ScopedFrameFiles &operator=(const ScopedFrameFiles &) = delete;
    ScopedFrameFiles(ScopedFrameFiles &&other) noexcept;
    ScopedFrameFiles &operator=(ScopedFrameFiles &&other) noexcept;

    void add(fs::path frame) { frames_.push_back(std::move(frame)); }
    const std::vector<fs::path> &paths() const { return frames_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    // Remove every owned file, tolerating files that are already gone
    void clear() noexcept;

private:
    std::vector<fs::path> frames_;
};

/**
 * @brief Opaque video capability: duration and frame sampling
 */
class VideoSampler
{
public:
    virtual ~VideoSampler() = default;

    /**
     * @brief Duration in seconds (frame count / fps); 0 when fps is not positive
     * or the container cannot be opened
     */
    virtual double duration(const fs::path &video) = 0;

    /**
     * @brief Write sampled frames as single-frame JPEG files
     * @param video Container to decode
     * @param interval Seconds between samples
     * @param max_frames Stop after this many samples; 0 means no limit
     * @return Owned frame files; empty when fps is not positive
     */
    virtual ScopedFrameFiles extractFrames(const fs::path &video, double interval, int max_frames) = 0;
};

/**
 * @brief VideoSampler backed by OpenCV videoio
 *
 * Frames are decoded sequentially and JPEG-encoded in parallel with TBB.
 */
class OpenCvVideoSampler : public VideoSampler
{
public:
    explicit OpenCvVideoSampler(fs::path frame_dir);

    double duration(const fs::path &video) override;
    ScopedFrameFiles extractFrames(const fs::path &video, double interval, int max_frames) override;

    // Frames between samples: fps * interval rounded to nearest, at least 1
    static long frameStep(double fps, double interval);

private:
    fs::path frame_dir_;
};
