#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/nudity_model.hpp"
#include "core/server_config_manager.hpp"
#include "core/video_sampler.hpp"

namespace fs = std::filesystem;

enum class MediaKind
{
    IMAGE,
    VIDEO,
    VECTOR,
    UNKNOWN
};

std::string toString(MediaKind kind);

struct DetectedFormat
{
    MediaKind kind = MediaKind::UNKNOWN;
    std::string extension; // without dot, empty when unknown
};

/**
 * @brief Format detection and content moderation for uploads
 *
 * Moderation is active only when a threshold is configured and a model is
 * available; otherwise every asset passes without touching the model.
 */
class MediaClassifier
{
public:
    MediaClassifier(const ServerConfig &config, std::shared_ptr<NudityModel> model,
                    std::shared_ptr<VideoSampler> sampler);

    /**
     * @brief Detect what an uploaded file is
     * @param path File content to sniff
     * @param declared_filename Client supplied name; ".svg" selects VECTOR
     *        regardless of content
     */
    static DetectedFormat detect(const fs::path &path, const std::string &declared_filename);

    // Magic-byte sniffing of the first bytes of a file
    static DetectedFormat sniff(const std::string &header);

    // Kind of a stored asset from its extension (with or without dot)
    static MediaKind kindFromExtension(const std::string &extension);

    bool moderationEnabled() const;

    /**
     * @brief Classify a still image
     * @return true if the unsafe score reaches the threshold
     */
    bool moderateImage(const fs::path &image);

    /**
     * @brief Sample frames of a video and classify them in one batch
     * @return true if any sampled frame reaches the threshold
     *
     * Sampled frame files are removed before returning, also when the model
     * throws.
     */
    bool moderateVideo(const fs::path &video);

    double videoDuration(const fs::path &video);
    bool exceedsMaxDuration(const fs::path &video);

private:
    std::optional<double> threshold_;
    double video_interval_;
    int max_frames_;
    double max_video_duration_;
    std::shared_ptr<NudityModel> model_;
    std::shared_ptr<VideoSampler> sampler_;
};
