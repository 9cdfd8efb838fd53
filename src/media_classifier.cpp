#include "core/media_classifier.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace
{
    constexpr size_t SNIFF_BYTES = 64;

    bool startsWith(const std::string &data, const std::string &magic, size_t offset = 0)
    {
        return data.size() >= offset + magic.size() && data.compare(offset, magic.size(), magic) == 0;
    }

    DetectedFormat image(const std::string &extension) { return {MediaKind::IMAGE, extension}; }
    DetectedFormat video(const std::string &extension) { return {MediaKind::VIDEO, extension}; }
}

std::string toString(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::IMAGE:
        return "image";
    case MediaKind::VIDEO:
        return "video";
    case MediaKind::VECTOR:
        return "vector";
    default:
        return "unknown";
    }
}

MediaClassifier::MediaClassifier(const ServerConfig &config, std::shared_ptr<NudityModel> model,
                                 std::shared_ptr<VideoSampler> sampler)
    : threshold_(config.nude_filter_max_threshold),
      video_interval_(config.nude_filter_video_interval),
      max_frames_(config.nude_filter_max_frames),
      max_video_duration_(config.max_video_duration),
      model_(std::move(model)),
      sampler_(std::move(sampler))
{
    if (threshold_ && !model_)
        Logger::warn("Nudity threshold configured but no model available, moderation disabled");
}

DetectedFormat MediaClassifier::detect(const fs::path &path, const std::string &declared_filename)
{
    if (FileUtils::getFileExtension(declared_filename) == "svg")
        return {MediaKind::VECTOR, "svg"};

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return {};
    std::string header(SNIFF_BYTES, '\0');
    in.read(&header[0], static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(in.gcount()));
    return sniff(header);
}

DetectedFormat MediaClassifier::sniff(const std::string &header)
{
    static const std::string PNG_MAGIC("\x89PNG\r\n\x1a\n", 8);
    static const std::string JPEG_MAGIC("\xFF\xD8\xFF", 3);
    static const std::string EBML_MAGIC("\x1A\x45\xDF\xA3", 4);
    static const std::string TIFF_LE("II*\0", 4);
    static const std::string TIFF_BE("MM\0*", 4);

    if (startsWith(header, JPEG_MAGIC))
        return image("jpg");
    if (startsWith(header, PNG_MAGIC))
        return image("png");
    if (startsWith(header, "GIF87a") || startsWith(header, "GIF89a"))
        return image("gif");
    if (startsWith(header, "RIFF") && startsWith(header, "WEBP", 8))
        return image("webp");
    if (startsWith(header, "RIFF") && startsWith(header, "AVI ", 8))
        return video("avi");
    if (startsWith(header, "BM"))
        return image("bmp");
    if (startsWith(header, TIFF_LE) || startsWith(header, TIFF_BE))
        return image("tif");

    // ISO base media: size(4) "ftyp" brand(4)
    if (startsWith(header, "ftyp", 4) && header.size() >= 12)
    {
        const std::string brand = header.substr(8, 4);
        if (brand == "qt  ")
            return video("mov");
        static const std::array<const char *, 7> STILL_BRANDS = {"heic", "heix", "hevc", "mif1", "msf1", "avif", "M4A "};
        if (std::find(STILL_BRANDS.begin(), STILL_BRANDS.end(), brand) != STILL_BRANDS.end())
            return {};
        return video("mp4");
    }

    if (startsWith(header, EBML_MAGIC))
        return video(header.find("webm") != std::string::npos ? "webm" : "mkv");

    return {};
}

MediaKind MediaClassifier::kindFromExtension(const std::string &extension)
{
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    if (ext == "svg")
        return MediaKind::VECTOR;
    if (ext == "mp4" || ext == "mov" || ext == "webm" || ext == "mkv" || ext == "avi")
        return MediaKind::VIDEO;
    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "webp" || ext == "bmp" ||
        ext == "tif" || ext == "tiff")
        return MediaKind::IMAGE;
    return MediaKind::UNKNOWN;
}

bool MediaClassifier::moderationEnabled() const
{
    return threshold_.has_value() && model_ != nullptr;
}

bool MediaClassifier::moderateImage(const fs::path &image)
{
    if (!moderationEnabled())
        return false;

    auto scores = model_->classify({image});
    auto it = scores.find(image.string());
    double unsafe = it != scores.end() ? it->second : 0.0;
    if (unsafe >= *threshold_)
    {
        Logger::info("Image rejected by nudity filter (score " + std::to_string(unsafe) + ")");
        return true;
    }
    return false;
}

bool MediaClassifier::moderateVideo(const fs::path &video)
{
    if (!moderationEnabled())
        return false;

    // Spread samples over the whole clip when the frame budget is limited
    double interval = video_interval_;
    if (max_frames_ > 0)
    {
        double duration = sampler_->duration(video);
        if (duration > 0)
            interval = std::max(interval, duration / max_frames_);
    }

    ScopedFrameFiles frames = sampler_->extractFrames(video, interval, max_frames_);
    if (frames.empty())
    {
        Logger::warn("No frames sampled from " + video.filename().string() + ", video passes moderation");
        return false;
    }

    auto scores = model_->classify(frames.paths());
    for (const auto &frame : frames.paths())
    {
        auto it = scores.find(frame.string());
        double unsafe = it != scores.end() ? it->second : 0.0;
        if (unsafe >= *threshold_)
        {
            Logger::info("Video rejected by nudity filter (frame score " + std::to_string(unsafe) + ")");
            return true;
        }
    }
    return false;
}

double MediaClassifier::videoDuration(const fs::path &video)
{
    return sampler_->duration(video);
}

bool MediaClassifier::exceedsMaxDuration(const fs::path &video)
{
    return videoDuration(video) > max_video_duration_;
}
