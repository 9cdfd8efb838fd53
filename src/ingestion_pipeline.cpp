#include "core/ingestion_pipeline.hpp"
#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <sstream>

namespace
{
    std::string formatSeconds(double seconds)
    {
        std::ostringstream out;
        out << seconds;
        return out.str();
    }

    // Last path segment of a URL, without query or fragment
    std::string urlFilename(const std::string &url)
    {
        std::string path = url.substr(0, url.find_first_of("?#"));
        auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }
}

UploadSource UploadSource::fromFile(std::string content, std::string filename)
{
    UploadSource source;
    source.content = std::move(content);
    source.filename = std::move(filename);
    return source;
}

UploadSource UploadSource::fromUrl(std::string url)
{
    UploadSource source;
    source.url = std::move(url);
    return source;
}

IngestionPipeline::IngestionPipeline(const ServerConfig &config, AssetStore &store, MediaClassifier &classifier,
                                     std::shared_ptr<ImageTranscoder> transcoder,
                                     std::shared_ptr<RemoteFetcher> fetcher)
    : config_(config), store_(store), classifier_(classifier), transcoder_(std::move(transcoder)),
      fetcher_(std::move(fetcher)), tmp_dir_(config.tmp_dir)
{
    if (!FileUtils::ensureDirectory(tmp_dir_))
        throw InternalFailure("Cannot create temp directory: " + tmp_dir_.string());
}

StoredUpload IngestionPipeline::ingest(const UploadSource &source)
{
    const bool has_file = source.content.has_value();
    const bool has_url = source.url.has_value() && !source.url->empty();
    if (has_file == has_url)
        throw ValidationError("File is missing!", "FILE_MISSING");

    const size_t max_bytes = static_cast<size_t>(config_.max_size_mb) * 1024 * 1024;
    if (has_file && source.content->size() > max_bytes)
        throw PayloadTooLargeError("File is too large");

    FileUtils::clearStaleFiles(tmp_dir_, TEMP_PREFIX, std::chrono::seconds(config_.max_tmp_file_age_seconds));

    const std::string id = store_.generateId();
    ScopedTempFile upload(tmp_dir_ / (std::string(TEMP_PREFIX) + id));

    std::string declared_name;
    if (has_file)
    {
        FileUtils::writeFileAtomic(upload.path(), *source.content);
        declared_name = source.filename;
    }
    else
    {
        fetcher_->fetch(*source.url, upload.path(), max_bytes);
        declared_name = urlFilename(*source.url);
    }

    DetectedFormat format = MediaClassifier::detect(upload.path(), declared_name);
    Logger::debug("Upload " + id + " detected as " + toString(format.kind) +
                  (format.extension.empty() ? "" : " (" + format.extension + ")"));

    StoredUpload stored;
    stored.kind = format.kind;
    switch (format.kind)
    {
    case MediaKind::VIDEO:
        stored.filename = storeVideo(upload.path(), format, id);
        upload.release();
        break;
    case MediaKind::VECTOR:
        stored.filename = id + ".svg";
        store_.putFile(upload.path(), stored.filename);
        upload.release();
        break;
    case MediaKind::IMAGE:
    case MediaKind::UNKNOWN:
        stored.filename = storeImage(upload.path(), format, id);
        break;
    }

    Logger::info("Stored upload " + stored.filename + " (" + toString(stored.kind) + ")");
    return stored;
}

std::string IngestionPipeline::storeVideo(const fs::path &upload, const DetectedFormat &format, const std::string &id)
{
    if (!config_.allow_video)
        throw PolicyRejection("Video uploads are not allowed", "VIDEO_NOT_ALLOWED");
    if (!videoFormatAllowed(format.extension))
        throw PolicyRejection("Video format not allowed: " + format.extension, "VIDEO_FORMAT_NOT_ALLOWED");

    // Duration is checked before moderation so long clips are never decoded frame by frame
    if (classifier_.exceedsMaxDuration(upload))
        throw PolicyRejection("Video exceeds maximum duration of " + formatSeconds(config_.max_video_duration) +
                                  " seconds",
                              "VIDEO_TOO_LONG");
    if (classifier_.moderateVideo(upload))
        throw PolicyRejection("Nudity not allowed", "NUDITY_DETECTED");

    const std::string filename = id + "." + format.extension;
    store_.putFile(upload, filename);
    return filename;
}

std::string IngestionPipeline::storeImage(const fs::path &upload, const DetectedFormat &format, const std::string &id)
{
    std::string output_type = config_.output_type.value_or(format.extension);
    if (!output_type.empty() && output_type.front() == '.')
        output_type.erase(0, 1);
    if (output_type.empty())
        throw ValidationError("Unsupported file type", "UNSUPPORTED_FILE_TYPE");

    if (classifier_.moderateImage(upload))
        throw PolicyRejection("Nudity not allowed", "NUDITY_DETECTED");

    const std::string filename = id + "." + output_type;
    store_.put(transcoder_->transcode(upload, output_type), filename);
    return filename;
}

bool IngestionPipeline::videoFormatAllowed(const std::string &extension) const
{
    const auto &allowed = config_.allowed_video_formats;
    return std::find(allowed.begin(), allowed.end(), extension) != allowed.end();
}
