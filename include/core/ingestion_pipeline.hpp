#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/asset_store.hpp"
#include "core/image_transcoder.hpp"
#include "core/media_classifier.hpp"
#include "core/remote_fetcher.hpp"
#include "core/server_config_manager.hpp"

namespace fs = std::filesystem;

/**
 * @brief Upload payload: multipart file bytes or a remote URL
 */
struct UploadSource
{
    std::optional<std::string> content;
    std::string filename; // declared by the client, may be empty
    std::optional<std::string> url;

    static UploadSource fromFile(std::string content, std::string filename);
    static UploadSource fromUrl(std::string url);
};

struct StoredUpload
{
    std::string filename; // "<id>.<ext>", relative to the images root
    MediaKind kind = MediaKind::UNKNOWN;
};

/**
 * @brief Validates, moderates and stores uploads
 *
 * Every rejection is thrown as a MediaError subclass carrying a reason code.
 * The transient upload file never outlives ingest().
 */
class IngestionPipeline
{
public:
    static constexpr const char *TEMP_PREFIX = "mediapush-upload-";

    IngestionPipeline(const ServerConfig &config, AssetStore &store, MediaClassifier &classifier,
                      std::shared_ptr<ImageTranscoder> transcoder, std::shared_ptr<RemoteFetcher> fetcher);

    /**
     * @brief Run one upload through detection, policy, moderation and storage
     * @throws ValidationError, PolicyRejection, PayloadTooLargeError, InternalFailure
     */
    StoredUpload ingest(const UploadSource &source);

private:
    std::string storeVideo(const fs::path &upload, const DetectedFormat &format, const std::string &id);
    std::string storeImage(const fs::path &upload, const DetectedFormat &format, const std::string &id);
    bool videoFormatAllowed(const std::string &extension) const;

    const ServerConfig &config_;
    AssetStore &store_;
    MediaClassifier &classifier_;
    std::shared_ptr<ImageTranscoder> transcoder_;
    std::shared_ptr<RemoteFetcher> fetcher_;
    fs::path tmp_dir_;
};
