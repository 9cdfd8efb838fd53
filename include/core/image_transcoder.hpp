#pragma once

#include <filesystem>
#include <string>
#include <opencv2/core.hpp>
#include "core/key_codec.hpp"

namespace fs = std::filesystem;

/**
 * @brief Opaque image capability: resize, strip and encode
 *
 * Results are encoded bytes containing pixel data only; EXIF, ICC and other
 * ancillary chunks of the source are not carried over.
 */
class ImageTranscoder
{
public:
    virtual ~ImageTranscoder() = default;

    /**
     * @brief Produce a resized rendition in the source's own format
     * @param source Original image
     * @param size Target size; a missing side follows the source aspect ratio
     * @return Encoded bytes
     * @throws InternalFailure if the source cannot be decoded or encoded
     */
    virtual std::string resize(const fs::path &source, const DerivativeSize &size) = 0;

    /**
     * @brief Re-encode an uploaded image into output_type
     * @param source Uploaded file
     * @param output_type Extension without dot ("png", "jpg", ...)
     * @throws ValidationError if the upload is not a decodable image or the
     *         output type cannot be encoded
     */
    virtual std::string transcode(const fs::path &source, const std::string &output_type) = 0;
};

/**
 * @brief ImageTranscoder backed by OpenCV imgcodecs/imgproc
 */
class OpenCvImageTranscoder : public ImageTranscoder
{
public:
    std::string resize(const fs::path &source, const DerivativeSize &size) override;
    std::string transcode(const fs::path &source, const std::string &output_type) override;

    /**
     * @brief Center-crop to the target aspect ratio, then scale
     *
     * Exposed for testing.
     */
    static cv::Mat cropAndScale(const cv::Mat &image, const DerivativeSize &size);

private:
    static cv::Mat load(const fs::path &source);
    static std::string encode(const cv::Mat &image, const std::string &extension);
};
