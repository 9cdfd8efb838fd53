#include "core/image_transcoder.hpp"
#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

std::string OpenCvImageTranscoder::resize(const fs::path &source, const DerivativeSize &size)
{
    cv::Mat image = load(source);
    if (image.empty())
        throw InternalFailure("Failed to load image for resize: " + source.string());

    cv::Mat resized = cropAndScale(image, size);
    Logger::debug("Resized " + source.filename().string() + " from " + std::to_string(image.cols) + "x" +
                  std::to_string(image.rows) + " to " + std::to_string(resized.cols) + "x" + std::to_string(resized.rows));

    std::string extension = FileUtils::getFileExtension(source.string());
    std::string encoded = encode(resized, extension);
    if (encoded.empty())
        throw InternalFailure("Failed to encode resized image as " + extension);
    return encoded;
}

std::string OpenCvImageTranscoder::transcode(const fs::path &source, const std::string &output_type)
{
    cv::Mat image = load(source);
    if (image.empty())
        throw ValidationError("Invalid image file", "INVALID_IMAGE");

    std::string encoded = encode(image, output_type);
    if (encoded.empty())
        throw ValidationError("Unsupported output type: " + output_type, "UNSUPPORTED_OUTPUT_TYPE");
    return encoded;
}

cv::Mat OpenCvImageTranscoder::cropAndScale(const cv::Mat &image, const DerivativeSize &size)
{
    const double current_ratio = static_cast<double>(image.cols) / image.rows;

    int width = size.width.value_or(0);
    int height = size.height.value_or(0);
    if (!size.width)
        width = static_cast<int>(current_ratio * height);
    if (!size.height)
        height = static_cast<int>(width / current_ratio);
    width = std::max(width, 1);
    height = std::max(height, 1);

    const double desired_ratio = static_cast<double>(width) / height;
    cv::Rect crop;
    if (desired_ratio > current_ratio)
    {
        int new_height = std::max(1, static_cast<int>(image.cols / desired_ratio));
        crop = cv::Rect(0, (image.rows - new_height) / 2, image.cols, new_height);
    }
    else
    {
        int new_width = std::max(1, static_cast<int>(image.rows * desired_ratio));
        crop = cv::Rect((image.cols - new_width) / 2, 0, new_width, image.rows);
    }
    crop &= cv::Rect(0, 0, image.cols, image.rows);

    const bool shrinking = width < crop.width || height < crop.height;
    cv::Mat resized;
    cv::resize(image(crop), resized, cv::Size(width, height), 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
    return resized;
}

cv::Mat OpenCvImageTranscoder::load(const fs::path &source)
{
    try
    {
        // IMREAD_UNCHANGED keeps alpha channels
        return cv::imread(source.string(), cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV could not decode " + source.filename().string() + ": " + e.what());
        return cv::Mat();
    }
}

std::string OpenCvImageTranscoder::encode(const cv::Mat &image, const std::string &extension)
{
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    cv::Mat output = image;
    if ((ext == "jpg" || ext == "jpeg") && image.channels() == 4)
        cv::cvtColor(image, output, cv::COLOR_BGRA2BGR);
    if ((ext == "jpg" || ext == "jpeg") && output.depth() != CV_8U)
        output.convertTo(output, CV_8U, 1.0 / 256.0);

    std::vector<int> params;
    if (ext == "jpg" || ext == "jpeg")
        params = {cv::IMWRITE_JPEG_QUALITY, 90};
    else if (ext == "webp")
        params = {cv::IMWRITE_WEBP_QUALITY, 90};

    std::vector<uchar> buffer;
    try
    {
        if (!cv::imencode("." + ext, output, buffer, params))
            return "";
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV could not encode image as " + ext + ": " + e.what());
        return "";
    }
    return std::string(buffer.begin(), buffer.end());
}
