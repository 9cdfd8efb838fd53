#include "core/nudity_model.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <cstring>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

OnnxNudityModel::OnnxNudityModel(const fs::path &model_path)
{
    try
    {
        net_ = cv::dnn::readNetFromONNX(model_path.string());
    }
    catch (const cv::Exception &e)
    {
        throw InternalFailure("Failed to load nudity model " + model_path.string() + ": " + e.what());
    }
    if (net_.empty())
        throw InternalFailure("Nudity model is empty: " + model_path.string());

    Logger::info("Loaded nudity model from " + model_path.string());
}

std::map<std::string, double> OnnxNudityModel::classify(const std::vector<fs::path> &images)
{
    std::map<std::string, double> scores;
    if (images.empty())
        return scores;

    const int batch = static_cast<int>(images.size());
    const int dims[] = {batch, INPUT_SIZE, INPUT_SIZE, 3};
    cv::Mat blob(4, dims, CV_32F);

    const size_t image_floats = static_cast<size_t>(INPUT_SIZE) * INPUT_SIZE * 3;
    for (int i = 0; i < batch; ++i)
    {
        cv::Mat input = preprocess(images[i]);
        std::memcpy(blob.ptr<float>() + i * image_floats, input.ptr<float>(), image_floats * sizeof(float));
    }

    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(net_mutex_);
        try
        {
            net_.setInput(blob);
            output = net_.forward().clone();
        }
        catch (const cv::Exception &e)
        {
            throw InternalFailure(std::string("Nudity model inference failed: ") + e.what());
        }
    }

    output = output.reshape(1, batch);
    if (output.cols < 2)
        throw InternalFailure("Unexpected nudity model output shape");

    for (int i = 0; i < batch; ++i)
    {
        scores[images[i].string()] = output.at<float>(i, 0);
        Logger::debug("Nudity score for " + images[i].filename().string() + ": " +
                      std::to_string(output.at<float>(i, 0)));
    }
    return scores;
}

cv::Mat OnnxNudityModel::preprocess(const fs::path &image) const
{
    cv::Mat bgr = cv::imread(image.string(), cv::IMREAD_COLOR);
    if (bgr.empty())
        throw ValidationError("Invalid image file", "INVALID_IMAGE");

    cv::Mat rgb, resized, scaled;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    cv::resize(rgb, resized, cv::Size(INPUT_SIZE, INPUT_SIZE), 0, 0, cv::INTER_NEAREST);
    resized.convertTo(scaled, CV_32FC3, 1.0 / 255.0);
    return scaled.isContinuous() ? scaled : scaled.clone();
}
