#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>

namespace fs = std::filesystem;

/**
 * @brief Opaque nudity classifier
 *
 * classify() receives a batch of still images and returns, for each path, the
 * probability that the image is unsafe.
 */
class NudityModel
{
public:
    virtual ~NudityModel() = default;

    // Keys are path.string() of every input
    virtual std::map<std::string, double> classify(const std::vector<fs::path> &images) = 0;
};

/**
 * @brief NudityModel running an ONNX image classifier through OpenCV DNN
 *
 * Input is a batch of 256x256 RGB images scaled to [0, 1] in NHWC layout,
 * output is one [unsafe, safe] probability pair per image.
 */
class OnnxNudityModel : public NudityModel
{
public:
    static constexpr int INPUT_SIZE = 256;

    /**
     * @param model_path ONNX file
     * @throws InternalFailure if the model cannot be loaded
     */
    explicit OnnxNudityModel(const fs::path &model_path);

    std::map<std::string, double> classify(const std::vector<fs::path> &images) override;

private:
    cv::Mat preprocess(const fs::path &image) const;

    cv::dnn::Net net_;
    std::mutex net_mutex_; // Net::forward is not reentrant
};
