#include "test_base.hpp"
#include "core/image_transcoder.hpp"
#include "core/media_errors.hpp"

class ImageTranscoderTest : public TestBase
{
protected:
    static cv::Mat decode(const std::string &bytes)
    {
        std::vector<uchar> buffer(bytes.begin(), bytes.end());
        return cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    }

    static DerivativeSize size(std::optional<int> width, std::optional<int> height)
    {
        DerivativeSize s;
        s.width = width;
        s.height = height;
        return s;
    }

    OpenCvImageTranscoder transcoder_;
};

TEST_F(ImageTranscoderTest, CropAndScaleHitsExactTarget)
{
    cv::Mat image(100, 200, CV_8UC3, cv::Scalar(0, 0, 255));
    cv::Mat out = OpenCvImageTranscoder::cropAndScale(image, size(50, 50));
    EXPECT_EQ(out.cols, 50);
    EXPECT_EQ(out.rows, 50);
}

TEST_F(ImageTranscoderTest, MissingSideFollowsAspectRatio)
{
    cv::Mat image(100, 200, CV_8UC3, cv::Scalar(0, 255, 0));

    cv::Mat by_width = OpenCvImageTranscoder::cropAndScale(image, size(100, std::nullopt));
    EXPECT_EQ(by_width.cols, 100);
    EXPECT_EQ(by_width.rows, 50);

    cv::Mat by_height = OpenCvImageTranscoder::cropAndScale(image, size(std::nullopt, 25));
    EXPECT_EQ(by_height.cols, 50);
    EXPECT_EQ(by_height.rows, 25);
}

TEST_F(ImageTranscoderTest, CropKeepsTheCenter)
{
    // Left and right thirds red, middle green; a square crop must be all green
    cv::Mat image(60, 180, CV_8UC3, cv::Scalar(0, 0, 255));
    image(cv::Rect(60, 0, 60, 60)).setTo(cv::Scalar(0, 255, 0));

    cv::Mat out = OpenCvImageTranscoder::cropAndScale(image, size(30, 30));
    cv::Vec3b corner = out.at<cv::Vec3b>(0, 0);
    EXPECT_EQ(corner[1], 255);
    EXPECT_EQ(corner[2], 0);
}

TEST_F(ImageTranscoderTest, ResizeKeepsSourceFormat)
{
    writeFile(images_dir_ / "pic.png", encodeImage(120, 80, ".png"));

    std::string bytes = transcoder_.resize(images_dir_ / "pic.png", size(60, std::nullopt));
    ASSERT_GE(bytes.size(), 8u);
    EXPECT_EQ(bytes.substr(1, 3), "PNG");

    cv::Mat out = decode(bytes);
    EXPECT_EQ(out.cols, 60);
    EXPECT_EQ(out.rows, 40);
}

TEST_F(ImageTranscoderTest, ResizeOfCorruptSourceIsInternalFailure)
{
    writeFile(images_dir_ / "broken.png", "not an image at all");
    EXPECT_THROW(transcoder_.resize(images_dir_ / "broken.png", size(10, 10)), InternalFailure);
}

TEST_F(ImageTranscoderTest, TranscodeConvertsToRequestedType)
{
    writeFile(tmp_dir_ / "upload", encodeImage(32, 32, ".png"));

    std::string bytes = transcoder_.transcode(tmp_dir_ / "upload", "jpg");
    ASSERT_GE(bytes.size(), 3u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xFF);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0xD8);
    EXPECT_EQ(decode(bytes).cols, 32);
}

TEST_F(ImageTranscoderTest, TranscodeDropsAlphaForJpeg)
{
    cv::Mat rgba(16, 16, CV_8UC4, cv::Scalar(10, 20, 30, 128));
    std::vector<uchar> buffer;
    cv::imencode(".png", rgba, buffer);
    writeFile(tmp_dir_ / "alpha", std::string(buffer.begin(), buffer.end()));

    cv::Mat out = decode(transcoder_.transcode(tmp_dir_ / "alpha", "jpg"));
    EXPECT_EQ(out.channels(), 3);
}

TEST_F(ImageTranscoderTest, TranscodeRejectsNonImages)
{
    writeFile(tmp_dir_ / "upload", "plain text");
    try
    {
        transcoder_.transcode(tmp_dir_ / "upload", "png");
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        EXPECT_EQ(e.code(), "INVALID_IMAGE");
    }
}

TEST_F(ImageTranscoderTest, TranscodeRejectsUnknownOutputType)
{
    writeFile(tmp_dir_ / "upload", encodeImage(8, 8, ".png"));
    try
    {
        transcoder_.transcode(tmp_dir_ / "upload", "doc");
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        EXPECT_EQ(e.code(), "UNSUPPORTED_OUTPUT_TYPE");
    }
}
