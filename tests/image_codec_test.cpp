/**
 * @file    image_codec_test.cpp
 * @brief   File decoding and PNG buffers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/image_codec.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace loupe {
namespace {

namespace fs = std::filesystem;

class ImageCodecTest : public testing::Test {
protected:
    void SetUp() override {
        const auto* info = testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() / (std::string("loupe_codec_") + info->name());
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    fs::path m_dir;
};

TEST_F(ImageCodecTest, DecodesFileAsRgb) {
    // Pure blue in OpenCV's BGR order
    const cv::Mat bgr(10, 20, CV_8UC3, cv::Scalar(255, 0, 0));
    const fs::path file = m_dir / "blue.png";
    ASSERT_TRUE(cv::imwrite(file.string(), bgr));

    const DecodeResult result = OpenCvImageSource().decode(file);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.raster.size(), cv::Size(20, 10));
    EXPECT_EQ(result.raster.pixels().at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(result.raster.byte_size(), 20u * 10u * 3u);
}

TEST_F(ImageCodecTest, MissingFileReportsNotFound) {
    const DecodeResult result = OpenCvImageSource().decode(m_dir / "absent.png");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code, ResultCode::FileNotFound);
    EXPECT_TRUE(result.raster.empty());
}

TEST_F(ImageCodecTest, GarbageReportsInvalidFormat) {
    const fs::path file = m_dir / "fake.png";
    std::ofstream(file) << "definitely not a png";

    const DecodeResult result = OpenCvImageSource().decode(file);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code, ResultCode::InvalidFormat);
    EXPECT_FALSE(result.message.empty());
}

TEST(ImageCodecBufferTest, PngRoundTripPreservesPixels) {
    cv::Mat rgb(7, 5, CV_8UC3);
    cv::randu(rgb, cv::Scalar::all(0), cv::Scalar::all(255));

    const auto bytes = encode_png(rgb);
    ASSERT_FALSE(bytes.empty());

    const cv::Mat decoded = decode_png(bytes);
    ASSERT_EQ(decoded.size(), rgb.size());
    EXPECT_EQ(cv::norm(decoded, rgb, cv::NORM_INF), 0.0);
}

TEST(ImageCodecBufferTest, EncodeRejectsEmptyImage) {
    EXPECT_THROW((void)encode_png(cv::Mat()), EncodeError);
    EXPECT_THROW((void)encode_png(cv::Mat(2, 2, CV_8UC4)), EncodeError);
}

TEST(ImageCodecBufferTest, DecodeOfGarbageIsEmpty) {
    EXPECT_TRUE(decode_png({}).empty());
    const std::vector<uint8_t> junk = {1, 2, 3, 4, 5};
    EXPECT_TRUE(decode_png(junk).empty());
}

TEST(ImageCodecBufferTest, ExtensionCheckIgnoresCase) {
    EXPECT_TRUE(is_supported_extension("a.png"));
    EXPECT_TRUE(is_supported_extension("a.JPG"));
    EXPECT_TRUE(is_supported_extension("dir/b.Jpeg"));
    EXPECT_TRUE(is_supported_extension("c.webp"));
    EXPECT_FALSE(is_supported_extension("d.txt"));
    EXPECT_FALSE(is_supported_extension("noext"));
    EXPECT_FALSE(is_supported_extension(".png.bak"));
}

}  // anonymous namespace
}  // namespace loupe
