/**
 * @file    raster_test.cpp
 * @brief   Source raster construction and ownership
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/raster.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace loupe {
namespace {

TEST(SourceRasterTest, FromRgbOwnsItsPixels) {
    cv::Mat rgb(4, 4, CV_8UC3, cv::Scalar(0, 0, 0));
    const SourceRaster raster = SourceRaster::from_rgb(rgb);

    rgb.setTo(cv::Scalar(255, 255, 255));

    EXPECT_EQ(raster.pixels().at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(cv::countNonZero(raster.pixels().reshape(1)), 0);
    EXPECT_NE(raster.pixels().data, rgb.data);
}

TEST(SourceRasterTest, FromRgbCompactsSubRegions) {
    const cv::Mat full(10, 10, CV_8UC3, cv::Scalar(1, 2, 3));
    const cv::Mat region = full(cv::Rect(2, 2, 5, 3));

    const SourceRaster raster = SourceRaster::from_rgb(region);
    EXPECT_EQ(raster.size(), cv::Size(5, 3));
    EXPECT_TRUE(raster.pixels().isContinuous());
    EXPECT_EQ(raster.byte_size(), 5u * 3u * 3u);
}

TEST(SourceRasterTest, FromBgrSwapsChannels) {
    const cv::Mat bgr(2, 2, CV_8UC3, cv::Scalar(10, 20, 30));
    const SourceRaster raster = SourceRaster::from_bgr(bgr);
    EXPECT_EQ(raster.pixels().at<cv::Vec3b>(1, 1), cv::Vec3b(30, 20, 10));

    const cv::Mat gray(3, 2, CV_8UC1, cv::Scalar(77));
    const SourceRaster from_gray = SourceRaster::from_bgr(gray);
    EXPECT_EQ(from_gray.pixels().type(), CV_8UC3);
    EXPECT_EQ(from_gray.pixels().at<cv::Vec3b>(2, 1), cv::Vec3b(77, 77, 77));
}

TEST(SourceRasterTest, RejectsUnsupportedInput) {
    EXPECT_THROW((void)SourceRaster::from_rgb(cv::Mat()), std::invalid_argument);
    EXPECT_THROW((void)SourceRaster::from_rgb(cv::Mat(2, 2, CV_8UC4)), std::invalid_argument);
    EXPECT_THROW((void)SourceRaster::from_bgr(cv::Mat(2, 2, CV_16UC3)), std::invalid_argument);
    EXPECT_TRUE(SourceRaster().empty());
}

}  // anonymous namespace
}  // namespace loupe
