/**
 * @file    resampler_test.cpp
 * @brief   Separable resampling kernels
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/resampler.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace loupe {
namespace {

cv::Mat gradient(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(
                static_cast<uchar>((x * 37) % 256),
                static_cast<uchar>((y * 53) % 256),
                static_cast<uchar>((x + y) % 256));
        }
    }
    return image;
}

bool identical(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

class ResamplerAlgorithmTest : public testing::TestWithParam<ResamplingAlgorithm> {};

TEST_P(ResamplerAlgorithmTest, AxisWeightsAreNormalized) {
    for (auto [src, dst] : {std::pair{10, 37}, std::pair{37, 10}, std::pair{5, 5}, std::pair{1, 8}}) {
        const auto taps = compute_axis_weights(src, dst, GetParam());
        ASSERT_EQ(taps.size(), static_cast<size_t>(dst));

        for (const AxisWeights& tap : taps) {
            ASSERT_FALSE(tap.weights.empty());
            EXPECT_GE(tap.first, 0);
            EXPECT_LE(tap.first + static_cast<int>(tap.weights.size()), src);

            const float sum = std::accumulate(tap.weights.begin(), tap.weights.end(), 0.0f);
            EXPECT_NEAR(sum, 1.0f, 1e-4f);
        }
    }
}

TEST_P(ResamplerAlgorithmTest, ProducesRequestedSize) {
    const cv::Mat src = gradient(23, 17);
    for (cv::Size target : {cv::Size(46, 34), cv::Size(7, 5), cv::Size(100, 3)}) {
        const cv::Mat out = resample(src, target, GetParam());
        EXPECT_EQ(out.size(), target);
        EXPECT_EQ(out.type(), src.type());
    }
}

TEST_P(ResamplerAlgorithmTest, ConstantImageStaysConstant) {
    const cv::Mat src(12, 9, CV_8UC3, cv::Scalar(200, 17, 128));
    const cv::Mat out = resample(src, cv::Size(31, 40), GetParam());
    const cv::Mat expected(40, 31, CV_8UC3, cv::Scalar(200, 17, 128));
    EXPECT_TRUE(identical(out, expected));
}

TEST_P(ResamplerAlgorithmTest, SameSizeIsExactCopy) {
    const cv::Mat src = gradient(16, 9);
    EXPECT_TRUE(identical(resample(src, src.size(), GetParam()), src));
}

TEST_P(ResamplerAlgorithmTest, AcceptsCropViews) {
    const cv::Mat src = gradient(40, 30);
    const cv::Mat view = src(cv::Rect(10, 7, 20, 15));
    const cv::Mat out = resample(view, cv::Size(40, 30), GetParam());
    EXPECT_EQ(out.size(), cv::Size(40, 30));
}

INSTANTIATE_TEST_SUITE_P(
    AllAlgorithms,
    ResamplerAlgorithmTest,
    testing::ValuesIn(kAllAlgorithms),
    [](const testing::TestParamInfo<ResamplingAlgorithm>& info) {
        return std::string(to_string(info.param));
    });

TEST(ResamplerTest, NearestReplicatesPixelsExactly) {
    const cv::Mat src = gradient(3, 2);
    const cv::Mat out = resample(src, cv::Size(6, 4), ResamplingAlgorithm::NearestNeighbor);

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 6; ++x) {
            EXPECT_EQ(out.at<cv::Vec3b>(y, x), src.at<cv::Vec3b>(y / 2, x / 2))
                << "at " << x << "," << y;
        }
    }
}

TEST(ResamplerTest, NearestDownscaleSamplesPixelCenters) {
    cv::Mat src(1, 8, CV_8UC1);
    for (int x = 0; x < 8; ++x) {
        src.at<uchar>(0, x) = static_cast<uchar>(x * 10);
    }

    // Output pixel i covers source [2i, 2i+2); its center lands on 2i+1
    const cv::Mat out = resample(src, cv::Size(4, 1), ResamplingAlgorithm::NearestNeighbor);
    ASSERT_EQ(out.cols, 4);
    for (int x = 0; x < 4; ++x) {
        EXPECT_EQ(out.at<uchar>(0, x), (2 * x + 1) * 10) << "at " << x;
    }
}

TEST(ResamplerTest, NearestNeverInventsColors) {
    const cv::Mat src = gradient(7, 5);
    const cv::Mat out = resample(src, cv::Size(19, 13), ResamplingAlgorithm::NearestNeighbor);

    for (int y = 0; y < out.rows; ++y) {
        for (int x = 0; x < out.cols; ++x) {
            bool found = false;
            const cv::Vec3b pixel = out.at<cv::Vec3b>(y, x);
            for (int sy = 0; sy < src.rows && !found; ++sy) {
                for (int sx = 0; sx < src.cols && !found; ++sx) {
                    found = src.at<cv::Vec3b>(sy, sx) == pixel;
                }
            }
            EXPECT_TRUE(found) << "at " << x << "," << y;
        }
    }
}

TEST(ResamplerTest, TriangleBlendsNeighbors) {
    cv::Mat src(1, 2, CV_8UC1);
    src.at<uchar>(0, 0) = 0;
    src.at<uchar>(0, 1) = 200;

    const cv::Mat out = resample(src, cv::Size(4, 1), ResamplingAlgorithm::Triangle);
    ASSERT_EQ(out.cols, 4);
    EXPECT_EQ(out.at<uchar>(0, 0), 0);
    EXPECT_EQ(out.at<uchar>(0, 3), 200);
    EXPECT_GT(out.at<uchar>(0, 1), 0);
    EXPECT_LT(out.at<uchar>(0, 1), out.at<uchar>(0, 2));
    EXPECT_LT(out.at<uchar>(0, 2), 200);
}

TEST(ResamplerTest, KernelsPeakAtZero) {
    for (ResamplingAlgorithm algorithm : kAllAlgorithms) {
        EXPECT_GT(filter_kernel(algorithm, 0.0), 0.0) << to_string(algorithm);
        EXPECT_EQ(filter_kernel(algorithm, filter_support(algorithm) + 0.01), 0.0) << to_string(algorithm);
    }
    EXPECT_DOUBLE_EQ(filter_kernel(ResamplingAlgorithm::Lanczos3, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(filter_kernel(ResamplingAlgorithm::Catrom, 1.0), 0.0);
}

TEST(ResamplerTest, RejectsInvalidInput) {
    const cv::Mat src = gradient(4, 4);
    EXPECT_THROW((void)resample(cv::Mat(), cv::Size(2, 2), ResamplingAlgorithm::Triangle),
                 std::invalid_argument);
    EXPECT_THROW((void)resample(src, cv::Size(0, 2), ResamplingAlgorithm::Triangle),
                 std::invalid_argument);

    const cv::Mat floats(4, 4, CV_32FC1, cv::Scalar(0.5));
    EXPECT_THROW((void)resample(floats, cv::Size(8, 8), ResamplingAlgorithm::Lanczos3),
                 std::invalid_argument);

    EXPECT_THROW((void)compute_axis_weights(0, 4, ResamplingAlgorithm::Mitchell), std::invalid_argument);
    EXPECT_THROW((void)compute_axis_weights(4, -1, ResamplingAlgorithm::Mitchell), std::invalid_argument);
}

}  // anonymous namespace
}  // namespace loupe
