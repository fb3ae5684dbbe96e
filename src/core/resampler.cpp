/**
 * @file    resampler.cpp
 * @brief   Algorithm-selectable 2D image resampling
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/resampler.hpp"

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace loupe {

namespace {

// Mitchell-Netravali family of cubics
double bc_cubic(double x, double b, double c) {
    x = std::abs(x);
    if (x < 1.0) {
        return ((12.0 - 9.0 * b - 6.0 * c) * x * x * x +
                (-18.0 + 12.0 * b + 6.0 * c) * x * x +
                (6.0 - 2.0 * b)) / 6.0;
    }
    if (x < 2.0) {
        return ((-b - 6.0 * c) * x * x * x +
                (6.0 * b + 30.0 * c) * x * x +
                (-12.0 * b - 48.0 * c) * x +
                (8.0 * b + 24.0 * c)) / 6.0;
    }
    return 0.0;
}

double sinc(double x) {
    if (std::abs(x) < 1e-8) return 1.0;
    const double px = std::numbers::pi * x;
    return std::sin(px) / px;
}

cv::Mat resample_nearest(const cv::Mat& src, cv::Size dst_size) {
    cv::Mat dst;

    // Pixel-center mapping, same convention as the convolution path
    cv::resize(src, dst, dst_size, 0, 0, cv::INTER_NEAREST_EXACT);
    return dst;
}

cv::Mat resample_separable(const cv::Mat& src, cv::Size dst_size, ResamplingAlgorithm algorithm) {
    const int channels = src.channels();
    const auto taps_x = compute_axis_weights(src.cols, dst_size.width, algorithm);
    const auto taps_y = compute_axis_weights(src.rows, dst_size.height, algorithm);

    // Horizontal pass: src rows x dst width, float intermediate
    cv::Mat horizontal(src.rows, dst_size.width, CV_32FC(channels));

    cv::parallel_for_(cv::Range(0, src.rows), [&](const cv::Range& range) {
        for (int y = range.start; y < range.end; ++y) {
            const uchar* src_row = src.ptr<uchar>(y);
            float* out_row = horizontal.ptr<float>(y);

            for (int x = 0; x < dst_size.width; ++x) {
                const AxisWeights& tap = taps_x[x];
                float* out = out_row + x * channels;
                std::fill(out, out + channels, 0.0f);

                for (size_t k = 0; k < tap.weights.size(); ++k) {
                    const uchar* s = src_row + (tap.first + static_cast<int>(k)) * channels;
                    const float w = tap.weights[k];
                    for (int c = 0; c < channels; ++c) {
                        out[c] += w * s[c];
                    }
                }
            }
        }
    });

    // Vertical pass: back to 8 bits with rounding and saturation
    cv::Mat dst(dst_size, src.type());
    const int row_values = dst_size.width * channels;

    cv::parallel_for_(cv::Range(0, dst_size.height), [&](const cv::Range& range) {
        std::vector<float> accum(row_values);

        for (int y = range.start; y < range.end; ++y) {
            const AxisWeights& tap = taps_y[y];
            std::fill(accum.begin(), accum.end(), 0.0f);

            for (size_t k = 0; k < tap.weights.size(); ++k) {
                const float* in_row = horizontal.ptr<float>(tap.first + static_cast<int>(k));
                const float w = tap.weights[k];
                for (int i = 0; i < row_values; ++i) {
                    accum[i] += w * in_row[i];
                }
            }

            uchar* dst_row = dst.ptr<uchar>(y);
            for (int i = 0; i < row_values; ++i) {
                dst_row[i] = cv::saturate_cast<uchar>(accum[i]);
            }
        }
    });

    return dst;
}

}  // anonymous namespace

double filter_support(ResamplingAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ResamplingAlgorithm::NearestNeighbor: return 0.5;
        case ResamplingAlgorithm::Triangle:        return 1.0;
        case ResamplingAlgorithm::Catrom:          return 2.0;
        case ResamplingAlgorithm::Mitchell:        return 2.0;
        case ResamplingAlgorithm::Lanczos3:        return 3.0;
        default:                                   return 1.0;
    }
}

double filter_kernel(ResamplingAlgorithm algorithm, double x) noexcept {
    switch (algorithm) {
        case ResamplingAlgorithm::NearestNeighbor:
            return (x >= -0.5 && x < 0.5) ? 1.0 : 0.0;
        case ResamplingAlgorithm::Triangle:
            return std::max(0.0, 1.0 - std::abs(x));
        case ResamplingAlgorithm::Catrom:
            return bc_cubic(x, 0.0, 0.5);
        case ResamplingAlgorithm::Mitchell:
            return bc_cubic(x, 1.0 / 3.0, 1.0 / 3.0);
        case ResamplingAlgorithm::Lanczos3:
            return (std::abs(x) < 3.0) ? sinc(x) * sinc(x / 3.0) : 0.0;
        default:
            return 0.0;
    }
}

std::vector<AxisWeights> compute_axis_weights(
    int src_length,
    int dst_length,
    ResamplingAlgorithm algorithm)
{
    if (src_length <= 0 || dst_length <= 0) {
        throw std::invalid_argument(
            fmt::format("Invalid resample axis {} -> {}", src_length, dst_length));
    }

    const double scale = static_cast<double>(src_length) / dst_length;
    const double filter_scale = std::max(1.0, scale);
    const double support = filter_support(algorithm) * filter_scale;

    std::vector<AxisWeights> taps(dst_length);

    for (int i = 0; i < dst_length; ++i) {
        const double center = (i + 0.5) * scale;
        const int left = std::max(0, static_cast<int>(std::floor(center - support)));
        const int right = std::min(src_length, static_cast<int>(std::ceil(center + support)) + 1);

        AxisWeights& tap = taps[i];
        tap.first = left;
        tap.weights.reserve(static_cast<size_t>(right - left));

        double sum = 0.0;
        for (int j = left; j < right; ++j) {
            const double w = filter_kernel(algorithm, (j + 0.5 - center) / filter_scale);
            tap.weights.push_back(static_cast<float>(w));
            sum += w;
        }

        if (std::abs(sum) < 1e-12) {
            // Degenerate window: fall back to the closest sample
            const int nearest = std::clamp(static_cast<int>(center), 0, src_length - 1);
            tap.first = nearest;
            tap.weights.assign(1, 1.0f);
            continue;
        }

        for (float& w : tap.weights) {
            w = static_cast<float>(w / sum);
        }

        // Trim zero taps at both ends
        while (tap.weights.size() > 1 && tap.weights.back() == 0.0f) {
            tap.weights.pop_back();
        }
        while (tap.weights.size() > 1 && tap.weights.front() == 0.0f) {
            tap.weights.erase(tap.weights.begin());
            ++tap.first;
        }
    }

    return taps;
}

cv::Mat resample(
    const cv::Mat& src,
    cv::Size dst_size,
    ResamplingAlgorithm algorithm)
{
    if (src.empty() || src.cols <= 0 || src.rows <= 0) {
        throw std::invalid_argument("Cannot resample an empty image");
    }
    if (dst_size.width <= 0 || dst_size.height <= 0) {
        throw std::invalid_argument(
            fmt::format("Invalid resample target {}x{}", dst_size.width, dst_size.height));
    }
    if (src.depth() != CV_8U || src.channels() < 1 || src.channels() > 4) {
        throw std::invalid_argument("Resampling requires an 8-bit image with 1-4 channels");
    }

    spdlog::trace("Resample {}x{} -> {}x{} ({})",
                  src.cols, src.rows, dst_size.width, dst_size.height, to_string(algorithm));

    if (src.size() == dst_size) {
        return src.clone();
    }

    if (algorithm == ResamplingAlgorithm::NearestNeighbor) {
        return resample_nearest(src, dst_size);
    }

    return resample_separable(src, dst_size, algorithm);
}

}  // namespace loupe
