/**
 * @file    image_codec.cpp
 * @brief   Image decoding / encoding collaborators
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace loupe {

DecodeResult OpenCvImageSource::decode(const std::filesystem::path& path) const {
    DecodeResult result;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.code = ResultCode::FileNotFound;
        result.message = fmt::format("File not found: {}", path);
        return result;
    }

    cv::Mat image;
    try {
        image = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        result.code = ResultCode::InvalidFormat;
        result.message = fmt::format("Failed to decode {}: {}", path, e.what());
        return result;
    }

    if (image.empty()) {
        result.code = ResultCode::InvalidFormat;
        result.message = fmt::format("Failed to decode image: {}", path);
        return result;
    }

    result.raster = SourceRaster::from_bgr(image);
    result.code = ResultCode::Success;
    return result;
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> extensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".tiff", ".webp", ".svg"
    };
    return extensions;
}

bool is_supported_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& supported = supported_extensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

std::vector<uint8_t> encode_png(const cv::Mat& rgb, int compression) {
    if (rgb.empty()) {
        throw EncodeError("Cannot encode an empty image");
    }

    cv::Mat bgr;
    if (rgb.channels() == 3) {
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    } else if (rgb.channels() == 1) {
        bgr = rgb;
    } else {
        throw EncodeError(fmt::format("Unsupported channel count for PNG: {}", rgb.channels()));
    }

    const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, std::clamp(compression, 0, 9)};
    std::vector<uint8_t> bytes;

    try {
        if (!cv::imencode(".png", bgr, bytes, params)) {
            throw EncodeError("PNG encoder returned failure");
        }
    } catch (const cv::Exception& e) {
        throw EncodeError(fmt::format("PNG encoding failed: {}", e.what()));
    }

    return bytes;
}

cv::Mat decode_png(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return {};
    }

    // imdecode does not modify its input
    const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                         const_cast<uint8_t*>(bytes.data()));

    cv::Mat bgr;
    try {
        bgr = cv::imdecode(buffer, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        spdlog::warn("Failed to decode image bytes: {}", e.what());
        return {};
    }

    if (bgr.empty()) {
        return {};
    }

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

}  // namespace loupe
