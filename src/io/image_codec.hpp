/**
 * @file    image_codec.hpp
 * @brief   Image decoding / encoding collaborators
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Decoding goes through IImageSource so the session and the thumbnail
 * cache can be driven by fakes in tests. Encoding is always lossless PNG.
 */

#pragma once

#include "core/raster.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace loupe {

/**
 * Raised when a raster cannot be encoded
 */
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Outcome of decoding an image file
 */
struct DecodeResult {
    ResultCode code{ResultCode::InvalidFormat};
    SourceRaster raster;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return code == ResultCode::Success; }
};

/**
 * Image file decoder
 */
class IImageSource {
public:
    virtual ~IImageSource() = default;

    /**
     * Decode an image file into an RGB raster
     * Must be safe to call from worker threads.
     */
    [[nodiscard]] virtual DecodeResult decode(const std::filesystem::path& path) const = 0;
};

/**
 * Decoder backed by cv::imread
 */
class OpenCvImageSource final : public IImageSource {
public:
    [[nodiscard]] DecodeResult decode(const std::filesystem::path& path) const override;
};

/**
 * Get supported image file extensions (lower case, with dot)
 */
[[nodiscard]] const std::vector<std::string>& supported_extensions();

/**
 * Check if file extension is supported (case-insensitive)
 */
[[nodiscard]] bool is_supported_extension(const std::filesystem::path& path);

/**
 * Encode an RGB image as PNG
 *
 * @param rgb          8-bit RGB (3 channel) or gray image
 * @param compression  zlib level 0-9
 * @throws EncodeError if OpenCV refuses the image
 */
[[nodiscard]] std::vector<uint8_t> encode_png(const cv::Mat& rgb, int compression = 3);

/**
 * Decode PNG (or any OpenCV format) bytes into an RGB image
 *
 * @return  CV_8UC3 RGB image, empty on failure
 */
[[nodiscard]] cv::Mat decode_png(std::span<const uint8_t> bytes);

}  // namespace loupe
