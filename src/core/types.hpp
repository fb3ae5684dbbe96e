/**
 * @file    types.hpp
 * @brief   Shared type definitions for Loupe
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace loupe {

// Version info
inline constexpr const char* kVersion = "0.1.0";

// Result type for operations
enum class [[nodiscard]] ResultCode {
    Success,
    FileNotFound,
    InvalidFormat,
    ProcessingFailed,
    SaveFailed
};

// Convert result code to string
[[nodiscard]] constexpr const char* to_string(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::Success:          return "Success";
        case ResultCode::FileNotFound:     return "File not found";
        case ResultCode::InvalidFormat:    return "Invalid format";
        case ResultCode::ProcessingFailed: return "Processing failed";
        case ResultCode::SaveFailed:       return "Save failed";
        default:                           return "Unknown";
    }
}

// =============================================================================
// Resampling Algorithm
// =============================================================================

/**
 * Interpolation used by the resampling kernel
 *
 * Ordered from fastest to highest quality.
 */
enum class ResamplingAlgorithm {
    NearestNeighbor,
    Triangle,   // bilinear
    Catrom,     // Catmull-Rom cubic
    Mitchell,   // Mitchell-Netravali cubic
    Lanczos3    // windowed sinc, 3 lobes
};

inline constexpr ResamplingAlgorithm kAllAlgorithms[] = {
    ResamplingAlgorithm::NearestNeighbor,
    ResamplingAlgorithm::Triangle,
    ResamplingAlgorithm::Catrom,
    ResamplingAlgorithm::Mitchell,
    ResamplingAlgorithm::Lanczos3,
};

[[nodiscard]] constexpr std::string_view to_string(ResamplingAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ResamplingAlgorithm::NearestNeighbor: return "nearest";
        case ResamplingAlgorithm::Triangle:        return "triangle";
        case ResamplingAlgorithm::Catrom:          return "catrom";
        case ResamplingAlgorithm::Mitchell:        return "mitchell";
        case ResamplingAlgorithm::Lanczos3:        return "lanczos3";
        default:                                   return "unknown";
    }
}

/**
 * Parse an algorithm name (case-insensitive, as printed by to_string)
 */
[[nodiscard]] std::optional<ResamplingAlgorithm> parse_algorithm(std::string_view name);

// =============================================================================
// Render Tier
// =============================================================================

/**
 * Quality class of a render pass
 *   Preview: always nearest neighbor, used while the user drags
 *   Final:   user-selected algorithm, used once input settles
 */
enum class RenderTier {
    Preview,
    Final
};

[[nodiscard]] constexpr std::string_view to_string(RenderTier tier) noexcept {
    switch (tier) {
        case RenderTier::Preview: return "preview";
        case RenderTier::Final:   return "final";
        default:                  return "unknown";
    }
}

[[nodiscard]] std::optional<RenderTier> parse_tier(std::string_view name);

}  // namespace loupe
