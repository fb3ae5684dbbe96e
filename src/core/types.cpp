/**
 * @file    types.cpp
 * @brief   Name parsing for shared enumerations
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace loupe {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // anonymous namespace

std::optional<ResamplingAlgorithm> parse_algorithm(std::string_view name) {
    const std::string lower = to_lower(name);

    for (ResamplingAlgorithm algorithm : kAllAlgorithms) {
        if (lower == to_string(algorithm)) {
            return algorithm;
        }
    }

    // Aliases used by other tools
    if (lower == "point" || lower == "nearest-neighbor") return ResamplingAlgorithm::NearestNeighbor;
    if (lower == "bilinear" || lower == "linear")        return ResamplingAlgorithm::Triangle;
    if (lower == "lanczos")                              return ResamplingAlgorithm::Lanczos3;

    return std::nullopt;
}

std::optional<RenderTier> parse_tier(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == to_string(RenderTier::Preview)) return RenderTier::Preview;
    if (lower == to_string(RenderTier::Final))   return RenderTier::Final;
    return std::nullopt;
}

}  // namespace loupe
