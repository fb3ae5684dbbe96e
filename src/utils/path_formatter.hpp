/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter for std::filesystem::path with UTF-8 output
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * spdlog/fmt and ImGui both expect UTF-8, while path.string() is in the
 * local code page on Windows. Everything that prints a path goes through
 * u8string() instead.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Loading: {}", some_path);
 *   ImGui::Text("%s", loupe::to_utf8(some_path).c_str());
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace loupe {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * C++20 u8string() returns std::u8string (char8_t), hence the cast.
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

inline std::string filename_utf8(const std::filesystem::path& path) {
    return to_utf8(path.filename());
}

/**
 * Build a path from a UTF-8 string (SDL drop events, CLI arguments)
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8_str) {
    return std::filesystem::path(
        std::u8string(reinterpret_cast<const char8_t*>(utf8_str.data()), utf8_str.size())
    );
}

}  // namespace loupe

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
