/**
 * @file    thumbnail_cache.hpp
 * @brief   Bounded LRU cache of gallery thumbnails
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Thumbnails are cover-fit: the largest centered square of the source is
 * scaled to size x size with Lanczos3, so the aspect ratio is kept and the
 * overflow is cropped.
 *
 * Files that cannot produce a thumbnail get a flat placeholder instead of
 * an error, so a mixed directory still renders:
 *
 *   Unsupported extension   gray 150   (no decode attempted)
 *   Missing / not a file    gray 200
 *   Decode failure          (255, 100, 100)
 *
 * Keys are exact paths. Replacing a file at the same path does not
 * invalidate its entry.
 */

#pragma once

#include "io/image_codec.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loupe {

inline constexpr int kThumbnailSize = 80;
inline constexpr std::size_t kDefaultThumbnailCapacity = 256;

enum class ThumbnailKind {
    Image,
    Unsupported,
    MissingFile,
    DecodeFailed
};

[[nodiscard]] constexpr std::string_view to_string(ThumbnailKind kind) noexcept {
    switch (kind) {
        case ThumbnailKind::Image:        return "Image";
        case ThumbnailKind::Unsupported:  return "Unsupported";
        case ThumbnailKind::MissingFile:  return "MissingFile";
        case ThumbnailKind::DecodeFailed: return "DecodeFailed";
        default:                          return "Unknown";
    }
}

struct Thumbnail {
    cv::Mat pixels;                 // size x size, RGB
    std::vector<uint8_t> encoded;   // PNG of pixels
    ThumbnailKind kind{ThumbnailKind::Image};

    [[nodiscard]] bool is_placeholder() const noexcept { return kind != ThumbnailKind::Image; }
};

/**
 * Build a thumbnail for a file (safe to call off the event loop)
 *
 * @param path    Image file
 * @param source  Decoder
 * @param size    Edge length in pixels
 */
[[nodiscard]] Thumbnail make_thumbnail(
    const std::filesystem::path& path,
    const IImageSource& source,
    int size = kThumbnailSize
);

/**
 * Flat placeholder for a failed thumbnail kind
 */
[[nodiscard]] Thumbnail make_placeholder(ThumbnailKind kind, int size = kThumbnailSize);

class ThumbnailCache {
public:
    using Entry = std::shared_ptr<const Thumbnail>;

    explicit ThumbnailCache(std::size_t capacity = kDefaultThumbnailCapacity);

    /**
     * Look up a thumbnail and mark it most recently used
     * @return  Entry or nullptr on miss
     */
    [[nodiscard]] Entry find(const std::filesystem::path& path);

    /**
     * Membership test that does not touch the LRU order
     */
    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    /**
     * Insert or replace an entry, evicting the least recently used past capacity
     */
    Entry insert(const std::filesystem::path& path, Thumbnail thumbnail);

    /**
     * Cached thumbnail, or build and insert one synchronously on miss
     */
    Entry get_or_create(
        const std::filesystem::path& path,
        const IImageSource& source,
        int size = kThumbnailSize
    );

    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return m_map.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    struct PathHash {
        std::size_t operator()(const std::filesystem::path& p) const noexcept {
            return std::filesystem::hash_value(p);
        }
    };

    struct Node {
        std::filesystem::path path;
        Entry thumbnail;
    };

    std::size_t m_capacity;
    std::list<Node> m_lru;   // Front = most recently used
    std::unordered_map<std::filesystem::path, std::list<Node>::iterator, PathHash> m_map;

    void evict_overflow();
};

}  // namespace loupe
