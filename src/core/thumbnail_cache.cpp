/**
 * @file    thumbnail_cache.cpp
 * @brief   Bounded LRU cache of gallery thumbnails
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/thumbnail_cache.hpp"
#include "core/render_pipeline.hpp"
#include "core/resampler.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace loupe {

namespace {

cv::Scalar placeholder_color(ThumbnailKind kind) {
    switch (kind) {
        case ThumbnailKind::Unsupported:  return cv::Scalar(150, 150, 150);
        case ThumbnailKind::MissingFile:  return cv::Scalar(200, 200, 200);
        case ThumbnailKind::DecodeFailed: return cv::Scalar(255, 100, 100);  // RGB
        default:                          return cv::Scalar(0, 0, 0);
    }
}

Thumbnail finish(cv::Mat pixels, ThumbnailKind kind) {
    Thumbnail thumb;
    thumb.pixels = std::move(pixels);
    thumb.kind = kind;
    try {
        thumb.encoded = encode_png(thumb.pixels, kFinalPngCompression);
    } catch (const EncodeError& e) {
        // Pixels are still usable by the gallery
        spdlog::warn("Thumbnail encode failed: {}", e.what());
    }
    return thumb;
}

}  // anonymous namespace

Thumbnail make_placeholder(ThumbnailKind kind, int size) {
    return finish(cv::Mat(size, size, CV_8UC3, placeholder_color(kind)), kind);
}

Thumbnail make_thumbnail(
    const std::filesystem::path& path,
    const IImageSource& source,
    int size)
{
    if (size <= 0) {
        throw std::invalid_argument("Thumbnail size must be positive");
    }

    if (!is_supported_extension(path)) {
        spdlog::debug("Unsupported image format: {}", path);
        return make_placeholder(ThumbnailKind::Unsupported, size);
    }

    const DecodeResult decoded = source.decode(path);
    if (!decoded.ok()) {
        spdlog::warn("Thumbnail unavailable for {}: {}", path, decoded.message);
        return make_placeholder(
            decoded.code == ResultCode::FileNotFound ? ThumbnailKind::MissingFile
                                                     : ThumbnailKind::DecodeFailed,
            size);
    }

    // Cover fit: largest centered square, then scale
    const SourceRaster& raster = decoded.raster;
    const int side = std::min(raster.width(), raster.height());
    const cv::Rect square((raster.width() - side) / 2, (raster.height() - side) / 2, side, side);

    cv::Mat pixels = resample(raster.view(square), cv::Size(size, size), ResamplingAlgorithm::Lanczos3);
    return finish(std::move(pixels), ThumbnailKind::Image);
}

// =============================================================================
// ThumbnailCache
// =============================================================================

ThumbnailCache::ThumbnailCache(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(1, capacity))
{
}

ThumbnailCache::Entry ThumbnailCache::find(const std::filesystem::path& path) {
    auto it = m_map.find(path);
    if (it == m_map.end()) {
        return nullptr;
    }

    m_lru.splice(m_lru.begin(), m_lru, it->second);
    return it->second->thumbnail;
}

bool ThumbnailCache::contains(const std::filesystem::path& path) const {
    return m_map.find(path) != m_map.end();
}

ThumbnailCache::Entry ThumbnailCache::insert(const std::filesystem::path& path, Thumbnail thumbnail) {
    auto entry = std::make_shared<const Thumbnail>(std::move(thumbnail));

    auto it = m_map.find(path);
    if (it != m_map.end()) {
        it->second->thumbnail = entry;
        m_lru.splice(m_lru.begin(), m_lru, it->second);
        return entry;
    }

    m_lru.push_front(Node{path, entry});
    m_map.emplace(path, m_lru.begin());
    evict_overflow();
    return entry;
}

ThumbnailCache::Entry ThumbnailCache::get_or_create(
    const std::filesystem::path& path,
    const IImageSource& source,
    int size)
{
    if (auto cached = find(path)) {
        return cached;
    }
    return insert(path, make_thumbnail(path, source, size));
}

void ThumbnailCache::clear() noexcept {
    m_map.clear();
    m_lru.clear();
}

void ThumbnailCache::evict_overflow() {
    while (m_map.size() > m_capacity) {
        const Node& victim = m_lru.back();
        spdlog::trace("Thumbnail cache evicting {}", victim.path);
        m_map.erase(victim.path);
        m_lru.pop_back();
    }
}

}  // namespace loupe
