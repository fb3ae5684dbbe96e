/**
 * @file    thumbnail_cache_test.cpp
 * @brief   Thumbnail generation and LRU eviction
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/thumbnail_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>

namespace loupe {
namespace {

// Decodes "missing*" as FileNotFound, "broken*" as InvalidFormat, anything else as a 120x60 image
class FakeImageSource final : public IImageSource {
public:
    DecodeResult decode(const std::filesystem::path& path) const override {
        ++decodes;

        DecodeResult result;
        const std::string stem = path.stem().string();
        if (stem.starts_with("missing")) {
            result.code = ResultCode::FileNotFound;
            result.message = "gone";
            return result;
        }
        if (stem.starts_with("broken")) {
            result.code = ResultCode::InvalidFormat;
            result.message = "corrupt";
            return result;
        }

        cv::Mat rgb(60, 120, CV_8UC3, cv::Scalar(10, 20, 30));
        // Left and right thirds differ so the center crop is observable
        rgb(cv::Rect(0, 0, 30, 60)).setTo(cv::Scalar(255, 0, 0));
        rgb(cv::Rect(90, 0, 30, 60)).setTo(cv::Scalar(0, 0, 255));
        result.raster = SourceRaster::from_rgb(rgb);
        result.code = ResultCode::Success;
        return result;
    }

    mutable std::atomic<int> decodes{0};
};

TEST(ThumbnailTest, UnsupportedExtensionSkipsDecoding) {
    FakeImageSource source;
    const Thumbnail thumb = make_thumbnail("notes.txt", source);

    EXPECT_EQ(thumb.kind, ThumbnailKind::Unsupported);
    EXPECT_TRUE(thumb.is_placeholder());
    EXPECT_EQ(source.decodes.load(), 0);
    EXPECT_EQ(thumb.pixels.size(), cv::Size(kThumbnailSize, kThumbnailSize));
}

TEST(ThumbnailTest, MissingFileGetsPlaceholder) {
    FakeImageSource source;
    const Thumbnail thumb = make_thumbnail("missing.png", source);
    EXPECT_EQ(thumb.kind, ThumbnailKind::MissingFile);
    EXPECT_EQ(source.decodes.load(), 1);
}

TEST(ThumbnailTest, DecodeFailureGetsPlaceholder) {
    FakeImageSource source;
    const Thumbnail thumb = make_thumbnail("broken.jpg", source);
    EXPECT_EQ(thumb.kind, ThumbnailKind::DecodeFailed);
    EXPECT_FALSE(thumb.encoded.empty());
}

TEST(ThumbnailTest, ImageIsCenterCroppedToSquare) {
    FakeImageSource source;
    const Thumbnail thumb = make_thumbnail("photo.PNG", source, 32);

    ASSERT_EQ(thumb.kind, ThumbnailKind::Image);
    ASSERT_EQ(thumb.pixels.size(), cv::Size(32, 32));
    EXPECT_FALSE(thumb.encoded.empty());

    // The 60x60 center square holds none of the colored side bands
    const cv::Vec3b center = thumb.pixels.at<cv::Vec3b>(16, 16);
    EXPECT_EQ(center, cv::Vec3b(10, 20, 30));
}

TEST(ThumbnailTest, PlaceholdersHaveRequestedSize) {
    for (ThumbnailKind kind : {ThumbnailKind::Unsupported, ThumbnailKind::MissingFile, ThumbnailKind::DecodeFailed}) {
        const Thumbnail thumb = make_placeholder(kind, 24);
        EXPECT_EQ(thumb.kind, kind);
        EXPECT_EQ(thumb.pixels.size(), cv::Size(24, 24));
    }
}

TEST(ThumbnailCacheTest, EvictsLeastRecentlyUsed) {
    ThumbnailCache cache(2);
    cache.insert("a.png", make_placeholder(ThumbnailKind::Unsupported, 4));
    cache.insert("b.png", make_placeholder(ThumbnailKind::Unsupported, 4));
    cache.insert("c.png", make_placeholder(ThumbnailKind::Unsupported, 4));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains("a.png"));
    EXPECT_TRUE(cache.contains("b.png"));
    EXPECT_TRUE(cache.contains("c.png"));
}

TEST(ThumbnailCacheTest, FindRefreshesRecency) {
    ThumbnailCache cache(2);
    cache.insert("a.png", make_placeholder(ThumbnailKind::Unsupported, 4));
    cache.insert("b.png", make_placeholder(ThumbnailKind::Unsupported, 4));

    ASSERT_NE(cache.find("a.png"), nullptr);
    cache.insert("c.png", make_placeholder(ThumbnailKind::Unsupported, 4));

    EXPECT_TRUE(cache.contains("a.png"));
    EXPECT_FALSE(cache.contains("b.png"));
    EXPECT_EQ(cache.find("b.png"), nullptr);
}

TEST(ThumbnailCacheTest, ReinsertReplacesEntry) {
    ThumbnailCache cache(4);
    cache.insert("a.png", make_placeholder(ThumbnailKind::DecodeFailed, 4));
    cache.insert("a.png", make_placeholder(ThumbnailKind::MissingFile, 4));

    EXPECT_EQ(cache.size(), 1u);
    auto entry = cache.find("a.png");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->kind, ThumbnailKind::MissingFile);
}

TEST(ThumbnailCacheTest, GetOrCreateDecodesOnce) {
    FakeImageSource source;
    ThumbnailCache cache;

    auto first = cache.get_or_create("photo.png", source, 16);
    auto second = cache.get_or_create("photo.png", source, 16);

    EXPECT_EQ(source.decodes.load(), 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.capacity(), kDefaultThumbnailCapacity);
}

TEST(ThumbnailCacheTest, ClearEmptiesCache) {
    ThumbnailCache cache(3);
    cache.insert("a.png", make_placeholder(ThumbnailKind::Unsupported, 4));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains("a.png"));
}

TEST(ThumbnailCacheTest, CapacityIsAtLeastOne) {
    ThumbnailCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
}

}  // anonymous namespace
}  // namespace loupe
