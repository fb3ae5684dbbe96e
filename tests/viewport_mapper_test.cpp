/**
 * @file    viewport_mapper_test.cpp
 * @brief   Crop window geometry for zoom and pan
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/viewport_mapper.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

namespace loupe {
namespace {

void expect_inside(const cv::Rect& crop, int width, int height) {
    EXPECT_GE(crop.x, 0);
    EXPECT_GE(crop.y, 0);
    EXPECT_GE(crop.width, 1);
    EXPECT_GE(crop.height, 1);
    EXPECT_LE(crop.x + crop.width, width);
    EXPECT_LE(crop.y + crop.height, height);
}

TEST(ViewportMapperTest, DoubleZoomCropsCenteredHalf) {
    const cv::Rect crop = compute_crop_rect(200, 100, 2.0f, PanOffset{});
    EXPECT_EQ(crop, cv::Rect(50, 25, 100, 50));
}

TEST(ViewportMapperTest, NeutralZoomCoversWholeImageWhateverThePan) {
    for (float pan : {-500.0f, -3.0f, 0.0f, 7.5f, 1000.0f}) {
        const cv::Rect crop = compute_crop_rect(320, 240, 1.0f, PanOffset{pan, -pan});
        EXPECT_EQ(crop, cv::Rect(0, 0, 320, 240)) << "pan " << pan;
    }
}

TEST(ViewportMapperTest, ZoomOutClampsToFullImage) {
    const cv::Rect crop = compute_crop_rect(64, 48, 0.5f, PanOffset{10.0f, 10.0f});
    EXPECT_EQ(crop, cv::Rect(0, 0, 64, 48));
}

TEST(ViewportMapperTest, PanMovesWindowOppositeToDrag) {
    // Dragging right reveals content further left
    const cv::Rect centered = compute_crop_rect(200, 100, 2.0f, PanOffset{});
    const cv::Rect dragged = compute_crop_rect(200, 100, 2.0f, PanOffset{20.0f, 0.0f});
    EXPECT_LT(dragged.x, centered.x);
    EXPECT_EQ(dragged.y, centered.y);
    EXPECT_EQ(dragged.size(), centered.size());
}

TEST(ViewportMapperTest, ExtremePanStaysInsideImage) {
    const cv::Rect left = compute_crop_rect(200, 100, 3.0f, PanOffset{1e9f, 1e9f});
    EXPECT_EQ(left.x, 0);
    EXPECT_EQ(left.y, 0);

    const cv::Rect right = compute_crop_rect(200, 100, 3.0f, PanOffset{-1e9f, -1e9f});
    expect_inside(right, 200, 100);
    EXPECT_EQ(right.x + right.width, 200);
    EXPECT_EQ(right.y + right.height, 100);

    const float nan = std::numeric_limits<float>::quiet_NaN();
    expect_inside(compute_crop_rect(200, 100, 2.0f, PanOffset{nan, nan}), 200, 100);
}

TEST(ViewportMapperTest, CropAlwaysInsideImage) {
    const cv::Size sizes[] = {{1, 1}, {3, 2}, {17, 91}, {640, 480}, {4000, 3}};
    const float zooms[] = {0.5f, 0.98f, 1.0f, 1.02f, 1.5f, 2.26f, 3.0f};
    const float pans[] = {-250.0f, -1.5f, 0.0f, 0.3f, 42.0f};

    for (const cv::Size& size : sizes) {
        for (float zoom : zooms) {
            for (float pan : pans) {
                const cv::Rect crop = compute_crop_rect(size, zoom, PanOffset{pan, pan * 0.5f});
                SCOPED_TRACE(testing::Message() << size.width << "x" << size.height << " zoom " << zoom << " pan " << pan);
                expect_inside(crop, size.width, size.height);
            }
        }
    }
}

TEST(ViewportMapperTest, RejectsInvalidInput) {
    EXPECT_THROW((void)compute_crop_rect(0, 10, 1.0f, PanOffset{}), std::invalid_argument);
    EXPECT_THROW((void)compute_crop_rect(10, -1, 1.0f, PanOffset{}), std::invalid_argument);
    EXPECT_THROW((void)compute_crop_rect(10, 10, 0.0f, PanOffset{}), std::invalid_argument);
    EXPECT_THROW((void)compute_crop_rect(10, 10, std::numeric_limits<float>::quiet_NaN(), PanOffset{}),
                 std::invalid_argument);
}

TEST(ViewportMapperTest, SliderMapping) {
    EXPECT_FLOAT_EQ(zoom_from_slider(kSliderNeutral), 1.0f);
    EXPECT_FLOAT_EQ(zoom_from_slider(kSliderMin), kMinZoom);
    EXPECT_FLOAT_EQ(zoom_from_slider(kSliderMax), kMaxZoom);
    EXPECT_FLOAT_EQ(zoom_from_slider(0), kMinZoom);
    EXPECT_FLOAT_EQ(zoom_from_slider(1000), kMaxZoom);

    EXPECT_EQ(slider_from_zoom(1.0f), kSliderNeutral);
    EXPECT_EQ(slider_from_zoom(2.0f), 100);
    EXPECT_EQ(slider_from_zoom(10.0f), kSliderMax);
    EXPECT_EQ(slider_from_zoom(0.1f), kSliderMin);
}

TEST(ViewportMapperTest, ClampZoom) {
    EXPECT_FLOAT_EQ(clamp_zoom(0.1f), kMinZoom);
    EXPECT_FLOAT_EQ(clamp_zoom(1.25f), 1.25f);
    EXPECT_FLOAT_EQ(clamp_zoom(9.0f), kMaxZoom);
}

}  // anonymous namespace
}  // namespace loupe
