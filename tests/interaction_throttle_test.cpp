/**
 * @file    interaction_throttle_test.cpp
 * @brief   Preview pacing and quiescence timer
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/interaction_throttle.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace loupe {
namespace {

using namespace std::chrono_literals;

class InteractionThrottleTest : public testing::Test {
protected:
    InteractionThrottle m_throttle{ThrottleConfig{300ms, 300ms}};
    Clock::time_point m_t0{Clock::time_point{} + 10s};
};

TEST_F(InteractionThrottleTest, FirstMoveTriggersPreview) {
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Idle);
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0), ThrottleDecision::RenderPreview);
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Dragging);
    EXPECT_TRUE(m_throttle.gesture_active());
    EXPECT_EQ(m_throttle.active_source(), InputSource::Slider);
}

TEST_F(InteractionThrottleTest, MovesInsideWindowAreCoalesced) {
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0), ThrottleDecision::RenderPreview);
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0 + 100ms), ThrottleDecision::None);
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0 + 299ms), ThrottleDecision::None);
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0 + 300ms), ThrottleDecision::RenderPreview);
}

TEST_F(InteractionThrottleTest, PreviewCountIsBoundedByInterval) {
    constexpr int kEvents = 100;
    constexpr auto kStep = 16ms;

    int previews = 0;
    for (int i = 0; i < kEvents; ++i) {
        if (m_throttle.on_move(InputSource::Pointer, m_t0 + i * kStep) == ThrottleDecision::RenderPreview) {
            ++previews;
        }
    }

    // 100 moves over 1.6 s at a 300 ms window
    const auto span = kEvents * kStep;
    const int bound = static_cast<int>((span + 300ms - 1ms) / 300ms);
    EXPECT_LE(previews, bound);
    EXPECT_GE(previews, 1);
}

TEST_F(InteractionThrottleTest, ExactlyOneFinalAfterQuiescence) {
    (void)m_throttle.on_move(InputSource::Slider, m_t0);
    m_throttle.on_release(m_t0 + 50ms);
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Quiescing);
    EXPECT_TRUE(m_throttle.gesture_active());

    EXPECT_EQ(m_throttle.poll(m_t0 + 200ms), ThrottleDecision::None);
    EXPECT_EQ(m_throttle.poll(m_t0 + 349ms), ThrottleDecision::None);
    EXPECT_EQ(m_throttle.poll(m_t0 + 350ms), ThrottleDecision::RenderFinal);
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Idle);

    EXPECT_EQ(m_throttle.poll(m_t0 + 400ms), ThrottleDecision::None);
    EXPECT_EQ(m_throttle.poll(m_t0 + 10s), ThrottleDecision::None);
}

TEST_F(InteractionThrottleTest, MoveDuringQuiescenceCancelsFinal) {
    (void)m_throttle.on_move(InputSource::Slider, m_t0);
    m_throttle.on_release(m_t0 + 10ms);
    ASSERT_TRUE(m_throttle.deadline().has_value());

    (void)m_throttle.on_move(InputSource::Slider, m_t0 + 200ms);
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Dragging);
    EXPECT_FALSE(m_throttle.deadline().has_value());
    EXPECT_EQ(m_throttle.poll(m_t0 + 1s), ThrottleDecision::None);

    m_throttle.on_release(m_t0 + 1s);
    EXPECT_EQ(m_throttle.poll(m_t0 + 1s + 300ms), ThrottleDecision::RenderFinal);
}

TEST_F(InteractionThrottleTest, ReleaseWhileIdleIsIgnored) {
    m_throttle.on_release(m_t0);
    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(m_throttle.deadline().has_value());
    EXPECT_EQ(m_throttle.poll(m_t0 + 1s), ThrottleDecision::None);
}

TEST_F(InteractionThrottleTest, AlgorithmChangeRendersOnlyWhenIdle) {
    EXPECT_EQ(m_throttle.on_algorithm_changed(), ThrottleDecision::RenderFinal);

    (void)m_throttle.on_move(InputSource::Pointer, m_t0);
    EXPECT_EQ(m_throttle.on_algorithm_changed(), ThrottleDecision::None);

    m_throttle.on_release(m_t0);
    EXPECT_EQ(m_throttle.on_algorithm_changed(), ThrottleDecision::None);
}

TEST_F(InteractionThrottleTest, ResetForgetsHistory) {
    (void)m_throttle.on_move(InputSource::Slider, m_t0);
    m_throttle.reset();

    EXPECT_EQ(m_throttle.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(m_throttle.last_trigger().has_value());
    EXPECT_FALSE(m_throttle.active_source().has_value());

    // No interval carried over from the previous image
    EXPECT_EQ(m_throttle.on_move(InputSource::Slider, m_t0 + 1ms), ThrottleDecision::RenderPreview);
}

}  // anonymous namespace
}  // namespace loupe
