/**
 * @file    interaction_throttle.cpp
 * @brief   Preview / final render gate for continuous input
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/interaction_throttle.hpp"

#include <spdlog/spdlog.h>

namespace loupe {

InteractionThrottle::InteractionThrottle(ThrottleConfig config)
    : m_config(config)
{
}

ThrottleDecision InteractionThrottle::on_move(InputSource source, Clock::time_point now) {
    if (m_phase == InteractionPhase::Quiescing) {
        spdlog::trace("Input resumed, pending final cancelled");
        m_deadline.reset();
    }

    m_phase = InteractionPhase::Dragging;
    m_source = source;

    if (m_last_trigger && now - *m_last_trigger < m_config.preview_interval) {
        return ThrottleDecision::None;
    }

    m_last_trigger = now;
    return ThrottleDecision::RenderPreview;
}

void InteractionThrottle::on_release(Clock::time_point now) {
    if (m_phase == InteractionPhase::Idle) {
        return;
    }

    m_phase = InteractionPhase::Quiescing;
    m_deadline = now + m_config.quiescence_delay;
}

ThrottleDecision InteractionThrottle::poll(Clock::time_point now) {
    if (m_phase != InteractionPhase::Quiescing || !m_deadline || now < *m_deadline) {
        return ThrottleDecision::None;
    }

    m_phase = InteractionPhase::Idle;
    m_source.reset();
    m_deadline.reset();
    return ThrottleDecision::RenderFinal;
}

ThrottleDecision InteractionThrottle::on_algorithm_changed() const noexcept {
    return m_phase == InteractionPhase::Idle ? ThrottleDecision::RenderFinal : ThrottleDecision::None;
}

void InteractionThrottle::reset() noexcept {
    m_phase = InteractionPhase::Idle;
    m_source.reset();
    m_last_trigger.reset();
    m_deadline.reset();
}

}  // namespace loupe
