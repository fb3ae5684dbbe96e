/**
 * @file    interaction_throttle.hpp
 * @brief   Preview / final render gate for continuous input
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * State machine:
 *
 *   Idle ----move----> Dragging ----release----> Quiescing
 *                        ^  |                       |
 *                        |  +-- move (throttled)    |
 *                        +-------- move ------------+
 *   Quiescing --poll(now >= deadline)--> Idle  (fires one Final)
 *
 * While dragging, a move triggers a Preview only if at least
 * preview_interval has passed since the last accepted trigger; otherwise
 * the new value is kept but the render is coalesced. Releasing starts the
 * quiescence timer; the Final fires once it expires without new input.
 *
 * All time is passed in by the caller so the gate can be driven by a
 * synthetic clock.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace loupe {

using Clock = std::chrono::steady_clock;

enum class InteractionPhase {
    Idle,
    Dragging,
    Quiescing
};

[[nodiscard]] constexpr std::string_view to_string(InteractionPhase phase) noexcept {
    switch (phase) {
        case InteractionPhase::Idle:      return "Idle";
        case InteractionPhase::Dragging:  return "Dragging";
        case InteractionPhase::Quiescing: return "Quiescing";
        default:                          return "Unknown";
    }
}

/**
 * Origin of a continuous input stream
 */
enum class InputSource {
    Slider,
    Pointer
};

/**
 * What the caller should do after feeding an event
 */
enum class ThrottleDecision {
    None,
    RenderPreview,
    RenderFinal
};

struct ThrottleConfig {
    std::chrono::milliseconds preview_interval{300};
    std::chrono::milliseconds quiescence_delay{300};
};

class InteractionThrottle {
public:
    explicit InteractionThrottle(ThrottleConfig config = {});

    /**
     * Slider or pointer moved
     * @return  RenderPreview if the throttle window allows it, None if coalesced
     */
    [[nodiscard]] ThrottleDecision on_move(InputSource source, Clock::time_point now);

    /**
     * Slider or pointer button released; arms the quiescence timer
     * Ignored while Idle.
     */
    void on_release(Clock::time_point now);

    /**
     * Check the quiescence timer
     * @return  RenderFinal exactly once when the deadline has passed
     */
    [[nodiscard]] ThrottleDecision poll(Clock::time_point now);

    /**
     * Resampling algorithm changed by the user
     * @return  RenderFinal when Idle, None during a gesture
     */
    [[nodiscard]] ThrottleDecision on_algorithm_changed() const noexcept;

    /**
     * Back to Idle with no trigger history (new image)
     */
    void reset() noexcept;

    [[nodiscard]] InteractionPhase phase() const noexcept { return m_phase; }

    /**
     * True from the first move until the Final fires (Dragging or Quiescing)
     */
    [[nodiscard]] bool gesture_active() const noexcept { return m_phase != InteractionPhase::Idle; }

    [[nodiscard]] std::optional<InputSource> active_source() const noexcept { return m_source; }
    [[nodiscard]] std::optional<Clock::time_point> last_trigger() const noexcept { return m_last_trigger; }
    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return m_deadline; }
    [[nodiscard]] const ThrottleConfig& config() const noexcept { return m_config; }

private:
    ThrottleConfig m_config;
    InteractionPhase m_phase{InteractionPhase::Idle};
    std::optional<InputSource> m_source;
    std::optional<Clock::time_point> m_last_trigger;   // Last accepted Preview trigger
    std::optional<Clock::time_point> m_deadline;       // Pending Final while Quiescing
};

}  // namespace loupe
