#pragma once

#include "gesture_config.hpp"
#include "gesture_types.hpp"
#include <array>
#include <cstdint>

namespace gesture {

// Session state owned by the stabilizer. Created at session start, mutated
// only by GestureStabilizer::update().
struct StabilizerState {
    Action last_stable_direction{Action::NONE};

    // Per-action time of last emission (LEFT, RIGHT, UP, DOWN).
    // -infinity means "never".
    std::array<double, kNumKeyActions> last_emitted_time;

    // Streak of identical raw candidates, for min_confidence_frames
    Action pending_candidate{Action::NONE};
    int pending_frames{0};

    StabilizerState();
    void reset();

    double last_emitted(Action a) const;
};

// Debouncing statistics
struct StabilizerStats {
    uint64_t frames_evaluated{0};
    uint64_t events_emitted{0};
    uint64_t frames_held{0};            // Candidate replaced by the stable action
    uint64_t suppressed_by_cooldown{0};

    void reset() noexcept {
        frames_evaluated = 0;
        events_emitted = 0;
        frames_held = 0;
        suppressed_by_cooldown = 0;
    }
};

// Turns per-frame candidates into a stable, rate-limited action stream.
//
// Hysteresis: a new non-neutral candidate is adopted at once (after
// min_confidence_frames identical candidates when that is > 1). A neutral
// candidate never drops the stable action; the stable action is used instead.
//
// Cooldown: an action is emitted only if more than cooldown_seconds have
// passed since that same action was last emitted. Each action has its own
// clock. NONE is never emitted and never touches a clock.
class GestureStabilizer {
public:
    GestureStabilizer();
    explicit GestureStabilizer(const GestureConfig& config);

    // Returns the emitted action for this frame, or NONE.
    // Throws InvalidInput for a non-finite timestamp (state untouched).
    Action update(Action candidate, double now);

    // Back to session start
    void reset();

    Action stable_action() const { return state_.last_stable_direction; }
    const StabilizerState& state() const { return state_; }
    const StabilizerStats& get_stats() const { return stats_; }
    void reset_stats() { stats_.reset(); }

    const GestureConfig& get_config() const { return config_; }

private:
    GestureConfig config_;
    StabilizerState state_;
    StabilizerStats stats_;

    Action apply_hysteresis(Action candidate);
};

} // namespace gesture
