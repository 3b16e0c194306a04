#include "gesture_stabilizer.hpp"
#include "gesture_errors.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace gesture
{

    namespace
    {
        size_t slot_of(Action a)
        {
            return static_cast<size_t>(a) - static_cast<size_t>(Action::LEFT);
        }
    } // namespace

    StabilizerState::StabilizerState()
    {
        reset();
    }

    void StabilizerState::reset()
    {
        last_stable_direction = Action::NONE;
        last_emitted_time.fill(-std::numeric_limits<double>::infinity());
        pending_candidate = Action::NONE;
        pending_frames = 0;
    }

    double StabilizerState::last_emitted(Action a) const
    {
        if (a == Action::NONE)
            return -std::numeric_limits<double>::infinity();
        return last_emitted_time[slot_of(a)];
    }

    GestureStabilizer::GestureStabilizer() : GestureStabilizer(GestureConfig()) {}

    GestureStabilizer::GestureStabilizer(const GestureConfig &config) : config_(config)
    {
        config_.require_valid();
    }

    void GestureStabilizer::reset()
    {
        state_.reset();
        if (config_.verbose)
            std::cerr << "[Stabilizer] State reset\n";
    }

    Action GestureStabilizer::apply_hysteresis(Action candidate)
    {
        if (candidate == state_.pending_candidate)
        {
            // Saturates once the streak confirms
            if (state_.pending_frames < config_.min_confidence_frames)
                ++state_.pending_frames;
        }
        else
        {
            state_.pending_candidate = candidate;
            state_.pending_frames = 1;
        }

        if (candidate == state_.last_stable_direction)
            return candidate;

        if (candidate != Action::NONE &&
            state_.pending_frames >= config_.min_confidence_frames)
        {
            if (config_.verbose)
            {
                std::cerr << "[Stabilizer] Stable action: " << action_to_string(state_.last_stable_direction)
                          << " -> " << action_to_string(candidate) << "\n";
            }
            state_.last_stable_direction = candidate;
            return candidate;
        }

        // Neutral or unconfirmed candidate: hold the stable action (may be NONE)
        if (state_.last_stable_direction != Action::NONE)
            ++stats_.frames_held;
        return state_.last_stable_direction;
    }

    Action GestureStabilizer::update(Action candidate, double now)
    {
        if (!std::isfinite(now))
            throw InvalidInput("[Stabilizer] Non-finite timestamp");

        ++stats_.frames_evaluated;

        const Action decided = apply_hysteresis(candidate);
        if (decided == Action::NONE)
            return Action::NONE;

        double &last = state_.last_emitted_time[slot_of(decided)];
        if (now - last > config_.cooldown_seconds)
        {
            last = now;
            ++stats_.events_emitted;
            return decided;
        }

        ++stats_.suppressed_by_cooldown;
        return Action::NONE;
    }

} // namespace gesture
