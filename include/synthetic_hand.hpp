#pragma once

#include "gesture_types.hpp"
#include <vector>

namespace landmarks {

// Builds plausible 21-point hands for tests and recorded-stream generation
struct SyntheticHand {
    gesture::Point wrist{50.0f, 50.0f};
    double angle_degrees{0.0};   // Pointing direction, 90 = screen-up
    float finger_length{60.0f};  // Wrist to extended fingertip
    float finger_spread{6.0f};   // Lateral gap between neighbouring fingers
    int extended_fingers{4};     // Index, middle, ring, pinky in that order

    std::vector<gesture::Point> build() const;

    static SyntheticHand pointing(double angle_degrees);
    static SyntheticHand fist();
};

// Rotates every point about the origin (degrees, screen convention)
std::vector<gesture::Point> rotate_points(const std::vector<gesture::Point>& points,
                                          double degrees);

// Shifts every point by (dx, dy)
std::vector<gesture::Point> translate_points(const std::vector<gesture::Point>& points,
                                             float dx, float dy);

} // namespace landmarks
