#pragma once

#include "gesture_config.hpp"
#include "gesture_types.hpp"
#include <vector>

namespace gesture {

// Maps one frame of hand landmarks to a raw gesture.
// Pure: no state survives between calls and the input is never retained.
class GestureClassifier {
public:
    GestureClassifier();
    explicit GestureClassifier(const GestureConfig& config);

    // Roll for a closed hand, pointing angle for an open one, Ambiguous when
    // the fingertips are too close to the wrist to read a direction.
    // Throws InvalidInput for a landmark count other than 21 or non-finite
    // coordinates.
    RawGesture classify(const std::vector<Point>& landmarks) const;

    // Number of non-thumb fingers whose tip is farther from the wrist than
    // its PIP joint (0-4). Expects a validated landmark set.
    static int count_extended_fingers(const std::vector<Point>& landmarks);

    static bool is_roll_gesture(const std::vector<Point>& landmarks);

    // Any finite angle into [0, 360)
    static double normalize_angle(double degrees);

    const GestureConfig& get_config() const { return config_; }

private:
    GestureConfig config_;
    double stability_distance_sq_;

    static void check_landmarks(const std::vector<Point>& landmarks);
};

// Threshold-band policy, kept apart from the geometry above.
// Three disjoint bands centred on 0 (right), 90 (up) and 180 (left) degrees.
// There is no "down" band: DOWN is only reachable through the fist.
class DirectionBands {
public:
    // Throws ConfigurationError unless 0 < threshold < 45
    explicit DirectionBands(double threshold_degrees = constants::kDefaultAngularThreshold);

    Action map_angle(double angle_degrees) const;

    // Roll -> DOWN, Direction -> band lookup, Ambiguous -> NONE
    Action to_candidate(const RawGesture& raw) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

} // namespace gesture
