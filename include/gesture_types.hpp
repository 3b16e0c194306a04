#pragma once

#include <cstddef>
#include <string>

namespace gesture {

// 2D landmark position (pixel or normalized units, consistent per session)
struct Point {
    float x;
    float y;

    Point() : x(0.0f), y(0.0f) {}
    Point(float x_, float y_) : x(x_), y(y_) {}

    // Squared distance to another point (no sqrt on the hot path)
    double distance_sq(const Point& other) const {
        const double dx = static_cast<double>(x) - other.x;
        const double dy = static_cast<double>(y) - other.y;
        return dx * dx + dy * dy;
    }
};

// Hand landmark indices (21 landmarks per hand)
enum class HandLandmark {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_FINGER_MCP = 5,
    INDEX_FINGER_PIP = 6,
    INDEX_FINGER_DIP = 7,
    INDEX_FINGER_TIP = 8,
    MIDDLE_FINGER_MCP = 9,
    MIDDLE_FINGER_PIP = 10,
    MIDDLE_FINGER_DIP = 11,
    MIDDLE_FINGER_TIP = 12,
    RING_FINGER_MCP = 13,
    RING_FINGER_PIP = 14,
    RING_FINGER_DIP = 15,
    RING_FINGER_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

constexpr std::size_t kNumLandmarks = 21;

constexpr std::size_t index_of(HandLandmark lm) {
    return static_cast<std::size_t>(lm);
}

// Control action sent to the target application
enum class Action {
    NONE,
    LEFT,
    RIGHT,
    UP,
    DOWN   // Roll (fist)
};

constexpr std::size_t kNumKeyActions = 4; // LEFT, RIGHT, UP, DOWN

std::string action_to_string(Action a);
Action string_to_action(const std::string& s);

// Stateless read of one frame: fist, pointing angle, or nothing usable
class RawGesture {
public:
    enum class Kind {
        ROLL,
        DIRECTION,
        AMBIGUOUS
    };

    static RawGesture roll() { return RawGesture(Kind::ROLL, 0.0); }
    static RawGesture direction(double angle_degrees) { return RawGesture(Kind::DIRECTION, angle_degrees); }
    static RawGesture ambiguous() { return RawGesture(Kind::AMBIGUOUS, 0.0); }

    Kind kind() const { return kind_; }
    bool is_roll() const { return kind_ == Kind::ROLL; }
    bool is_direction() const { return kind_ == Kind::DIRECTION; }
    bool is_ambiguous() const { return kind_ == Kind::AMBIGUOUS; }

    // Degrees in [0, 360); only meaningful for DIRECTION
    double angle() const { return angle_; }

    bool operator==(const RawGesture& other) const {
        return kind_ == other.kind_ && (kind_ != Kind::DIRECTION || angle_ == other.angle_);
    }
    bool operator!=(const RawGesture& other) const { return !(*this == other); }

private:
    RawGesture(Kind kind, double angle) : kind_(kind), angle_(angle) {}

    Kind kind_;
    double angle_;
};

std::string raw_gesture_to_string(const RawGesture& g);

} // namespace gesture
