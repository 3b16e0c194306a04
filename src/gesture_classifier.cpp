#include "gesture_classifier.hpp"
#include "gesture_errors.hpp"
#include <cmath>
#include <string>

namespace gesture
{

    namespace
    {
        constexpr double kPi = 3.14159265358979323846;
        constexpr double kRadToDeg = 180.0 / kPi;

        // (tip, pip) pairs for index, middle, ring, pinky. The thumb is not used.
        constexpr HandLandmark kFingerPairs[4][2] = {
            {HandLandmark::INDEX_FINGER_TIP, HandLandmark::INDEX_FINGER_PIP},
            {HandLandmark::MIDDLE_FINGER_TIP, HandLandmark::MIDDLE_FINGER_PIP},
            {HandLandmark::RING_FINGER_TIP, HandLandmark::RING_FINGER_PIP},
            {HandLandmark::PINKY_TIP, HandLandmark::PINKY_PIP},
        };
    } // namespace

    GestureClassifier::GestureClassifier() : GestureClassifier(GestureConfig()) {}

    GestureClassifier::GestureClassifier(const GestureConfig &config)
        : config_(config), stability_distance_sq_(0.0)
    {
        config_.require_valid();
        stability_distance_sq_ = config_.stability_distance * config_.stability_distance;
    }

    void GestureClassifier::check_landmarks(const std::vector<Point> &landmarks)
    {
        if (landmarks.size() != kNumLandmarks)
        {
            throw InvalidInput("[Classifier] Expected 21 landmarks, got " +
                               std::to_string(landmarks.size()));
        }
        for (size_t i = 0; i < landmarks.size(); ++i)
        {
            if (!std::isfinite(landmarks[i].x) || !std::isfinite(landmarks[i].y))
            {
                throw InvalidInput("[Classifier] Non-finite coordinate at landmark " +
                                   std::to_string(i));
            }
        }
    }

    int GestureClassifier::count_extended_fingers(const std::vector<Point> &landmarks)
    {
        const Point &wrist = landmarks[index_of(HandLandmark::WRIST)];

        int extended = 0;
        for (const auto &pair : kFingerPairs)
        {
            const double tip_dist_sq = wrist.distance_sq(landmarks[index_of(pair[0])]);
            const double pip_dist_sq = wrist.distance_sq(landmarks[index_of(pair[1])]);
            if (tip_dist_sq > pip_dist_sq)
                ++extended;
        }
        return extended;
    }

    bool GestureClassifier::is_roll_gesture(const std::vector<Point> &landmarks)
    {
        return count_extended_fingers(landmarks) <= constants::kMaxExtendedFingersForRoll;
    }

    double GestureClassifier::normalize_angle(double degrees)
    {
        double a = std::fmod(degrees, 360.0);
        if (a < 0.0)
            a += 360.0;
        // -tiny + 360 rounds up to 360
        if (a >= 360.0)
            a = 0.0;
        return a;
    }

    RawGesture GestureClassifier::classify(const std::vector<Point> &landmarks) const
    {
        check_landmarks(landmarks);

        // A closed fist overrides any apparent pointing angle
        if (is_roll_gesture(landmarks))
            return RawGesture::roll();

        const Point &wrist = landmarks[index_of(HandLandmark::WRIST)];
        const Point &index_tip = landmarks[index_of(HandLandmark::INDEX_FINGER_TIP)];
        const Point &middle_tip = landmarks[index_of(HandLandmark::MIDDLE_FINGER_TIP)];

        const double mid_x = (static_cast<double>(index_tip.x) + middle_tip.x) / 2.0;
        const double mid_y = (static_cast<double>(index_tip.y) + middle_tip.y) / 2.0;
        const double dx = mid_x - wrist.x;
        const double dy = mid_y - wrist.y;

        if (dx * dx + dy * dy < stability_distance_sq_)
            return RawGesture::ambiguous();

        // Image y grows downwards; screen-up is 90 degrees
        return RawGesture::direction(normalize_angle(std::atan2(-dy, dx) * kRadToDeg));
    }

    // DirectionBands implementation
    DirectionBands::DirectionBands(double threshold_degrees) : threshold_(threshold_degrees)
    {
        GestureConfig check;
        check.angular_threshold_degrees = threshold_degrees;
        check.require_valid();
    }

    Action DirectionBands::map_angle(double angle_degrees) const
    {
        if (!std::isfinite(angle_degrees))
            return Action::NONE;

        const double angle = GestureClassifier::normalize_angle(angle_degrees);

        if (angle <= threshold_ || angle >= 360.0 - threshold_)
            return Action::RIGHT;
        if (angle >= 90.0 - threshold_ && angle <= 90.0 + threshold_)
            return Action::UP;
        if (angle >= 180.0 - threshold_ && angle <= 180.0 + threshold_)
            return Action::LEFT;
        return Action::NONE;
    }

    Action DirectionBands::to_candidate(const RawGesture &raw) const
    {
        switch (raw.kind())
        {
        case RawGesture::Kind::ROLL:
            return Action::DOWN;
        case RawGesture::Kind::DIRECTION:
            return map_angle(raw.angle());
        case RawGesture::Kind::AMBIGUOUS:
            return Action::NONE;
        }
        return Action::NONE;
    }

} // namespace gesture
