#include "synthetic_hand.hpp"
#include <cmath>

namespace landmarks
{

    using gesture::HandLandmark;
    using gesture::Point;

    namespace
    {
        constexpr double kPi = 3.14159265358979323846;
        constexpr double kDegToRad = kPi / 180.0;

        // Joint positions along the finger, as a fraction of finger_length
        constexpr float kMcp = 0.45f;
        constexpr float kPip = 0.65f;
        constexpr float kDip = 0.82f;
        constexpr float kCurledDip = 0.55f;
        constexpr float kCurledTip = 0.40f;

        // Index and middle straddle the pointing axis so their tip midpoint lies on it
        constexpr float kLateral[4] = {-0.5f, 0.5f, 1.5f, 2.5f};

        constexpr HandLandmark kFingerBase[4] = {
            HandLandmark::INDEX_FINGER_MCP,
            HandLandmark::MIDDLE_FINGER_MCP,
            HandLandmark::RING_FINGER_MCP,
            HandLandmark::PINKY_MCP,
        };
    } // namespace

    std::vector<Point> SyntheticHand::build() const
    {
        // Unit vectors in image coordinates (y grows downwards)
        const double rad = angle_degrees * kDegToRad;
        const double ux = std::cos(rad);
        const double uy = -std::sin(rad);
        const double px = -uy;
        const double py = ux;

        auto at = [&](float along, float lateral) {
            const double a = along * finger_length;
            const double l = lateral * finger_spread;
            return Point(static_cast<float>(wrist.x + ux * a + px * l),
                         static_cast<float>(wrist.y + uy * a + py * l));
        };

        std::vector<Point> pts(gesture::kNumLandmarks);
        pts[gesture::index_of(HandLandmark::WRIST)] = wrist;

        // Thumb on the opposite side of the index finger
        pts[gesture::index_of(HandLandmark::THUMB_CMC)] = at(0.15f, -1.5f);
        pts[gesture::index_of(HandLandmark::THUMB_MCP)] = at(0.30f, -2.2f);
        pts[gesture::index_of(HandLandmark::THUMB_IP)] = at(0.42f, -2.8f);
        pts[gesture::index_of(HandLandmark::THUMB_TIP)] = at(0.52f, -3.2f);

        for (int f = 0; f < 4; ++f)
        {
            const size_t base = gesture::index_of(kFingerBase[f]);
            const bool extended = f < extended_fingers;
            const float lat = kLateral[f];
            pts[base] = at(kMcp, lat);
            pts[base + 1] = at(kPip, lat);
            pts[base + 2] = at(extended ? kDip : kCurledDip, lat);
            pts[base + 3] = at(extended ? 1.0f : kCurledTip, lat);
        }
        return pts;
    }

    SyntheticHand SyntheticHand::pointing(double angle_degrees)
    {
        SyntheticHand h;
        h.angle_degrees = angle_degrees;
        return h;
    }

    SyntheticHand SyntheticHand::fist()
    {
        SyntheticHand h;
        h.angle_degrees = 90.0;
        h.extended_fingers = 0;
        return h;
    }

    std::vector<Point> rotate_points(const std::vector<Point> &points, double degrees)
    {
        // Counter-clockwise on screen is clockwise in image coordinates
        const double rad = degrees * kDegToRad;
        const double c = std::cos(rad);
        const double s = std::sin(rad);
        std::vector<Point> out;
        out.reserve(points.size());
        for (const auto &p : points)
        {
            out.emplace_back(static_cast<float>(p.x * c + p.y * s),
                             static_cast<float>(-p.x * s + p.y * c));
        }
        return out;
    }

    std::vector<Point> translate_points(const std::vector<Point> &points, float dx, float dy)
    {
        std::vector<Point> out;
        out.reserve(points.size());
        for (const auto &p : points)
            out.emplace_back(p.x + dx, p.y + dy);
        return out;
    }

} // namespace landmarks
