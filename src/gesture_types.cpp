#include "gesture_types.hpp"
#include <iomanip>
#include <sstream>

namespace gesture
{

    std::string action_to_string(Action a)
    {
        switch (a)
        {
        case Action::LEFT:
            return "left";
        case Action::RIGHT:
            return "right";
        case Action::UP:
            return "up";
        case Action::DOWN:
            return "down";
        default:
            return "none";
        }
    }

    Action string_to_action(const std::string &s)
    {
        if (s == "left")
            return Action::LEFT;
        if (s == "right")
            return Action::RIGHT;
        if (s == "up")
            return Action::UP;
        if (s == "down")
            return Action::DOWN;
        return Action::NONE;
    }

    std::string raw_gesture_to_string(const RawGesture &g)
    {
        switch (g.kind())
        {
        case RawGesture::Kind::ROLL:
            return "roll";
        case RawGesture::Kind::DIRECTION:
        {
            std::ostringstream oss;
            oss << "direction(" << std::fixed << std::setprecision(1) << g.angle() << ")";
            return oss.str();
        }
        case RawGesture::Kind::AMBIGUOUS:
            return "ambiguous";
        }
        return "ambiguous";
    }

} // namespace gesture
