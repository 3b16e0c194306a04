// synth_landmarks.cpp
// Writes a synthetic landmark stream (one JSON frame per line) for replay
// through handkeys.
// Usage: synth_landmarks [--fps <n>] [--wrist <x> <y>] <script>
//   script: comma separated <gesture>:<frames>, gesture one of
//           left, right, up, down, fist, flat, none
//   e.g.    synth_landmarks right:10,fist:5,none:3,left:10 | handkeys

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "landmark_reader.hpp"
#include "synthetic_hand.hpp"

struct Segment
{
    std::string gesture;
    int frames;
};

static bool parse_script(const std::string &script, std::vector<Segment> &out)
{
    std::istringstream iss(script);
    std::string item;
    while (std::getline(iss, item, ','))
    {
        size_t colon = item.find(':');
        if (colon == std::string::npos)
        {
            std::cerr << "Missing frame count in segment: " << item << "\n";
            return false;
        }
        Segment seg;
        seg.gesture = item.substr(0, colon);
        try
        {
            seg.frames = std::stoi(item.substr(colon + 1));
        }
        catch (const std::exception &)
        {
            std::cerr << "Bad frame count in segment: " << item << "\n";
            return false;
        }
        if (seg.frames < 0)
        {
            std::cerr << "Negative frame count in segment: " << item << "\n";
            return false;
        }
        out.push_back(seg);
    }
    return !out.empty();
}

static bool make_frame(const std::string &gesture, const gesture::Point &wrist,
                       landmarks::LandmarkFrame &frame)
{
    landmarks::SyntheticHand hand;
    if (gesture == "none")
    {
        frame.has_hand = false;
        frame.landmarks.clear();
        return true;
    }
    if (gesture == "right")
        hand = landmarks::SyntheticHand::pointing(0.0);
    else if (gesture == "up")
        hand = landmarks::SyntheticHand::pointing(90.0);
    else if (gesture == "left")
        hand = landmarks::SyntheticHand::pointing(180.0);
    else if (gesture == "down")
        hand = landmarks::SyntheticHand::pointing(270.0);
    else if (gesture == "fist")
        hand = landmarks::SyntheticHand::fist();
    else if (gesture == "flat")
    {
        // Extended fingers, reach below the default stability distance
        hand = landmarks::SyntheticHand::pointing(90.0);
        hand.finger_length = 10.0f;
        hand.finger_spread = 1.0f;
    }
    else
    {
        std::cerr << "Unknown gesture: " << gesture << "\n";
        return false;
    }

    hand.wrist = wrist;
    frame.has_hand = true;
    frame.landmarks = hand.build();
    return true;
}

int main(int argc, char **argv)
{
    double fps = 30.0;
    gesture::Point wrist(80.0f, 60.0f);
    std::string script;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        try
        {
            if (arg == "--fps" && i + 1 < argc)
            {
                fps = std::stod(argv[++i]);
            }
            else if (arg == "--wrist" && i + 2 < argc)
            {
                wrist.x = std::stof(argv[++i]);
                wrist.y = std::stof(argv[++i]);
            }
            else
            {
                script = arg;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << "\n";
            return 2;
        }
    }

    if (script.empty() || fps <= 0.0)
    {
        std::cerr << "Usage: synth_landmarks [--fps <n>] [--wrist <x> <y>] <gesture:frames,...>\n";
        return 2;
    }

    std::vector<Segment> segments;
    if (!parse_script(script, segments))
        return 2;

    landmarks::LandmarkFrame frame;
    long index = 0;
    for (const auto &seg : segments)
    {
        for (int f = 0; f < seg.frames; ++f)
        {
            if (!make_frame(seg.gesture, wrist, frame))
                return 2;
            frame.timestamp = static_cast<double>(index) / fps;
            std::cout << landmarks::to_json_line(frame) << "\n";
            ++index;
        }
    }
    return 0;
}
