#include "landmark_reader.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

namespace landmarks
{

    using json = nlohmann::json;

    namespace
    {
        // Non-numeric points become NaN so the classifier rejects the frame
        gesture::Point point_from_json(const json &p)
        {
            const float nan = std::numeric_limits<float>::quiet_NaN();
            if (!p.is_array() || p.size() < 2 || !p[0].is_number() || !p[1].is_number())
                return gesture::Point(nan, nan);
            return gesture::Point(p[0].get<float>(), p[1].get<float>());
        }

        const json *find_landmark_list(const json &j)
        {
            auto it = j.find("landmarks");
            if (it != j.end())
                return &(*it);

            it = j.find("hands");
            if (it != j.end() && it->is_array() && !it->empty())
            {
                const json &hand = (*it)[0];
                if (hand.is_object())
                {
                    auto lm = hand.find("lmList");
                    if (lm != hand.end())
                        return &(*lm);
                }
            }
            return nullptr;
        }
    } // namespace

    LandmarkReader::LandmarkReader(std::istream &in, bool verbose)
        : in_(in), verbose_(verbose), start_(std::chrono::steady_clock::now())
    {
    }

    double LandmarkReader::clock_seconds() const
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

    bool LandmarkReader::parse_line(const std::string &line, LandmarkFrame &frame)
    {
        json j;
        try
        {
            j = json::parse(line);
        }
        catch (const json::parse_error &e)
        {
            std::cerr << "[LandmarkReader] JSON parse error at line " << stats_.lines_read
                      << ": " << e.what() << "\n";
            return false;
        }

        if (!j.is_object())
        {
            std::cerr << "[LandmarkReader] Line " << stats_.lines_read << " is not a JSON object\n";
            return false;
        }

        auto t = j.find("t");
        if (t != j.end() && t->is_number())
            frame.timestamp = t->get<double>();
        else
            frame.timestamp = clock_seconds();

        const json *list = find_landmark_list(j);
        if (list && list->is_array() && !list->empty())
        {
            frame.has_hand = true;
            frame.landmarks.reserve(list->size());
            for (const auto &p : *list)
                frame.landmarks.push_back(point_from_json(p));
        }
        else if (list && !list->is_null() && !list->is_array())
        {
            // Present but not a list: hand reported, landmarks unusable
            frame.has_hand = true;
        }
        return true;
    }

    bool LandmarkReader::next(LandmarkFrame &frame)
    {
        std::string line;
        while (std::getline(in_, line))
        {
            ++stats_.lines_read;

            size_t start = line.find_first_not_of(" \t\r");
            if (start == std::string::npos || line[start] == '#')
                continue;

            frame = LandmarkFrame();
            if (!parse_line(line, frame))
            {
                ++stats_.malformed_lines;
                frame = LandmarkFrame();
                frame.timestamp = last_timestamp_;
            }
            else if (verbose_ && frame.has_hand && frame.landmarks.size() != gesture::kNumLandmarks)
            {
                std::cerr << "[LandmarkReader] Line " << stats_.lines_read << " has "
                          << frame.landmarks.size() << " landmarks\n";
            }

            last_timestamp_ = frame.timestamp;
            ++stats_.frames_delivered;
            return true;
        }
        return false;
    }

    std::string to_json_line(const LandmarkFrame &frame)
    {
        json j;
        j["t"] = frame.timestamp;
        if (frame.has_hand)
        {
            j["landmarks"] = json::array();
            for (const auto &p : frame.landmarks)
                j["landmarks"].push_back(json::array({p.x, p.y}));
        }
        else
        {
            j["landmarks"] = nullptr;
        }
        return j.dump();
    }

} // namespace landmarks
