#include "gesture_controller.hpp"
#include "gesture_errors.hpp"
#include <chrono>
#include <iostream>

using namespace std::chrono;

namespace controller
{

    uint64_t ControllerStats::total_emitted() const
    {
        uint64_t total = 0;
        for (uint64_t n : emitted)
            total += n;
        return total;
    }

    uint64_t ControllerStats::emitted_count(gesture::Action a) const
    {
        if (a == gesture::Action::NONE)
            return 0;
        return emitted[static_cast<size_t>(a) - static_cast<size_t>(gesture::Action::LEFT)];
    }

    GestureController::GestureController(const gesture::GestureConfig &gesture_cfg,
                                         const ControllerConfig &cfg,
                                         keys::KeySender &sender)
        : config_(cfg),
          classifier_(gesture_cfg),
          bands_(gesture_cfg.angular_threshold_degrees),
          stabilizer_(gesture_cfg),
          sender_(sender),
          last_raw_(gesture::RawGesture::ambiguous())
    {
        if (config_.skip_frames < 0)
            throw gesture::ConfigurationError("[Controller] skip_frames must be >= 0");

        if (config_.verbose)
        {
            std::cerr << "[Controller] Initialized\n";
            std::cerr << "  Angular threshold: " << gesture_cfg.angular_threshold_degrees << " deg\n";
            std::cerr << "  Stability distance: " << gesture_cfg.stability_distance << "\n";
            std::cerr << "  Cooldown: " << gesture_cfg.cooldown_seconds * 1000.0 << " ms\n";
            std::cerr << "  Min confidence frames: " << gesture_cfg.min_confidence_frames << "\n";
            std::cerr << "  Skip frames: " << config_.skip_frames << "\n";
            std::cerr << "  Key sender: " << sender_.name() << "\n";
        }
    }

    void GestureController::reset_stats()
    {
        stats_.reset();
        stabilizer_.reset_stats();
    }

    gesture::RawGesture GestureController::read_gesture(const landmarks::LandmarkFrame &frame)
    {
        if (!frame.has_hand)
        {
            ++stats_.frames_without_hand;
            return gesture::RawGesture::ambiguous();
        }

        try
        {
            return classifier_.classify(frame.landmarks);
        }
        catch (const gesture::InvalidInput &e)
        {
            // A bad frame counts as "no hand", the loop keeps going
            ++stats_.invalid_frames;
            if (config_.verbose)
                std::cerr << e.what() << "\n";
            return gesture::RawGesture::ambiguous();
        }
    }

    gesture::Action GestureController::process(const landmarks::LandmarkFrame &frame)
    {
        ++stats_.frames_received;

        if (config_.skip_frames > 0 &&
            stats_.frames_received % (static_cast<uint64_t>(config_.skip_frames) + 1) != 0)
        {
            ++stats_.frames_skipped;
            return gesture::Action::NONE;
        }

        auto t0 = steady_clock::now();

        last_raw_ = read_gesture(frame);
        const gesture::Action candidate = bands_.to_candidate(last_raw_);

        gesture::Action emitted = gesture::Action::NONE;
        try
        {
            emitted = stabilizer_.update(candidate, frame.timestamp);
        }
        catch (const gesture::InvalidInput &e)
        {
            ++stats_.invalid_frames;
            if (config_.verbose)
                std::cerr << e.what() << "\n";
            return gesture::Action::NONE;
        }

        ++stats_.frames_evaluated;

        if (config_.verbose)
        {
            std::cerr << "[Controller] t=" << frame.timestamp
                      << " raw=" << gesture::raw_gesture_to_string(last_raw_)
                      << " candidate=" << gesture::action_to_string(candidate)
                      << " stable=" << gesture::action_to_string(stabilizer_.stable_action())
                      << " emit=" << gesture::action_to_string(emitted) << "\n";
        }

        if (emitted != gesture::Action::NONE)
        {
            stats_.emitted[static_cast<size_t>(emitted) - static_cast<size_t>(gesture::Action::LEFT)]++;
            if (!sender_.send(emitted))
            {
                ++stats_.send_failures;
                std::cerr << "[Controller] Error sending key: " << gesture::action_to_string(emitted) << "\n";
            }
        }

        double elapsed_ms = duration<double, std::milli>(steady_clock::now() - t0).count();
        stats_.avg_process_time_ms +=
            (elapsed_ms - stats_.avg_process_time_ms) / static_cast<double>(stats_.frames_evaluated);

        return emitted;
    }

    size_t GestureController::run(landmarks::LandmarkReader &reader)
    {
        running_ = true;
        size_t frames = 0;
        landmarks::LandmarkFrame frame;
        while (running_ && reader.next(frame))
        {
            process(frame);
            ++frames;
        }
        running_ = false;

        if (config_.verbose)
            std::cerr << "[Controller] Stopped after " << frames << " frames\n";
        return frames;
    }

} // namespace controller
