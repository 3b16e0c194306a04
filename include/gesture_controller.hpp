#pragma once

#include "gesture_classifier.hpp"
#include "gesture_config.hpp"
#include "gesture_stabilizer.hpp"
#include "key_sender.hpp"
#include "landmark_reader.hpp"
#include <array>
#include <atomic>
#include <cstdint>

namespace controller
{

    struct ControllerConfig
    {
        int skip_frames = 0;   // Evaluate every (skip_frames + 1)-th frame
        bool verbose = false;
    };

    struct ControllerStats
    {
        uint64_t frames_received{0};
        uint64_t frames_evaluated{0};
        uint64_t frames_skipped{0};
        uint64_t frames_without_hand{0};
        uint64_t invalid_frames{0};
        uint64_t send_failures{0};
        std::array<uint64_t, gesture::kNumKeyActions> emitted{}; // LEFT, RIGHT, UP, DOWN
        double avg_process_time_ms{0.0};

        uint64_t total_emitted() const;
        uint64_t emitted_count(gesture::Action a) const;

        void reset() noexcept
        {
            frames_received = 0;
            frames_evaluated = 0;
            frames_skipped = 0;
            frames_without_hand = 0;
            invalid_frames = 0;
            send_failures = 0;
            emitted.fill(0);
            avg_process_time_ms = 0.0;
        }
    };

    // One evaluation path per frame: landmarks -> classifier -> bands ->
    // stabilizer -> key sender. Single-threaded; stop() may be called from
    // another thread or a signal handler.
    class GestureController
    {
    public:
        // Throws gesture::ConfigurationError for invalid configuration
        GestureController(const gesture::GestureConfig &gesture_cfg,
                          const ControllerConfig &cfg,
                          keys::KeySender &sender);

        // Returns the action handed to the key sender, or NONE
        gesture::Action process(const landmarks::LandmarkFrame &frame);

        // Processes frames until end of stream or stop(); returns frames read
        size_t run(landmarks::LandmarkReader &reader);
        void stop() { running_ = false; }

        // Raw read of the last evaluated frame
        const gesture::RawGesture &last_raw() const { return last_raw_; }

        const gesture::GestureStabilizer &stabilizer() const { return stabilizer_; }
        const ControllerStats &get_stats() const { return stats_; }
        void reset_stats();

    private:
        ControllerConfig config_;
        gesture::GestureClassifier classifier_;
        gesture::DirectionBands bands_;
        gesture::GestureStabilizer stabilizer_;
        keys::KeySender &sender_;

        ControllerStats stats_;
        gesture::RawGesture last_raw_;
        std::atomic<bool> running_{false};

        gesture::RawGesture read_gesture(const landmarks::LandmarkFrame &frame);
    };

} // namespace controller
