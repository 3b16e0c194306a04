#pragma once

#include <string>

namespace gesture {

// Named constants for better readability
namespace constants {
    constexpr double kDefaultAngularThreshold = 35.0;
    constexpr double kMaxAngularThreshold = 45.0;  // Bands collide at and above this
    constexpr double kDefaultStabilityDistance = 15.0;
    constexpr double kDefaultCooldownSeconds = 0.05;
    constexpr int kDefaultMinConfidenceFrames = 1;
    constexpr int kMaxExtendedFingersForRoll = 2;
} // namespace constants

// Configuration for classification and debouncing, fixed at construction
struct GestureConfig {
    // Half-width of the right/up/left angular bands (degrees, must be < 45)
    double angular_threshold_degrees{constants::kDefaultAngularThreshold};

    // Minimum wrist-to-fingertips reach, same units as landmark coordinates
    double stability_distance{constants::kDefaultStabilityDistance};

    // Minimum interval between two emissions of the same action
    double cooldown_seconds{constants::kDefaultCooldownSeconds};

    // Consecutive identical candidates required before a new direction is adopted
    int min_confidence_frames{constants::kDefaultMinConfidenceFrames};

    bool verbose{false};        // Enable verbose logging

    // Load from key/value file, or JSON when the path ends in ".json"
    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool save_to_file(const std::string& path) const;

    std::string to_json() const;
    [[nodiscard]] bool from_json(const std::string& json);

    // Validation
    [[nodiscard]] bool validate() const noexcept;

    // Empty when valid, otherwise the first violated rule
    std::string validation_error() const;

    // Throws ConfigurationError when invalid
    void require_valid() const;

private:
    const char* first_violation() const noexcept;
};

} // namespace gesture
