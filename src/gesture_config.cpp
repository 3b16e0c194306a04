#include "gesture_config.hpp"
#include "gesture_errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <fstream>
#include <sstream>
#include <iostream>

namespace gesture {

using json = nlohmann::json;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// One value, then nothing but trailing whitespace
template <typename T>
bool read_value(std::istringstream& iss, T& out) {
    T value;
    if (!(iss >> value)) return false;
    iss >> std::ws;
    if (!iss.eof()) return false;
    out = value;
    return true;
}

bool json_number(const json& v, double& out) {
    if (!v.is_number()) return false;
    out = v.get<double>();
    return true;
}

bool json_int(const json& v, int& out) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(u);
        return true;
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(i);
        return true;
    }
    return false;
}

bool json_bool(const json& v, bool& out) {
    if (!v.is_boolean()) return false;
    out = v.get<bool>();
    return true;
}

} // namespace

const char* GestureConfig::first_violation() const noexcept {
    if (!std::isfinite(angular_threshold_degrees) || angular_threshold_degrees <= 0.0)
        return "angular_threshold_degrees must be a positive finite number";
    if (angular_threshold_degrees >= constants::kMaxAngularThreshold)
        return "angular_threshold_degrees must be below 45 (direction bands would overlap)";
    if (!std::isfinite(stability_distance) || stability_distance < 0.0)
        return "stability_distance must be a non-negative finite number";
    if (!std::isfinite(cooldown_seconds) || cooldown_seconds < 0.0)
        return "cooldown_seconds must be a non-negative finite number";
    if (min_confidence_frames < 1)
        return "min_confidence_frames must be at least 1";
    return nullptr;
}

bool GestureConfig::validate() const noexcept {
    return first_violation() == nullptr;
}

std::string GestureConfig::validation_error() const {
    const char* msg = first_violation();
    return msg ? std::string(msg) : std::string();
}

void GestureConfig::require_valid() const {
    const char* msg = first_violation();
    if (msg) {
        throw ConfigurationError(std::string("[GestureConfig] ") + msg);
    }
}

std::string GestureConfig::to_json() const {
    json j;
    j["angular_threshold_degrees"] = angular_threshold_degrees;
    j["stability_distance"] = stability_distance;
    j["cooldown_seconds"] = cooldown_seconds;
    j["min_confidence_frames"] = min_confidence_frames;
    j["verbose"] = verbose;
    return j.dump(2);
}

bool GestureConfig::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        std::cerr << "[GestureConfig] JSON parse error: " << e.what() << "\n";
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[GestureConfig] JSON config must be an object\n";
        return false;
    }

    // Applied only when every key parses
    GestureConfig parsed = *this;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();
        bool ok = true;
        if (key == "angular_threshold_degrees") ok = json_number(value, parsed.angular_threshold_degrees);
        else if (key == "stability_distance") ok = json_number(value, parsed.stability_distance);
        else if (key == "cooldown_seconds") ok = json_number(value, parsed.cooldown_seconds);
        else if (key == "min_confidence_frames") ok = json_int(value, parsed.min_confidence_frames);
        else if (key == "verbose") ok = json_bool(value, parsed.verbose);
        else std::cerr << "[GestureConfig] Ignoring unknown key: " << key << "\n";

        if (!ok) {
            std::cerr << "[GestureConfig] Bad value for '" << key << "': " << value.dump() << "\n";
            return false;
        }
    }
    *this = parsed;
    return true;
}

bool GestureConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[GestureConfig] Failed to open: " << path << "\n";
        return false;
    }

    GestureConfig parsed = *this;
    if (ends_with(path, ".json")) {
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (!parsed.from_json(buffer.str())) return false;
    } else {
        std::string line;
        int line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') continue;

            std::istringstream iss(line);
            std::string key;
            if (!(iss >> key)) continue;

            bool ok = true;
            if (key == "angular_threshold_degrees") ok = read_value(iss, parsed.angular_threshold_degrees);
            else if (key == "stability_distance") ok = read_value(iss, parsed.stability_distance);
            else if (key == "cooldown_seconds") ok = read_value(iss, parsed.cooldown_seconds);
            else if (key == "min_confidence_frames") ok = read_value(iss, parsed.min_confidence_frames);
            else if (key == "verbose") ok = read_value(iss, parsed.verbose);
            else std::cerr << "[GestureConfig] Ignoring unknown key '" << key << "' at line " << line_no << "\n";

            if (!ok) {
                std::cerr << "[GestureConfig] Bad value for '" << key << "' at line " << line_no
                          << " in " << path << "\n";
                return false;
            }
        }
    }

    if (!parsed.validate()) {
        std::cerr << "[GestureConfig] Invalid configuration in " << path << ": "
                  << parsed.validation_error() << "\n";
        return false;
    }
    *this = parsed;
    return true;
}

bool GestureConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[GestureConfig] Failed to save to: " << path << "\n";
        return false;
    }

    if (ends_with(path, ".json")) {
        file << to_json() << "\n";
        return static_cast<bool>(file);
    }

    file << "# Gesture Control Configuration\n";
    file << "# Direction bands (degrees, half-width, < 45)\n";
    file << "angular_threshold_degrees " << angular_threshold_degrees << "\n";
    file << "\n# Classification\n";
    file << "stability_distance " << stability_distance << "\n";
    file << "\n# Debouncing\n";
    file << "cooldown_seconds " << cooldown_seconds << "\n";
    file << "min_confidence_frames " << min_confidence_frames << "\n";
    file << "\n# Logging\n";
    file << "verbose " << verbose << "\n";
    return static_cast<bool>(file);
}

} // namespace gesture
