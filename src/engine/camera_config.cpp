#include "camera_config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace pixelcam::engine {

namespace {

bool fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

} // anonymous namespace

bool validate_camera_config(const FollowCameraConfig& config, std::string* error) {
    if (!std::isfinite(config.pixel_size) || config.pixel_size <= 0.0f) {
        return fail(error, "pixel_size must be a finite value greater than 0");
    }
    if (!std::isfinite(config.follow_speed) || config.follow_speed < 0.0f) {
        return fail(error, "follow_speed must be a finite value >= 0");
    }
    if (config.smoothing_enabled && config.follow_speed == 0.0f) {
        return fail(error, "follow_speed must be greater than 0 while smoothing is enabled");
    }
    if (!std::isfinite(config.base_offset.x) || !std::isfinite(config.base_offset.y)) {
        return fail(error, "base_offset must be finite");
    }
    if (!std::isfinite(config.bounds_left) || !std::isfinite(config.bounds_right) ||
        !std::isfinite(config.bounds_top) || !std::isfinite(config.bounds_bottom)) {
        return fail(error, "bounds must be finite");
    }
    if (config.bounds_left >= config.bounds_right) {
        return fail(error, "bounds_left must be less than bounds_right");
    }
    if (config.bounds_top >= config.bounds_bottom) {
        return fail(error, "bounds_top must be less than bounds_bottom");
    }
    return true;
}

bool CameraConfigFile::load(const std::string& path, FollowCameraConfig& config) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[CameraConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        if (!load_from_json(j, config)) {
            std::cerr << "[CameraConfig] Rejected " << path << std::endl;
            return false;
        }
        std::cout << "[CameraConfig] Loaded " << path << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[CameraConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool CameraConfigFile::load_from_json(const json& j, FollowCameraConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[CameraConfig] Expected a JSON object" << std::endl;
        return false;
    }

    FollowCameraConfig loaded = config;
    try {
        loaded.smoothing_enabled = j.value("smoothing_enabled", loaded.smoothing_enabled);
        loaded.follow_speed = j.value("follow_speed", loaded.follow_speed);
        loaded.clamp_follow_fraction = j.value("clamp_follow_fraction", loaded.clamp_follow_fraction);
        loaded.pixel_snap_enabled = j.value("pixel_snap_enabled", loaded.pixel_snap_enabled);
        loaded.pixel_size = j.value("pixel_size", loaded.pixel_size);
        loaded.use_limits = j.value("use_limits", loaded.use_limits);

        if (j.contains("base_offset")) {
            const auto& offset = j.at("base_offset");
            if (!offset.is_array() || offset.size() != 2) {
                std::cerr << "[CameraConfig] base_offset must be an [x, y] array" << std::endl;
                return false;
            }
            loaded.base_offset = {offset[0].get<float>(), offset[1].get<float>()};
        }

        if (j.contains("bounds")) {
            const auto& bounds = j.at("bounds");
            loaded.bounds_left = bounds.value("left", loaded.bounds_left);
            loaded.bounds_right = bounds.value("right", loaded.bounds_right);
            loaded.bounds_top = bounds.value("top", loaded.bounds_top);
            loaded.bounds_bottom = bounds.value("bottom", loaded.bounds_bottom);
        }
    } catch (const json::exception& e) {
        std::cerr << "[CameraConfig] Bad value: " << e.what() << std::endl;
        return false;
    }

    std::string error;
    if (!validate_camera_config(loaded, &error)) {
        std::cerr << "[CameraConfig] Invalid config: " << error << std::endl;
        return false;
    }

    config = loaded;
    return true;
}

json CameraConfigFile::to_json(const FollowCameraConfig& config) {
    json j;
    j["smoothing_enabled"] = config.smoothing_enabled;
    j["follow_speed"] = config.follow_speed;
    j["clamp_follow_fraction"] = config.clamp_follow_fraction;
    j["pixel_snap_enabled"] = config.pixel_snap_enabled;
    j["pixel_size"] = config.pixel_size;
    j["base_offset"] = {config.base_offset.x, config.base_offset.y};
    j["use_limits"] = config.use_limits;
    j["bounds"] = {
        {"left", config.bounds_left},
        {"right", config.bounds_right},
        {"top", config.bounds_top},
        {"bottom", config.bounds_bottom}
    };
    return j;
}

bool CameraConfigFile::save(const std::string& path, const FollowCameraConfig& config) {
    std::ofstream f(path);
    if (!f) {
        std::cerr << "[CameraConfig] Failed to open " << path << " for writing" << std::endl;
        return false;
    }
    f << to_json(config).dump(4) << std::endl;
    return static_cast<bool>(f);
}

} // namespace pixelcam::engine
