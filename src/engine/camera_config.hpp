#pragma once

#include "engine/systems/camera_controller.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace pixelcam::engine {

using systems::FollowCameraConfig;

// Returns false and fills error (when given) if the config would produce
// NaN/Inf or an empty clamp box at update time.
bool validate_camera_config(const FollowCameraConfig& config, std::string* error = nullptr);

/**
 * JSON persistence for FollowCameraConfig.
 * Missing keys keep the value already in the output config.
 */
class CameraConfigFile {
public:
    static bool load(const std::string& path, FollowCameraConfig& config);
    static bool load_from_json(const nlohmann::json& j, FollowCameraConfig& config);
    static bool save(const std::string& path, const FollowCameraConfig& config);

    static nlohmann::json to_json(const FollowCameraConfig& config);
};

} // namespace pixelcam::engine
