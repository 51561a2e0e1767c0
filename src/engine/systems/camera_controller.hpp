#pragma once

#include <glm/glm.hpp>
#include <entt/entt.hpp>

namespace pixelcam::engine::systems {

// Configuration for follow camera behavior
struct FollowCameraConfig {
    bool smoothing_enabled = true;       // false = camera sits exactly on target
    float follow_speed = 5.0f;           // Interpolation rate, higher = faster catch-up
    bool clamp_follow_fraction = true;   // Keep follow_speed * dt within [0, 1]
    bool pixel_snap_enabled = true;
    float pixel_size = 1.0f;             // World units per screen pixel
    glm::vec2 base_offset{0.0f};         // Added to the target position
    bool use_limits = false;
    float bounds_left = -10000000.0f;
    float bounds_right = 10000000.0f;
    float bounds_top = -10000000.0f;     // y-down: top < bottom
    float bounds_bottom = 10000000.0f;
};

enum class FollowState {
    Idle,       // No target bound, update holds the last position
    Following
};

/**
 * Abstract follow camera interface exposed to game code.
 * Hides how the camera smooths, clamps and snaps.
 */
class CameraController {
public:
    virtual ~CameraController() = default;

    virtual void initialize() = 0;
    virtual void update(float dt) = 0;

    // Target tracking
    virtual void set_follow_target(entt::entity target, bool snap_immediately = true) = 0;
    virtual void snap_to_target() = 0;

    // Configuration
    virtual bool set_config(const FollowCameraConfig& config) = 0;
    virtual const FollowCameraConfig& get_config() const = 0;

    // Read-only output
    virtual FollowState get_state() const = 0;
    virtual glm::vec2 get_position() const = 0;
};

} // namespace pixelcam::engine::systems
