#pragma once

#include "camera_controller.hpp"
#include <glm/glm.hpp>
#include <entt/entt.hpp>

namespace pixelcam::engine::systems {

/**
 * Pixel-art follow camera.
 *
 * Keeps a sub-pixel smooth position that chases target + offset every update,
 * clamps it to the world limits and writes the pixel-snapped result to the camera
 * entity's Transform2D. Only the written position is quantized; the smooth position
 * never is, so slow movement does not stall on pixel boundaries.
 *
 * The target is a non-owning entity handle. A destroyed target reads as no target.
 */
class CameraFollower : public CameraController {
public:
    // Throws std::invalid_argument if camera is not a valid entity or config
    // fails validate_camera_config().
    CameraFollower(entt::registry& registry, entt::entity camera,
                   const FollowCameraConfig& config = {});

    // Switches off the host camera smoothing and seeds the smooth position
    void initialize() override;

    // Call once per simulation tick with dt >= 0
    void update(float dt) override;

    // Rebinds the target. entt::null stops following.
    void set_follow_target(entt::entity target, bool snap_immediately = true) override;

    // Jump straight to target + offset, no interpolation
    void snap_to_target() override;

    // Rejected configs are logged and leave the current one in place
    bool set_config(const FollowCameraConfig& config) override;
    const FollowCameraConfig& get_config() const override { return config_; }

    FollowState get_state() const override;
    glm::vec2 get_position() const override { return rendered_position(); }

    bool is_following() const { return get_state() == FollowState::Following; }
    bool is_initialized() const { return initialized_; }
    entt::entity follow_target() const { return target_; }
    entt::entity camera() const { return camera_; }
    glm::vec2 smooth_position() const { return smooth_position_; }
    glm::vec2 rendered_position() const;

private:
    const glm::vec2* resolve_target() const;
    glm::vec2 desired_position(const glm::vec2& target_position) const;
    glm::vec2 clamp_to_limits(const glm::vec2& position) const;
    void apply_position(const glm::vec2& world_position);

    entt::registry& registry_;
    entt::entity camera_;
    entt::entity target_ = entt::null;
    FollowCameraConfig config_;

    glm::vec2 smooth_position_{0.0f};
    bool initialized_ = false;
    bool warned_bad_dt_ = false;
};

} // namespace pixelcam::engine::systems
