#include "camera_follower.hpp"
#include "engine/camera_config.hpp"
#include "engine/ecs/components.hpp"
#include <SDL3/SDL_log.h>
#include <glm/common.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pixelcam::engine::systems {

CameraFollower::CameraFollower(entt::registry& registry, entt::entity camera,
                               const FollowCameraConfig& config)
    : registry_(registry), camera_(camera), config_(config) {
    if (!registry_.valid(camera_)) {
        throw std::invalid_argument("CameraFollower: camera entity is not valid");
    }
    std::string error;
    if (!validate_camera_config(config_, &error)) {
        throw std::invalid_argument("CameraFollower: invalid camera config: " + error);
    }
}

void CameraFollower::initialize() {
    if (auto* host_camera = registry_.try_get<ecs::Camera2D>(camera_)) {
        if (host_camera->builtin_smoothing) {
            SDL_Log("CameraFollower::initialize: Disabling host camera smoothing");
        }
        host_camera->builtin_smoothing = false;
    }

    if (const glm::vec2* target_position = resolve_target()) {
        smooth_position_ = desired_position(*target_position);
    } else if (const auto* transform = registry_.try_get<ecs::Transform2D>(camera_)) {
        smooth_position_ = transform->position;
    }

    initialized_ = true;
    apply_position(smooth_position_);
}

void CameraFollower::update(float dt) {
    if (!std::isfinite(dt) || dt < 0.0f) {
        if (!warned_bad_dt_) {
            SDL_Log("CameraFollower::update: Ignoring invalid dt %f", static_cast<double>(dt));
            warned_bad_dt_ = true;
        }
        return;
    }

    if (!initialized_) {
        initialize();
    }

    const glm::vec2* target_position = resolve_target();
    if (!target_position) {
        // Destroyed targets are released; live ones without a transform stay bound
        if (target_ != entt::null && !registry_.valid(target_)) {
            SDL_Log("CameraFollower::update: Follow target is gone, holding position");
            target_ = entt::null;
        }
        return;
    }

    glm::vec2 desired = desired_position(*target_position);

    if (config_.smoothing_enabled) {
        float alpha = config_.follow_speed * dt;
        if (config_.clamp_follow_fraction) {
            alpha = std::clamp(alpha, 0.0f, 1.0f);
        }
        smooth_position_ = glm::mix(smooth_position_, desired, alpha);
    } else {
        smooth_position_ = desired;
    }

    // Clamp before snapping so the snapped position stays inside the limits
    if (config_.use_limits) {
        smooth_position_ = clamp_to_limits(smooth_position_);
    }

    apply_position(smooth_position_);
}

void CameraFollower::set_follow_target(entt::entity target, bool snap_immediately) {
    target_ = target;

    if (target_ == entt::null) {
        SDL_Log("CameraFollower::set_follow_target: Cleared follow target");
        return;
    }
    if (!resolve_target()) {
        SDL_Log("CameraFollower::set_follow_target: Entity %u has no transform, camera stays idle",
                static_cast<unsigned>(entt::to_integral(target_)));
    }

    if (snap_immediately) {
        snap_to_target();
    }
}

void CameraFollower::snap_to_target() {
    const glm::vec2* target_position = resolve_target();
    if (!target_position) {
        return;
    }

    if (!initialized_) {
        initialize();
    }

    smooth_position_ = desired_position(*target_position);
    apply_position(smooth_position_);
}

bool CameraFollower::set_config(const FollowCameraConfig& config) {
    std::string error;
    if (!validate_camera_config(config, &error)) {
        SDL_Log("CameraFollower::set_config: Rejected camera config: %s", error.c_str());
        return false;
    }
    config_ = config;
    return true;
}

FollowState CameraFollower::get_state() const {
    return resolve_target() ? FollowState::Following : FollowState::Idle;
}

glm::vec2 CameraFollower::rendered_position() const {
    if (const auto* transform = registry_.try_get<ecs::Transform2D>(camera_)) {
        return transform->position;
    }
    return smooth_position_;
}

const glm::vec2* CameraFollower::resolve_target() const {
    if (target_ == entt::null || !registry_.valid(target_)) {
        return nullptr;
    }
    const auto* transform = registry_.try_get<ecs::Transform2D>(target_);
    return transform ? &transform->position : nullptr;
}

glm::vec2 CameraFollower::desired_position(const glm::vec2& target_position) const {
    return target_position + config_.base_offset;
}

glm::vec2 CameraFollower::clamp_to_limits(const glm::vec2& position) const {
    return glm::clamp(position,
                      glm::vec2(config_.bounds_left, config_.bounds_top),
                      glm::vec2(config_.bounds_right, config_.bounds_bottom));
}

void CameraFollower::apply_position(const glm::vec2& world_position) {
    glm::vec2 rendered = world_position;
    if (config_.pixel_snap_enabled) {
        // World units -> pixel index -> world units
        rendered = glm::round(world_position / config_.pixel_size) * config_.pixel_size;
    }
    registry_.get_or_emplace<ecs::Transform2D>(camera_).position = rendered;
}

} // namespace pixelcam::engine::systems
