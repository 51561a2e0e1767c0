#pragma once

#include <entt/entt.hpp>

namespace pixelcam::engine::systems {

/**
 * Host engine's built-in camera smoothing.
 * Moves each Camera2D view center toward its entity's Transform2D. When smoothing
 * is switched off on a camera, the view center tracks the transform exactly.
 */
class CameraSmoothingSystem {
public:
    void update(entt::registry& registry, float dt);
};

} // namespace pixelcam::engine::systems
