#include "camera_smoothing_system.hpp"
#include "engine/ecs/components.hpp"
#include <glm/common.hpp>
#include <algorithm>

namespace pixelcam::engine::systems {

void CameraSmoothingSystem::update(entt::registry& registry, float dt) {
    auto view = registry.view<ecs::Transform2D, ecs::Camera2D>();

    for (auto entity : view) {
        const auto& transform = view.get<ecs::Transform2D>(entity);
        auto& camera = view.get<ecs::Camera2D>(entity);

        if (!camera.builtin_smoothing) {
            camera.view_center = transform.position;
            continue;
        }

        float alpha = std::clamp(camera.builtin_smoothing_speed * dt, 0.0f, 1.0f);
        camera.view_center = glm::mix(camera.view_center, transform.position, alpha);

        // Caught up, drop the float residue
        if (alpha >= 1.0f) {
            camera.view_center = transform.position;
        }
    }
}

} // namespace pixelcam::engine::systems
