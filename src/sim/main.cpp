#include "engine/camera_config.hpp"
#include "engine/ecs/components.hpp"
#include "engine/systems/camera_follower.hpp"
#include "engine/systems/camera_smoothing_system.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cmath>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

using namespace pixelcam::engine;

namespace {

constexpr float TICK_DT = 1.0f / 60.0f;

// Walker paths: a slow sweep to the right and a figure-eight in the far corner
glm::vec2 walker_a_position(float t) {
    return {40.0f + 55.3f * t, 180.0f + 12.5f * std::sin(t * 2.0f)};
}

glm::vec2 walker_b_position(float t) {
    return {520.0f + 90.0f * std::sin(t), 300.0f + 45.0f * std::sin(t * 2.0f)};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    systems::FollowCameraConfig config;
    std::string config_path = argc > 1 ? argv[1] : "data/camera.json";

    if (!CameraConfigFile::load(config_path, config)) {
        if (argc > 1) {
            return 1;
        }
        config_path = "../data/camera.json";
        if (!CameraConfigFile::load(config_path, config)) {
            std::cerr << "[Sim] Failed to load camera config from data/ directory" << std::endl;
            return 1;
        }
    }

    int ticks = 600;
    if (argc > 2) {
        try {
            ticks = std::stoi(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << "[Sim] Bad tick count '" << argv[2] << "': " << e.what() << std::endl;
            return 1;
        }
    }

    entt::registry registry;

    auto camera = registry.create();
    registry.emplace<ecs::Transform2D>(camera);
    registry.emplace<ecs::Camera2D>(camera);

    auto walker_a = registry.create();
    registry.emplace<ecs::Transform2D>(walker_a, walker_a_position(0.0f));
    auto walker_b = registry.create();
    registry.emplace<ecs::Transform2D>(walker_b, walker_b_position(0.0f));

    systems::CameraFollower follower(registry, camera, config);
    systems::CameraSmoothingSystem host_smoothing;

    follower.set_follow_target(walker_a, false);
    follower.initialize();

    const int handoff_tick = ticks / 2;
    const int despawn_tick = ticks - ticks / 8;

    for (int tick = 0; tick < ticks; ++tick) {
        float t = static_cast<float>(tick) * TICK_DT;

        registry.get<ecs::Transform2D>(walker_a).position = walker_a_position(t);
        if (registry.valid(walker_b)) {
            registry.get<ecs::Transform2D>(walker_b).position = walker_b_position(t);
        }

        if (tick == handoff_tick) {
            std::cout << "[Sim] Handing off to second walker" << std::endl;
            follower.set_follow_target(walker_b, false);
        }
        if (tick == despawn_tick && registry.valid(walker_b)) {
            std::cout << "[Sim] Despawning second walker" << std::endl;
            registry.destroy(walker_b);
        }

        follower.update(TICK_DT);
        host_smoothing.update(registry, TICK_DT);

        glm::vec2 smooth = follower.smooth_position();
        glm::vec2 view = registry.get<ecs::Camera2D>(camera).view_center;
        std::printf("%4d %-9s smooth=(%8.3f, %8.3f) view=(%6.1f, %6.1f)\n",
                    tick,
                    follower.is_following() ? "following" : "idle",
                    smooth.x, smooth.y, view.x, view.y);
    }

    return 0;
}
