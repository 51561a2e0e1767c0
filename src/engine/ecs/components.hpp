#pragma once

#include <glm/glm.hpp>

namespace pixelcam::engine::ecs {

// Coordinate system: y-down screen space. Positions are in world units.
struct Transform2D {
    glm::vec2 position{0.0f};
};

// Host-side camera state. The host renders from view_center.
struct Camera2D {
    glm::vec2 view_center{0.0f};
    bool builtin_smoothing = true;         // Host's own position smoothing
    float builtin_smoothing_speed = 5.0f;
    bool current = true;
};

} // namespace pixelcam::engine::ecs
