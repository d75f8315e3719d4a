#pragma once

#include "sim/SimulationContext.h"

// Latest first-person input, sampled by the input layer every frame
struct FirstPersonInput {
    float forward = 0.0f;   // -1..1, W/S
    float right = 0.0f;     // -1..1, D/A
    float yaw = 0.0f;       // Radians, from mouse look
};

// Moves the player-controlled avatar on the ground from first-person input
class FirstPersonController {
public:
    static void update(SimulationContext& ctx, const FirstPersonInput& input, float deltaTime);

    // Camera eye for an avatar transform
    static glm::vec3 eyePosition(const Transform& transform, float eyeHeight) {
        return transform.position + glm::vec3(0.0f, eyeHeight, 0.0f);
    }
};
