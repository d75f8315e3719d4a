#include "FirstPersonController.h"
#include "sim/MovementSystem.h"
#include <cmath>

void FirstPersonController::update(SimulationContext& ctx, const FirstPersonInput& input, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto view = registry.view<PlayerControlled, Transform>();

    const glm::vec3 forward(std::sin(input.yaw), 0.0f, std::cos(input.yaw));
    const glm::vec3 right(-std::cos(input.yaw), 0.0f, std::sin(input.yaw));

    glm::vec3 direction = forward * input.forward + right * input.right;
    float length = glm::length(direction);
    if (length > 1.0f) {
        direction /= length;    // Diagonals are no faster
    }

    for (auto entity : view) {
        auto& transform = view.get<Transform>(entity);
        transform.rotation.y = input.yaw;

        if (length < 1e-4f) {
            continue;
        }

        glm::vec3 next = transform.position + direction * (ctx.config.mode.firstPersonSpeed * deltaTime);
        if (!ctx.oracle.isWalkable(next.x, next.z) &&
            ctx.oracle.isWalkable(transform.position.x, transform.position.z)) {
            continue;
        }

        transform.position = glm::vec3(next.x, MovementSystem::standingHeight(ctx, next.x, next.z), next.z);
    }
}
