#pragma once

#include "sim/SimulationContext.h"
#include <entt/entt.hpp>

// Ballistic flight and bouncing for thrown entities.
// Gravity and bounce damping are tuned for the village scale, not real units.
class ProjectilePhysics {
public:
    // Put the entity into flight from position with the given velocity.
    // Spin is randomised per throw.
    static void launch(SimulationContext& ctx, entt::entity entity,
                       const glm::vec3& position, const glm::vec3& velocity);

    // Let go of a held entity: falls from height, otherwise settles where it is
    static void drop(SimulationContext& ctx, entt::entity entity);

    // Integrate every Thrown entity
    static void update(SimulationContext& ctx, float deltaTime);

    // Integrate one Thrown entity
    static void step(SimulationContext& ctx, entt::entity entity, float deltaTime);

private:
    static void settle(SimulationContext& ctx, entt::entity entity, float groundY);
};
