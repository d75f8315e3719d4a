#pragma once

#include "sim/SimulationContext.h"
#include <entt/entt.hpp>

// Per-entity movement state machine: idle wandering, ground walking,
// conversation facing and the hand-off into the scaffold work cycle.
// Grabbed, suspended and thrown entities are owned elsewhere and skipped,
// as is the first-person avatar.
class MovementSystem {
public:
    // Run the FSM once for every entity
    static void update(SimulationContext& ctx, float deltaTime);

    // Run the FSM for one entity
    static void updateEntity(SimulationContext& ctx, entt::entity entity, float deltaTime);

    // Replace the entity's movement state; everything owned by the old state is dropped
    static void transitionTo(ecs::World& world, entt::entity entity, MovementState::Variant next);

    // Standing height at (x, z)
    static float standingHeight(const SimulationContext& ctx, float x, float z);

    // Wander profile of an entity, falling back to the minion profile
    static const WanderProfile& profileFor(const SimulationContext& ctx, entt::entity entity);

private:
    static void updateIdle(SimulationContext& ctx, entt::entity entity, float deltaTime);
    static void updateWalking(SimulationContext& ctx, entt::entity entity, float deltaTime);
    static void updateConversing(SimulationContext& ctx, entt::entity entity);
};
