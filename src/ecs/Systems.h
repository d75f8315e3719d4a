#pragma once

#include <entt/entt.hpp>
#include <cmath>
#include "Components.h"
#include "sim/HammerSwing.h"

// ============================================================================
// Animation Systems
// ============================================================================

// Advance wildlife hop phase - fast while walking, slow breathing otherwise
inline void hopAnimationSystem(entt::registry& registry, float deltaTime) {
    auto view = registry.view<HopAnimation, MovementState>();

    for (auto entity : view) {
        auto& hop = view.get<HopAnimation>(entity);
        const auto& state = view.get<MovementState>(entity);

        float rate = state.is<movement::Walking>() ? 12.0f : 2.0f;
        hop.phase += deltaTime * rate;
    }
}

// ============================================================================
// Write-back
// ============================================================================

// Copy simulated transforms into the pose rendering reads. Runs last in the
// tick so every other system has finished moving the entity.
inline void poseWriteBackSystem(entt::registry& registry, float simTime, const ScaffoldConfig& scaffold) {
    auto view = registry.view<Transform, MovementState, RenderPose>();

    for (auto entity : view) {
        const auto& transform = view.get<Transform>(entity);
        const auto& state = view.get<MovementState>(entity);
        auto& pose = view.get<RenderPose>(entity);

        pose.position = transform.position;
        pose.rotation = transform.rotation;
        pose.tag = state.tag();
        pose.armAngle = 0.0f;

        if (const auto* bounce = registry.try_get<BounceOffset>(entity)) {
            pose.position.y += bounce->value;
        }

        if (const auto* walking = state.as<movement::ScaffoldWalking>()) {
            // Waiting on the platform for a destination: gentle bob
            if (!walking->path) {
                pose.position.y += std::sin(simTime * scaffold.idleBobFrequency) * scaffold.idleBobAmplitude;
            }
        } else if (const auto* working = state.as<movement::ScaffoldWorking>()) {
            pose.armAngle = hammerArmAngle(working->phase);
        }
    }
}
