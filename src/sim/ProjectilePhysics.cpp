#include "ProjectilePhysics.h"
#include "sim/MovementSystem.h"
#include <SDL3/SDL_log.h>
#include <cmath>
#include <vector>

void ProjectilePhysics::launch(SimulationContext& ctx, entt::entity entity,
                               const glm::vec3& position, const glm::vec3& velocity) {
    auto& transform = ctx.world.registry().get<Transform>(entity);
    transform.position = position;

    const glm::vec3& spin = ctx.config.physics.throwSpin;
    glm::vec3 angular(ctx.rng.centered(spin.x), ctx.rng.centered(spin.y), ctx.rng.centered(spin.z));

    MovementSystem::transitionTo(ctx.world, entity, movement::Thrown{velocity, angular, 0});
}

void ProjectilePhysics::drop(SimulationContext& ctx, entt::entity entity) {
    const auto& transform = ctx.world.registry().get<Transform>(entity);
    float groundY = MovementSystem::standingHeight(ctx, transform.position.x, transform.position.z);

    if (transform.position.y > groundY + ctx.config.physics.releaseGroundTolerance) {
        launch(ctx, entity, transform.position, glm::vec3(0.0f));
    } else {
        settle(ctx, entity, groundY);
    }
}

void ProjectilePhysics::update(SimulationContext& ctx, float deltaTime) {
    auto& registry = ctx.world.registry();

    // Settling replaces the state variant, so collect first
    std::vector<entt::entity> airborne;
    auto view = registry.view<Transform, MovementState>();
    for (auto entity : view) {
        if (view.get<MovementState>(entity).is<movement::Thrown>()) {
            airborne.push_back(entity);
        }
    }

    for (auto entity : airborne) {
        step(ctx, entity, deltaTime);
    }
}

void ProjectilePhysics::step(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto& transform = registry.get<Transform>(entity);
    auto* thrown = registry.get<MovementState>(entity).as<movement::Thrown>();
    if (!thrown) {
        return;
    }

    const PhysicsConfig& cfg = ctx.config.physics;

    thrown->velocity.y -= cfg.gravity * deltaTime;
    transform.position += thrown->velocity * deltaTime;

    float groundY = MovementSystem::standingHeight(ctx, transform.position.x, transform.position.z);
    if (transform.position.y <= groundY && thrown->velocity.y < 0.0f) {
        transform.position.y = groundY;
        thrown->bounceCount++;

        thrown->velocity.y = -thrown->velocity.y * cfg.bounceDamping;
        thrown->velocity.x = thrown->velocity.x * cfg.horizontalRetention + ctx.rng.centered(cfg.horizontalJitter);
        thrown->velocity.z = thrown->velocity.z * cfg.horizontalRetention + ctx.rng.centered(cfg.horizontalJitter);

        thrown->angularVelocity.x += ctx.rng.centered(cfg.angularJitter);
        thrown->angularVelocity.z += ctx.rng.centered(cfg.angularJitter);

        if (std::abs(thrown->velocity.y) < cfg.minBounceVelocity || thrown->bounceCount >= cfg.maxBounces) {
            settle(ctx, entity, groundY);
            return;
        }
    }

    const float limit = ctx.config.world.worldHalfSize * cfg.worldLimitFraction;
    if (std::abs(transform.position.x) > limit) {
        transform.position.x = std::copysign(limit, transform.position.x);
        thrown->velocity.x *= -cfg.boundsRestitution;
    }
    if (std::abs(transform.position.z) > limit) {
        transform.position.z = std::copysign(limit, transform.position.z);
        thrown->velocity.z *= -cfg.boundsRestitution;
    }

    transform.rotation += thrown->angularVelocity * deltaTime;
    thrown->angularVelocity *= cfg.angularDecay;
}

void ProjectilePhysics::settle(SimulationContext& ctx, entt::entity entity, float groundY) {
    auto& transform = ctx.world.registry().get<Transform>(entity);
    transform.position.y = groundY;
    transform.rotation.x = 0.0f;
    transform.rotation.z = 0.0f;

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Entity %u landed at (%.1f, %.1f)",
                 ctx.world.idOf(entity), transform.position.x, transform.position.z);

    const FloatRange& idle = ctx.config.physics.settleIdle;
    MovementSystem::transitionTo(ctx.world, entity, movement::Idle{ctx.rng.range(idle.min, idle.max)});
}
