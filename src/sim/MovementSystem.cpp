#include "MovementSystem.h"
#include "sim/ScaffoldWorkCycle.h"
#include <SDL3/SDL_log.h>
#include <cmath>

void MovementSystem::update(SimulationContext& ctx, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto view = registry.view<Transform, MovementState, EntityInfo>();

    for (auto entity : view) {
        updateEntity(ctx, entity, deltaTime);
    }
}

void MovementSystem::updateEntity(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    if (registry.all_of<PlayerControlled>(entity)) {
        return;
    }

    auto& state = registry.get<MovementState>(entity);
    const bool assigned = registry.all_of<BuildingAssignment>(entity);

    switch (state.tag()) {
        case MovementTag::Idle:
            if (assigned) {
                ScaffoldWorkCycle::begin(ctx, entity);
            } else {
                updateIdle(ctx, entity, deltaTime);
            }
            break;

        case MovementTag::Walking:
            if (assigned) {
                ScaffoldWorkCycle::begin(ctx, entity);
            } else {
                updateWalking(ctx, entity, deltaTime);
            }
            break;

        case MovementTag::Conversing:
            updateConversing(ctx, entity);
            break;

        case MovementTag::ScaffoldWalking:
        case MovementTag::ScaffoldWorking:
            if (assigned) {
                ScaffoldWorkCycle::update(ctx, entity, deltaTime);
            } else {
                ScaffoldWorkCycle::release(ctx, entity);
            }
            break;

        case MovementTag::Grabbed:
        case MovementTag::Suspended:
        case MovementTag::Thrown:
            // Interaction controller or ProjectilePhysics owns the position
            break;
    }
}

void MovementSystem::transitionTo(ecs::World& world, entt::entity entity, MovementState::Variant next) {
    auto& registry = world.registry();
    auto& state = registry.get<MovementState>(entity);

    MovementTag from = state.tag();
    state.current = std::move(next);
    MovementTag to = state.tag();

    if (from != to) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Entity %u: %s -> %s",
                     world.idOf(entity), movementTagName(from), movementTagName(to));
    }
}

float MovementSystem::standingHeight(const SimulationContext& ctx, float x, float z) {
    return ctx.oracle.groundHeight(x, z) + ctx.config.world.groundClearance;
}

const WanderProfile& MovementSystem::profileFor(const SimulationContext& ctx, entt::entity entity) {
    if (const auto* wanderer = ctx.world.registry().try_get<Wanderer>(entity)) {
        return wanderer->profile;
    }
    return ctx.config.minionWander;
}

void MovementSystem::updateIdle(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto* idle = registry.get<MovementState>(entity).as<movement::Idle>();

    idle->timer -= deltaTime;

    auto* wanderer = registry.try_get<Wanderer>(entity);
    if (!wanderer) {
        return;  // Props have no AI of their own
    }

    wanderer->decisionAccumulator += deltaTime;
    if (idle->timer > 0.0f) {
        return;
    }

    const WanderProfile& profile = wanderer->profile;
    if (profile.decisionInterval > 0.0f && wanderer->decisionAccumulator < profile.decisionInterval) {
        return;
    }
    wanderer->decisionAccumulator = 0.0f;

    const auto& transform = registry.get<Transform>(entity);
    auto target = ctx.planner.chooseDestination(profile, transform.position, wanderer->home, ctx.rng);

    if (target) {
        transitionTo(ctx.world, entity, movement::Walking{*target});
    } else {
        // Sampling exhausted: stay idle and try again later
        idle->timer = ctx.rng.range(profile.retryIdle.min, profile.retryIdle.max);
    }
}

void MovementSystem::updateWalking(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto& transform = registry.get<Transform>(entity);
    const auto& locomotion = registry.get<Locomotion>(entity);
    const glm::vec3 target = registry.get<MovementState>(entity).as<movement::Walking>()->target;
    const WanderProfile& profile = profileFor(ctx, entity);

    glm::vec2 toTarget(target.x - transform.position.x, target.z - transform.position.z);
    float distance = glm::length(toTarget);
    float stepLength = locomotion.speed * deltaTime;

    if (distance > 0.01f) {
        transform.faceDirection(toTarget.x, toTarget.y);
    }

    if (distance < stepLength) {
        transform.position = target;
        transitionTo(ctx.world, entity,
                     movement::Idle{ctx.rng.range(profile.arrivalIdle.min, profile.arrivalIdle.max)});
        return;
    }

    glm::vec2 next = glm::vec2(transform.position.x, transform.position.z) + (toTarget / distance) * stepLength;

    // Hit water (or a wall): stop short. Stepping out of a blocked cell is always allowed.
    if (!ctx.oracle.isWalkable(next.x, next.y) &&
        ctx.oracle.isWalkable(transform.position.x, transform.position.z)) {
        transitionTo(ctx.world, entity,
                     movement::Idle{ctx.rng.range(profile.blockedIdle.min, profile.blockedIdle.max)});
        return;
    }

    transform.position = glm::vec3(next.x, standingHeight(ctx, next.x, next.y), next.y);
}

void MovementSystem::updateConversing(SimulationContext& ctx, entt::entity entity) {
    auto& registry = ctx.world.registry();
    const auto* conversing = registry.get<MovementState>(entity).as<movement::Conversing>();

    const Transform* partner = ctx.world.getTransform(conversing->partner);
    if (!partner) {
        return;
    }

    auto& transform = registry.get<Transform>(entity);
    glm::vec2 toPartner(partner->position.x - transform.position.x, partner->position.z - transform.position.z);
    if (glm::length(toPartner) > 0.01f) {
        transform.faceDirection(toPartner.x, toPartner.y);
    }
}
