#include "ScaffoldWorkCycle.h"
#include "sim/MovementSystem.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

void ScaffoldWorkCycle::begin(SimulationContext& ctx, entt::entity entity) {
    auto& registry = ctx.world.registry();
    const auto& state = registry.get<MovementState>(entity);
    if (state.is<movement::ScaffoldWalking>() || state.is<movement::ScaffoldWorking>()) {
        return;
    }

    auto& assignment = registry.get<BuildingAssignment>(entity);
    auto& transform = registry.get<Transform>(entity);

    transform.position = assignment.scaffoldPosition;
    assignment.currentPoint = snapToSurface(ctx, transform.position, assignment.buildingId);
    assignment.placed = true;

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Entity %u placed on scaffold of %s",
                 ctx.world.idOf(entity), assignment.buildingId.c_str());

    MovementSystem::transitionTo(ctx.world, entity, movement::ScaffoldWalking{});
}

void ScaffoldWorkCycle::update(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    const auto& state = ctx.world.registry().get<MovementState>(entity);

    if (state.is<movement::ScaffoldWorking>()) {
        updateWorking(ctx, entity, deltaTime);
    } else if (const auto* walking = state.as<movement::ScaffoldWalking>()) {
        if (walking->path) {
            followPath(ctx, entity, deltaTime);
        } else {
            requestPath(ctx, entity, deltaTime);
        }
    }
}

void ScaffoldWorkCycle::release(SimulationContext& ctx, entt::entity entity) {
    auto& registry = ctx.world.registry();
    auto& transform = registry.get<Transform>(entity);

    if (auto* assignment = registry.try_get<BuildingAssignment>(entity)) {
        assignment->currentPoint.reset();
        assignment->placed = false;
    }

    transform.position.y = MovementSystem::standingHeight(ctx, transform.position.x, transform.position.z);

    const WanderProfile& profile = MovementSystem::profileFor(ctx, entity);
    MovementSystem::transitionTo(ctx.world, entity,
                                 movement::Idle{ctx.rng.range(profile.retryIdle.min, profile.retryIdle.max)});
}

ElevatedNavPoint ScaffoldWorkCycle::snapToSurface(SimulationContext& ctx, const glm::vec3& position,
                                                  const std::string& buildingId) {
    const ScaffoldConfig& cfg = ctx.config.scaffold;
    const float footY = position.y - cfg.standingOffset;

    if (const ElevatedSurface* surface = ctx.surfaces.getSurfaceAt(position.x, position.z, footY, cfg.snapTolerance)) {
        return ElevatedNavPoint::at(glm::vec3(position.x, surface->y, position.z), surface->id);
    }

    // Slightly off a deck edge: project onto the closest deck of the same building
    if (const ElevatedSurface* nearest = ctx.surfaces.findNearestSurface(position.x, position.z, footY, buildingId)) {
        glm::vec2 clamped = nearest->bounds.clamp(position.x, position.z);
        glm::vec3 projected(clamped.x, nearest->y, clamped.y);
        if (glm::length(projected - glm::vec3(position.x, footY, position.z)) <= cfg.snapFallbackDistance) {
            return ElevatedNavPoint::at(projected, nearest->id);
        }
    }

    ctx.diagnostics.report(ctx.now, "No scaffold surface of %s near (%.2f, %.2f, %.2f), using raw position",
                           buildingId.c_str(), position.x, position.y, position.z);
    return ElevatedNavPoint::at(position);
}

void ScaffoldWorkCycle::requestPath(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto* walking = registry.get<MovementState>(entity).as<movement::ScaffoldWalking>();

    walking->retryTimer -= deltaTime;
    if (walking->retryTimer > 0.0f) {
        return;
    }

    auto& assignment = registry.get<BuildingAssignment>(entity);
    const float retry = ctx.config.scaffold.pathRetryInterval;

    if (!assignment.currentPoint) {
        const auto& transform = registry.get<Transform>(entity);
        assignment.currentPoint = snapToSurface(ctx, transform.position, assignment.buildingId);
    }

    auto destination = ctx.pathfinder.findRandomPointForParent(assignment.buildingId, ctx.rng);
    if (!destination) {
        // Scaffold not registered yet; bob in place and ask again
        walking->retryTimer = retry;
        return;
    }

    auto path = ctx.pathfinder.findPath(*assignment.currentPoint, *destination);
    if (!path) {
        ctx.diagnostics.report(ctx.now, "Entity %u: no scaffold path on %s to (%.2f, %.2f, %.2f)",
                               ctx.world.idOf(entity), assignment.buildingId.c_str(),
                               destination->x, destination->y, destination->z);
        walking->retryTimer = retry;
        return;
    }

    walking->path = std::move(path);
    walking->nextWaypoint = 0;
}

void ScaffoldWorkCycle::followPath(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto& registry = ctx.world.registry();
    auto* walking = registry.get<MovementState>(entity).as<movement::ScaffoldWalking>();
    const auto& points = walking->path->points;

    if (walking->nextWaypoint >= points.size()) {
        startWork(ctx, entity);
        return;
    }

    auto& transform = registry.get<Transform>(entity);
    const ElevatedNavPoint& waypoint = points[walking->nextWaypoint];
    glm::vec3 toWaypoint = waypoint.position() - transform.position;
    float distance = glm::length(toWaypoint);

    if (distance < ctx.config.scaffold.waypointTolerance) {
        registry.get<BuildingAssignment>(entity).currentPoint = waypoint;
        walking->nextWaypoint++;
        if (walking->nextWaypoint >= points.size()) {
            startWork(ctx, entity);
        }
        return;
    }

    const float speed = registry.get<Locomotion>(entity).speed * ctx.config.scaffold.speedMultiplier;
    float stepLength = std::min(speed * deltaTime, distance);
    transform.position += (toWaypoint / distance) * stepLength;

    if (glm::length(glm::vec2(toWaypoint.x, toWaypoint.z)) > 0.01f) {
        transform.faceDirection(toWaypoint.x, toWaypoint.z);
    }
}

void ScaffoldWorkCycle::startWork(SimulationContext& ctx, entt::entity entity) {
    const FloatRange& duration = ctx.config.scaffold.workDuration;
    MovementSystem::transitionTo(ctx.world, entity,
                                 movement::ScaffoldWorking{ctx.rng.range(duration.min, duration.max), 0.0f});
}

void ScaffoldWorkCycle::updateWorking(SimulationContext& ctx, entt::entity entity, float deltaTime) {
    auto* working = ctx.world.registry().get<MovementState>(entity).as<movement::ScaffoldWorking>();

    working->phase += deltaTime * ctx.config.scaffold.hammerCyclesPerSecond;
    working->timer -= deltaTime;

    if (working->timer <= 0.0f) {
        MovementSystem::transitionTo(ctx.world, entity, movement::ScaffoldWalking{});
    }
}
