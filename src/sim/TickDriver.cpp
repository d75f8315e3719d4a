#include "TickDriver.h"
#include "ecs/Systems.h"
#include "sim/MovementSystem.h"
#include "sim/ProjectilePhysics.h"
#include "sim/ScaffoldWorkCycle.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <type_traits>

TickDriver::TickDriver(ConstructToken) {}

std::unique_ptr<TickDriver> TickDriver::create(const InitInfo& info) {
    auto driver = std::make_unique<TickDriver>(ConstructToken{});
    if (!driver->initInternal(info)) {
        return nullptr;
    }
    return driver;
}

TickDriver::~TickDriver() = default;

bool TickDriver::initInternal(const InitInfo& info) {
    if (!info.oracle) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TickDriver requires a walkability oracle");
        return false;
    }
    if (info.config.inboxCapacity == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TickDriver: inbox capacity must be positive");
        return false;
    }

    config_ = info.config;
    terrain_ = info.oracle;

    if (info.cacheWalkability) {
        walkabilityCache_ = std::make_unique<WalkabilityCache>(*terrain_, config_.world.walkabilityResolution);
        oracle_ = walkabilityCache_.get();
    } else {
        oracle_ = terrain_;
    }

    if (info.surfaces) {
        surfaces_ = info.surfaces;
    } else {
        ownedSurfaces_ = std::make_unique<ElevatedSurfaceRegistry>();
        surfaces_ = ownedSurfaces_.get();
    }

    pathfinder_ = std::make_unique<ElevatedPathfinder>(*surfaces_, config_.scaffold.gridSize,
                                                       config_.scaffold.maxPathExpansions);
    planner_ = std::make_unique<IdleWanderPlanner>(*oracle_, config_.world.worldHalfSize,
                                                   config_.world.groundClearance);

    rng_.reseed(config_.seed);
    diagnostics_ = DiagnosticLog(config_.diagnosticCapacity);
    inbox_ = EventInbox(config_.inboxCapacity);

    SDL_Log("TickDriver initialized (seed=%u, worldHalfSize=%.1f)", config_.seed, config_.world.worldHalfSize);
    return true;
}

SimulationContext TickDriver::makeContext() {
    return SimulationContext{world_, *oracle_, *planner_, *surfaces_, *pathfinder_,
                             rng_, diagnostics_, config_, simTime_};
}

void TickDriver::tick(float realDeltaSeconds) {
    float deltaTime = std::isfinite(realDeltaSeconds)
        ? std::clamp(realDeltaSeconds, 0.0f, config_.world.maxFrameDelta)
        : 0.0f;

    simTime_ += deltaTime;
    tickCount_++;

    SimulationContext ctx = makeContext();

    for (const auto& event : inbox_.drain()) {
        applyEvent(ctx, event);
    }

    conversation_.update(ctx);
    mode_.update(simTime_);

    if (mode_.isFirstPerson()) {
        FirstPersonController::update(ctx, firstPersonInput_, deltaTime);
    }

    MovementSystem::update(ctx, deltaTime);
    ProjectilePhysics::update(ctx, deltaTime);

    auto& registry = world_.registry();
    hopAnimationSystem(registry, deltaTime);
    poseWriteBackSystem(registry, static_cast<float>(simTime_), config_.scaffold);
}

bool TickDriver::post(SimulationEvent event) {
    return inbox_.push(std::move(event));
}

EntityId TickDriver::spawnMinion(const std::string& name, const glm::vec3& position) {
    ecs::SpawnInfo info;
    info.kind = EntityKind::Minion;
    info.name = name;
    info.position = glm::vec3(position.x, oracle_->groundHeight(position.x, position.z) + config_.world.groundClearance,
                              position.z);
    info.speed = 2.0f + rng_.unit() * 0.5f;
    info.personality = static_cast<Personality>(minionsSpawned_++ % 3);
    info.initialIdle = rng_.range(0.0f, 2.0f);
    info.wander = config_.minionWander;
    info.home = info.position;
    return world_.createEntity(info);
}

EntityId TickDriver::spawnWizard() {
    EntityId existing = world_.findWizard();
    if (existing != INVALID_ENTITY_ID) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Wizard already exists (ID: %u)", existing);
        return existing;
    }

    const glm::vec3& home = config_.wizard.home;

    ecs::SpawnInfo info;
    info.kind = EntityKind::Wizard;
    info.name = "Wizard";
    info.position = glm::vec3(home.x, oracle_->groundHeight(home.x, home.z) + config_.world.groundClearance, home.z);
    info.speed = config_.wizard.speed;
    info.initialIdle = rng_.range(config_.wizardWander.arrivalIdle.min, config_.wizardWander.arrivalIdle.max);
    info.wander = config_.wizardWander;
    info.home = home;
    return world_.createEntity(info);
}

EntityId TickDriver::spawnWildlife(const std::string& name, const glm::vec3& position, float speed) {
    ecs::SpawnInfo info;
    info.kind = EntityKind::Wildlife;
    info.name = name;
    info.position = glm::vec3(position.x, oracle_->groundHeight(position.x, position.z) + config_.world.groundClearance,
                              position.z);
    info.speed = speed;
    info.initialIdle = rng_.range(0.0f, 2.0f);
    info.wander = config_.wildlifeWander;
    info.home = info.position;
    return world_.createEntity(info);
}

EntityId TickDriver::spawnProp(const std::string& name, const glm::vec3& position) {
    ecs::SpawnInfo info;
    info.kind = EntityKind::Prop;
    info.name = name;
    info.position = position;
    return world_.createEntity(info);
}

bool TickDriver::removeEntity(EntityId id) {
    return world_.destroyEntity(id);
}

void TickDriver::invalidateWalkability() {
    if (walkabilityCache_) {
        walkabilityCache_->invalidate();
    }
}

std::optional<glm::vec3> TickDriver::firstPersonEyePosition() const {
    if (!mode_.isFirstPerson()) {
        return std::nullopt;
    }
    const Transform* transform = world_.getTransform(world_.findWizard());
    if (!transform) {
        return std::nullopt;
    }
    return FirstPersonController::eyePosition(*transform, config_.mode.eyeHeight);
}

void TickDriver::applyEvent(SimulationContext& ctx, const SimulationEvent& event) {
    std::visit([&](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, events::EntityThrown>) {
            onThrown(ctx, e);
        } else if constexpr (std::is_same_v<T, events::EntityGrabbed>) {
            onHeld(ctx, e.id, movement::Grabbed{}, "Grab");
        } else if constexpr (std::is_same_v<T, events::EntitySuspended>) {
            onHeld(ctx, e.id, movement::Suspended{}, "Suspend");
        } else if constexpr (std::is_same_v<T, events::HeldEntityMoved>) {
            onHeldMoved(ctx, e);
        } else if constexpr (std::is_same_v<T, events::EntityReleased>) {
            onReleased(ctx, e);
        } else if constexpr (std::is_same_v<T, events::EntitySelected>) {
            onSelected(ctx, e);
        } else if constexpr (std::is_same_v<T, events::ConversationCancelled>) {
            conversation_.cancel(ctx);
        } else if constexpr (std::is_same_v<T, events::ToggleFirstPerson>) {
            mode_.requestToggle(ctx, conversation_.state());
        } else if constexpr (std::is_same_v<T, events::MenuVisibilityChanged>) {
            mode_.setMenuOpen(e.open);
        } else if constexpr (std::is_same_v<T, events::AssignedToBuilding>) {
            onAssigned(ctx, e);
        } else if constexpr (std::is_same_v<T, events::UnassignedFromBuilding>) {
            onUnassigned(ctx, e);
        }
    }, event);
}

entt::entity TickDriver::resolveForInteraction(SimulationContext& ctx, EntityId id, const char* action) {
    entt::entity entity = world_.find(id);
    if (entity == entt::null) {
        ctx.diagnostics.report(ctx.now, "%s: unknown entity %u", action, id);
        return entt::null;
    }

    const ConversationState& conversation = conversation_.state();
    if (conversation.active && (conversation_.isSubject(id) || id == conversation_.wizard())) {
        ctx.diagnostics.report(ctx.now, "%s: entity %u is in a conversation", action, id);
        return entt::null;
    }
    if (world_.registry().all_of<PlayerControlled>(entity)) {
        ctx.diagnostics.report(ctx.now, "%s: entity %u is player controlled", action, id);
        return entt::null;
    }
    return entity;
}

void TickDriver::onThrown(SimulationContext& ctx, const events::EntityThrown& e) {
    entt::entity entity = resolveForInteraction(ctx, e.id, "Throw");
    if (entity == entt::null) {
        return;
    }
    ProjectilePhysics::launch(ctx, entity, e.position, e.velocity);
}

void TickDriver::onHeld(SimulationContext& ctx, EntityId id, MovementState::Variant held, const char* action) {
    entt::entity entity = resolveForInteraction(ctx, id, action);
    if (entity == entt::null) {
        return;
    }
    MovementSystem::transitionTo(world_, entity, std::move(held));
}

void TickDriver::onHeldMoved(SimulationContext& ctx, const events::HeldEntityMoved& e) {
    entt::entity entity = world_.find(e.id);
    if (entity == entt::null) {
        ctx.diagnostics.report(ctx.now, "Drag: unknown entity %u", e.id);
        return;
    }

    auto& registry = world_.registry();
    const auto& current = registry.get<MovementState>(entity);
    if (!current.is<movement::Grabbed>() && !current.is<movement::Suspended>()) {
        ctx.diagnostics.report(ctx.now, "Drag: entity %u is %s, not held", e.id, movementTagName(current.tag()));
        return;
    }
    registry.get<Transform>(entity).position = e.position;
}

void TickDriver::onReleased(SimulationContext& ctx, const events::EntityReleased& e) {
    entt::entity entity = world_.find(e.id);
    if (entity == entt::null) {
        ctx.diagnostics.report(ctx.now, "Release: unknown entity %u", e.id);
        return;
    }

    const auto& current = world_.registry().get<MovementState>(entity);
    if (!current.is<movement::Grabbed>() && !current.is<movement::Suspended>()) {
        ctx.diagnostics.report(ctx.now, "Release: entity %u is %s, not held", e.id, movementTagName(current.tag()));
        return;
    }
    ProjectilePhysics::drop(ctx, entity);
}

void TickDriver::onSelected(SimulationContext& ctx, const events::EntitySelected& e) {
    const ModeState& mode = mode_.state();
    if (mode.mode != CameraMode::Isometric || mode.transitioning) {
        ctx.diagnostics.report(ctx.now, "Select: entity %u ignored in %s view", e.id, cameraModeName(mode.mode));
        return;
    }
    conversation_.select(ctx, e.id);
}

void TickDriver::onAssigned(SimulationContext& ctx, const events::AssignedToBuilding& e) {
    entt::entity entity = world_.find(e.id);
    const auto* info = world_.get<EntityInfo>(e.id);
    if (entity == entt::null || !info) {
        ctx.diagnostics.report(ctx.now, "Assign: unknown entity %u", e.id);
        return;
    }
    if (info->kind != EntityKind::Minion) {
        ctx.diagnostics.report(ctx.now, "Assign: entity %u is a %s, only minions build", e.id, entityKindName(info->kind));
        return;
    }

    auto& registry = world_.registry();
    registry.emplace_or_replace<BuildingAssignment>(entity, BuildingAssignment{e.buildingId, e.scaffoldPosition,
                                                                               std::nullopt, false});

    // Re-seat an entity already working another scaffold
    const auto& current = registry.get<MovementState>(entity);
    if (current.is<movement::ScaffoldWalking>() || current.is<movement::ScaffoldWorking>()) {
        MovementSystem::transitionTo(world_, entity, movement::Idle{0.0f});
    }

    SDL_Log("Entity %u assigned to %s", e.id, e.buildingId.c_str());
}

void TickDriver::onUnassigned(SimulationContext& ctx, const events::UnassignedFromBuilding& e) {
    entt::entity entity = world_.find(e.id);
    if (entity == entt::null) {
        ctx.diagnostics.report(ctx.now, "Unassign: unknown entity %u", e.id);
        return;
    }

    auto& registry = world_.registry();
    if (!registry.all_of<BuildingAssignment>(entity)) {
        ctx.diagnostics.report(ctx.now, "Unassign: entity %u has no building", e.id);
        return;
    }

    const auto& current = registry.get<MovementState>(entity);
    if (current.is<movement::ScaffoldWalking>() || current.is<movement::ScaffoldWorking>()) {
        ScaffoldWorkCycle::release(ctx, entity);
    }
    registry.remove<BuildingAssignment>(entity);

    SDL_Log("Entity %u unassigned", e.id);
}
