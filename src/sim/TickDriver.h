#pragma once

#include "core/DiagnosticLog.h"
#include "core/SimRandom.h"
#include "core/SimulationConfig.h"
#include "ecs/World.h"
#include "navigation/ElevatedPathfinder.h"
#include "navigation/ElevatedSurfaceRegistry.h"
#include "sim/ConversationCoordinator.h"
#include "sim/EventInbox.h"
#include "sim/FirstPersonController.h"
#include "sim/IdleWanderPlanner.h"
#include "sim/ModeCoordinator.h"
#include "sim/SimulationContext.h"
#include "world/WalkabilityCache.h"
#include "world/WalkabilityOracle.h"
#include <cstdint>
#include <memory>
#include <string>

/**
 * TickDriver - Owns the village simulation and advances it one frame at a time
 *
 * Each tick, in order:
 *   1. Clamp the frame delta and advance the simulation clock
 *   2. Apply queued interaction/UI events
 *   3. Fire conversation and camera-mode deadlines
 *   4. Move the first-person avatar
 *   5. Movement FSM for every autonomous entity
 *   6. Projectile physics for thrown entities
 *   7. Animation and pose write-back for rendering
 *
 * Usage:
 *   TickDriver::InitInfo info{};
 *   info.oracle = &terrain;
 *   auto sim = TickDriver::create(info);
 *   sim->spawnWizard();
 *   EntityId bob = sim->spawnMinion("Bob", {4, 0, 4});
 *
 *   // Each frame:
 *   sim->post(events::EntitySelected{bob});
 *   sim->tick(frameSeconds);
 */
class TickDriver {
public:
    struct ConstructToken { explicit ConstructToken() = default; };

    struct InitInfo {
        const WalkabilityOracle* oracle = nullptr;      // Required, must outlive the driver
        ElevatedSurfaceRegistry* surfaces = nullptr;    // Optional; the driver owns one when null
        SimulationConfig config;
        bool cacheWalkability = true;                   // Wrap the oracle in a WalkabilityCache
    };

    /**
     * Factory: Create and initialize the simulation.
     * Returns nullptr on failure.
     */
    static std::unique_ptr<TickDriver> create(const InitInfo& info);

    explicit TickDriver(ConstructToken);
    ~TickDriver();

    // Non-copyable, non-movable
    TickDriver(const TickDriver&) = delete;
    TickDriver& operator=(const TickDriver&) = delete;
    TickDriver(TickDriver&&) = delete;
    TickDriver& operator=(TickDriver&&) = delete;

    // Advance the simulation by one frame of wall-clock time
    void tick(float realDeltaSeconds);

    // Queue an event for the next tick; false when the inbox is full
    bool post(SimulationEvent event);

    void setFirstPersonInput(const FirstPersonInput& input) { firstPersonInput_ = input; }

    // Spawning
    EntityId spawnMinion(const std::string& name, const glm::vec3& position);
    EntityId spawnWizard();
    EntityId spawnWildlife(const std::string& name, const glm::vec3& position, float speed = 3.0f);
    EntityId spawnProp(const std::string& name, const glm::vec3& position);
    bool removeEntity(EntityId id);

    // Call after buildings or water change on the oracle
    void invalidateWalkability();

    // State
    ecs::World& world() { return world_; }
    const ecs::World& world() const { return world_; }
    const ConversationState& conversation() const { return conversation_.state(); }
    const ModeState& mode() const { return mode_.state(); }
    InteractionMode interactionMode() const { return mode_.interactionMode(conversation_.state()); }
    bool orbitControlsEnabled() const { return mode_.orbitControlsEnabled(conversation_.state()); }
    bool isMenuOpen() const { return mode_.isMenuOpen(); }

    DiagnosticLog& diagnostics() { return diagnostics_; }
    const DiagnosticLog& diagnostics() const { return diagnostics_; }
    ElevatedSurfaceRegistry& surfaces() { return *surfaces_; }
    const ElevatedPathfinder& pathfinder() const { return *pathfinder_; }
    const SimulationConfig& config() const { return config_; }
    const EventInbox& inbox() const { return inbox_; }

    double simTime() const { return simTime_; }
    uint64_t tickCount() const { return tickCount_; }

    // Camera eye while in first person; nullopt otherwise
    std::optional<glm::vec3> firstPersonEyePosition() const;

    void setReactionCallback(ReactionCallback callback) { conversation_.setReactionCallback(std::move(callback)); }

private:
    bool initInternal(const InitInfo& info);
    SimulationContext makeContext();

    void applyEvent(SimulationContext& ctx, const SimulationEvent& event);
    entt::entity resolveForInteraction(SimulationContext& ctx, EntityId id, const char* action);

    void onThrown(SimulationContext& ctx, const events::EntityThrown& e);
    void onHeld(SimulationContext& ctx, EntityId id, MovementState::Variant held, const char* action);
    void onHeldMoved(SimulationContext& ctx, const events::HeldEntityMoved& e);
    void onReleased(SimulationContext& ctx, const events::EntityReleased& e);
    void onSelected(SimulationContext& ctx, const events::EntitySelected& e);
    void onAssigned(SimulationContext& ctx, const events::AssignedToBuilding& e);
    void onUnassigned(SimulationContext& ctx, const events::UnassignedFromBuilding& e);

    SimulationConfig config_;
    const WalkabilityOracle* terrain_ = nullptr;
    std::unique_ptr<WalkabilityCache> walkabilityCache_;
    const WalkabilityOracle* oracle_ = nullptr;     // terrain_ or the cache in front of it

    std::unique_ptr<ElevatedSurfaceRegistry> ownedSurfaces_;
    ElevatedSurfaceRegistry* surfaces_ = nullptr;
    std::unique_ptr<ElevatedPathfinder> pathfinder_;
    std::unique_ptr<IdleWanderPlanner> planner_;

    SimRandom rng_;
    DiagnosticLog diagnostics_;
    EventInbox inbox_;
    ecs::World world_;

    ConversationCoordinator conversation_;
    ModeCoordinator mode_;
    FirstPersonInput firstPersonInput_;

    double simTime_ = 0.0;
    uint64_t tickCount_ = 0;
    uint32_t minionsSpawned_ = 0;
};
