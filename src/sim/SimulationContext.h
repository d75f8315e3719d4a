#pragma once

#include "core/DiagnosticLog.h"
#include "core/SimRandom.h"
#include "core/SimulationConfig.h"
#include "ecs/World.h"
#include "navigation/ElevatedPathfinder.h"
#include "navigation/ElevatedSurfaceRegistry.h"
#include "sim/IdleWanderPlanner.h"
#include "world/WalkabilityOracle.h"

// Everything a simulation system may touch during one tick.
// Built by the TickDriver; tests assemble their own around isolated instances.
struct SimulationContext {
    ecs::World& world;
    const WalkabilityOracle& oracle;
    const IdleWanderPlanner& planner;
    const ElevatedSurfaceRegistry& surfaces;
    const ElevatedPathfinder& pathfinder;
    SimRandom& rng;
    DiagnosticLog& diagnostics;
    const SimulationConfig& config;
    double now = 0.0;       // Simulation time in seconds
};
