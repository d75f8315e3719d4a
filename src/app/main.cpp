#include "navigation/ScaffoldLayout.h"
#include "sim/TickDriver.h"
#include "world/VillageTerrain.h"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

static void printUsage(const char* progName) {
    SDL_Log("Usage: %s [options]", progName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <path>     Load simulation settings from a JSON file");
    SDL_Log("  --seconds <n>       Simulated time to run (default 30)");
    SDL_Log("  --minions <n>       Number of minions to spawn (default 6)");
    SDL_Log("  --verbose           Log every movement state change");
}

// Rolling hills, low enough that thrown minions bounce plausibly
static float villageHeight(float x, float z) {
    return 0.3f * std::sin(x * 0.15f) * std::cos(z * 0.12f);
}

static void logSummary(const TickDriver& sim) {
    const auto& world = sim.world();
    SDL_Log("t=%.1fs ticks=%llu entities=%zu diagnostics=%zu",
            sim.simTime(), static_cast<unsigned long long>(sim.tickCount()),
            world.entityCount(), sim.diagnostics().totalReported());

    for (EntityId id : world.ids()) {
        const auto* info = world.get<EntityInfo>(id);
        const auto* transform = world.getTransform(id);
        auto tag = world.getMovementTag(id);
        if (!info || !transform || !tag) continue;
        SDL_Log("  %-10s %-8s %-16s (%.1f, %.1f, %.1f)",
                info->name.c_str(), entityKindName(info->kind), movementTagName(*tag),
                transform->position.x, transform->position.y, transform->position.z);
    }
}

int main(int argc, char* argv[]) {
    std::string configPath;
    float seconds = 30.0f;
    int minionCount = 6;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::strtof(argv[++i], nullptr);
        } else if (arg == "--minions" && i + 1 < argc) {
            minionCount = std::atoi(argv[++i]);
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
        }
    }

    if (verbose) {
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
    }

    TickDriver::InitInfo info{};
    if (!configPath.empty()) {
        info.config = SimulationConfig::loadFromJson(configPath);
    }

    VillageTerrain terrain(info.config.world.worldHalfSize);
    terrain.setHeightFunction(villageHeight);

    const glm::vec2 hallCenter(10.0f, -6.0f);
    terrain.addBuilding(BuildingFootprint{"hall", hallCenter, glm::vec2(3.0f, 2.5f), 0.0f});
    terrain.addWater(WaterBody{glm::vec2(-12.0f, 8.0f), 4.0f});

    ElevatedSurfaceRegistry surfaces;
    registerScaffolding(surfaces, "hall", hallCenter);

    info.oracle = &terrain;
    info.surfaces = &surfaces;

    auto sim = TickDriver::create(info);
    if (!sim) {
        return 1;
    }

    sim->setReactionCallback([](EntityId subject, Reaction reaction) {
        SDL_Log("Minion %u reacts with %d", subject, static_cast<int>(reaction));
    });

    sim->spawnWizard();

    std::vector<EntityId> minions;
    for (int i = 0; i < minionCount; ++i) {
        float angle = 6.2831853f * static_cast<float>(i) / static_cast<float>(std::max(minionCount, 1));
        glm::vec3 position(6.0f * std::cos(angle), 0.0f, 6.0f * std::sin(angle));
        minions.push_back(sim->spawnMinion("Minion" + std::to_string(i + 1), position));
    }
    for (int i = 0; i < 3; ++i) {
        sim->spawnWildlife("Rabbit" + std::to_string(i + 1), glm::vec3(-20.0f + 8.0f * i, 0.0f, -20.0f));
    }

    // Scripted interactions at fixed simulated times
    const float frame = 1.0f / 60.0f;
    const int totalTicks = static_cast<int>(seconds / frame);
    const glm::vec3 entry = scaffoldEntryPosition(hallCenter);

    for (int tick = 0; tick < totalTicks; ++tick) {
        float t = tick * frame;

        if (tick == static_cast<int>(1.0f / frame) && minions.size() > 0) {
            sim->post(events::AssignedToBuilding{minions[0], "hall", entry});
        }
        if (tick == static_cast<int>(2.0f / frame) && minions.size() > 1) {
            sim->post(events::EntityThrown{minions[1], glm::vec3(0.0f, 3.0f, 0.0f), glm::vec3(4.0f, 10.0f, 2.0f)});
        }
        if (tick == static_cast<int>(5.0f / frame) && minions.size() > 2) {
            sim->post(events::EntitySelected{minions[2]});
        }
        if (tick == static_cast<int>(8.0f / frame)) {
            sim->post(events::ConversationCancelled{});
        }
        if (tick == static_cast<int>(12.0f / frame)) {
            sim->post(events::ToggleFirstPerson{});
        }
        if (t > 12.5f && t < 15.0f) {
            sim->setFirstPersonInput(FirstPersonInput{1.0f, 0.0f, 0.5f});
        } else {
            sim->setFirstPersonInput(FirstPersonInput{});
        }
        if (tick == static_cast<int>(16.0f / frame)) {
            sim->post(events::ToggleFirstPerson{});
        }

        sim->tick(frame);

        if (tick % static_cast<int>(10.0f / frame) == 0) {
            logSummary(*sim);
        }
    }

    logSummary(*sim);
    for (const auto& diagnostic : sim->diagnostics().entries()) {
        SDL_Log("diagnostic [t=%.2f] %s", diagnostic.time, diagnostic.message.c_str());
    }

    return 0;
}
