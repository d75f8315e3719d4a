#include "ScaffoldLayout.h"
#include <SDL3/SDL_log.h>

std::string scaffoldSurfaceId(const std::string& buildingId, int level, const std::string& side) {
    return buildingId + "-scaffold-f" + std::to_string(level) + "-" + side;
}

void registerScaffolding(ElevatedSurfaceRegistry& registry,
                         const std::string& buildingId,
                         const glm::vec2& buildingCenter,
                         float baseY,
                         const ScaffoldLayout& layout) {
    const float halfW = layout.buildingWidth * 0.5f;
    const float halfD = layout.buildingDepth * 0.5f;
    const float offset = layout.platformOffset;
    const float depth = layout.platformDepth;
    const float bx = buildingCenter.x;
    const float bz = buildingCenter.y;

    for (size_t i = 0; i < layout.levels.size(); i++) {
        const float levelY = baseY + layout.levels[i];
        const int floor = static_cast<int>(i) + 1;

        ElevatedSurface front;
        front.id = scaffoldSurfaceId(buildingId, floor, "front");
        front.y = levelY;
        front.parentId = buildingId;
        front.cost = layout.platformCost;
        front.bounds = {bx - halfW - depth, bx + halfW + depth,
                        bz + halfD + offset - depth * 0.5f, bz + halfD + offset + depth * 0.5f};
        registry.registerSurface(front);

        ElevatedSurface back = front;
        back.id = scaffoldSurfaceId(buildingId, floor, "back");
        back.bounds = {bx - halfW - depth, bx + halfW + depth,
                       bz - halfD - offset - depth * 0.5f, bz - halfD - offset + depth * 0.5f};
        registry.registerSurface(back);

        ElevatedSurface left = front;
        left.id = scaffoldSurfaceId(buildingId, floor, "left");
        left.bounds = {bx - halfW - offset - depth * 0.5f, bx - halfW - offset + depth * 0.5f,
                       bz - halfD - depth, bz + halfD + depth};
        registry.registerSurface(left);

        ElevatedSurface right = front;
        right.id = scaffoldSurfaceId(buildingId, floor, "right");
        right.bounds = {bx + halfW + offset - depth * 0.5f, bx + halfW + offset + depth * 0.5f,
                        bz - halfD - depth, bz + halfD + depth};
        registry.registerSurface(right);
    }

    if (layout.levels.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "registerScaffolding: '%s' has no levels", buildingId.c_str());
        return;
    }

    const float frontZ = bz + halfD + offset;

    // Ground to level 1, running out from the front platform (right side)
    ElevationConnection groundStair;
    groundStair.id = buildingId + "-stair-g-to-1";
    groundStair.lower.position = glm::vec3(bx + halfW - 0.4f, baseY + layout.groundClearance, frontZ + layout.stairDepth);
    groundStair.upper.position = glm::vec3(bx + halfW - 0.4f, baseY + layout.levels[0], frontZ);
    groundStair.upper.surfaceId = scaffoldSurfaceId(buildingId, 1, "front");
    groundStair.width = layout.stairWidth;
    groundStair.cost = layout.stairCost;
    registry.registerConnection(groundStair);

    // Ladders between consecutive front platforms (left side)
    for (size_t i = 1; i < layout.levels.size(); i++) {
        const int lowerFloor = static_cast<int>(i);
        const int upperFloor = lowerFloor + 1;

        ElevationConnection ladder;
        ladder.id = buildingId + "-stair-" + std::to_string(lowerFloor) + "-to-" + std::to_string(upperFloor);
        ladder.lower.position = glm::vec3(bx - halfW + 0.4f, baseY + layout.levels[i - 1], frontZ);
        ladder.lower.surfaceId = scaffoldSurfaceId(buildingId, lowerFloor, "front");
        ladder.upper.position = glm::vec3(bx - halfW + 0.4f, baseY + layout.levels[i], frontZ);
        ladder.upper.surfaceId = scaffoldSurfaceId(buildingId, upperFloor, "front");
        ladder.width = layout.stairWidth;
        ladder.cost = layout.stairCost;
        registry.registerConnection(ladder);
    }

    SDL_Log("registerScaffolding: '%s' with %zu levels at (%.1f, %.1f)",
            buildingId.c_str(), layout.levels.size(), bx, bz);
}

glm::vec3 scaffoldEntryPosition(const glm::vec2& buildingCenter, float baseY, const ScaffoldLayout& layout) {
    const float level = layout.levels.empty() ? 0.0f : layout.levels[0];
    return glm::vec3(buildingCenter.x,
                     baseY + level,
                     buildingCenter.y + layout.buildingDepth * 0.5f + layout.platformOffset);
}
