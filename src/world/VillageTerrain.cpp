#include "VillageTerrain.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <utility>

VillageTerrain::VillageTerrain(float worldHalfSize)
    : worldHalfSize_(worldHalfSize) {
}

void VillageTerrain::setHeightFunction(HeightQueryFunc func) {
    heightFunc_ = std::move(func);
}

void VillageTerrain::addBuilding(const BuildingFootprint& building) {
    buildings_.push_back(building);
    SDL_Log("VillageTerrain: Added building '%s' at (%.1f, %.1f) floor=%.2f",
            building.id.c_str(), building.center.x, building.center.y, building.floorY);
}

bool VillageTerrain::removeBuilding(const std::string& id) {
    auto it = std::find_if(buildings_.begin(), buildings_.end(),
                           [&id](const BuildingFootprint& b) { return b.id == id; });
    if (it == buildings_.end()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "VillageTerrain: Attempted to remove unknown building '%s'", id.c_str());
        return false;
    }
    buildings_.erase(it);
    return true;
}

void VillageTerrain::addWater(const WaterBody& water) {
    water_.push_back(water);
}

const BuildingFootprint* VillageTerrain::buildingAt(float x, float z) const {
    for (const auto& building : buildings_) {
        if (building.contains(x, z)) {
            return &building;
        }
    }
    return nullptr;
}

const BuildingFootprint* VillageTerrain::findBuilding(const std::string& id) const {
    for (const auto& building : buildings_) {
        if (building.id == id) {
            return &building;
        }
    }
    return nullptr;
}

float VillageTerrain::terrainHeight(float x, float z) const {
    return heightFunc_ ? heightFunc_(x, z) : 0.0f;
}

bool VillageTerrain::isInsideWorld(float x, float z) const {
    return std::abs(x) <= worldHalfSize_ && std::abs(z) <= worldHalfSize_;
}

bool VillageTerrain::isWater(float x, float z) const {
    return std::any_of(water_.begin(), water_.end(),
                       [x, z](const WaterBody& w) { return w.contains(x, z); });
}

bool VillageTerrain::isWalkable(float x, float z) const {
    return isInsideWorld(x, z) && !isWater(x, z) && !isInsideBuilding(x, z);
}

float VillageTerrain::groundHeight(float x, float z) const {
    if (const BuildingFootprint* building = buildingAt(x, z)) {
        return building->floorY;
    }
    return terrainHeight(x, z);
}

bool VillageTerrain::isInsideBuilding(float x, float z) const {
    return buildingAt(x, z) != nullptr;
}

std::optional<bool> VillageTerrain::regionWalkability(float minX, float minZ, float maxX, float maxZ) const {
    bool mixed = false;

    // World square
    if (minX > worldHalfSize_ || maxX < -worldHalfSize_ || minZ > worldHalfSize_ || maxZ < -worldHalfSize_) {
        return false;
    }
    if (!isInsideWorld(minX, minZ) || !isInsideWorld(maxX, maxZ)) {
        mixed = true;
    }

    for (const auto& building : buildings_) {
        const float bMinX = building.center.x - building.halfExtents.x;
        const float bMaxX = building.center.x + building.halfExtents.x;
        const float bMinZ = building.center.y - building.halfExtents.y;
        const float bMaxZ = building.center.y + building.halfExtents.y;
        if (maxX < bMinX || minX > bMaxX || maxZ < bMinZ || minZ > bMaxZ) continue;
        if (building.contains(minX, minZ) && building.contains(maxX, maxZ)) {
            return false;
        }
        mixed = true;
    }

    for (const auto& water : water_) {
        const float r2 = water.radius * water.radius;

        // Nearest point of the rectangle to the centre
        const float nx = std::clamp(water.center.x, minX, maxX);
        const float nz = std::clamp(water.center.y, minZ, maxZ);
        const glm::vec2 nearest(nx - water.center.x, nz - water.center.y);
        if (glm::dot(nearest, nearest) >= r2) continue;

        // Farthest corner inside the circle means the whole rectangle is wet
        const float fx = std::max(std::abs(minX - water.center.x), std::abs(maxX - water.center.x));
        const float fz = std::max(std::abs(minZ - water.center.y), std::abs(maxZ - water.center.y));
        if (fx * fx + fz * fz < r2) {
            return false;
        }
        mixed = true;
    }

    if (mixed) {
        return std::nullopt;
    }
    return true;
}
