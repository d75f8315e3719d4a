#pragma once

#include "WalkabilityOracle.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

// Axis-aligned building footprint with the height of its floor
struct BuildingFootprint {
    std::string id;
    glm::vec2 center{0.0f};      // XZ
    glm::vec2 halfExtents{3.0f, 2.5f};
    float floorY = 0.0f;

    bool contains(float x, float z) const {
        return x >= center.x - halfExtents.x && x <= center.x + halfExtents.x &&
               z >= center.y - halfExtents.y && z <= center.y + halfExtents.y;
    }
};

// Circular pond or river pool
struct WaterBody {
    glm::vec2 center{0.0f};      // XZ
    float radius = 1.0f;

    bool contains(float x, float z) const {
        glm::vec2 d(x - center.x, z - center.y);
        return glm::dot(d, d) < radius * radius;
    }
};

// Concrete ground oracle for the village: square world, height function,
// building footprints and water bodies.
class VillageTerrain : public WalkabilityOracle {
public:
    explicit VillageTerrain(float worldHalfSize = 40.0f);

    // Replace the terrain height function (defaults to flat y = 0)
    void setHeightFunction(HeightQueryFunc func);

    void addBuilding(const BuildingFootprint& building);
    bool removeBuilding(const std::string& id);
    void addWater(const WaterBody& water);
    void clearWater() { water_.clear(); }

    // Returns nullptr if no footprint covers (x, z)
    const BuildingFootprint* buildingAt(float x, float z) const;
    const BuildingFootprint* findBuilding(const std::string& id) const;

    // Raw terrain height, ignoring building floors
    float terrainHeight(float x, float z) const;

    bool isInsideWorld(float x, float z) const;
    bool isWater(float x, float z) const;

    // WalkabilityOracle
    bool isWalkable(float x, float z) const override;
    float groundHeight(float x, float z) const override;
    bool isInsideBuilding(float x, float z) const override;
    std::optional<bool> regionWalkability(float minX, float minZ, float maxX, float maxZ) const override;

    float getWorldHalfSize() const { return worldHalfSize_; }
    const std::vector<BuildingFootprint>& getBuildings() const { return buildings_; }
    const std::vector<WaterBody>& getWater() const { return water_; }

private:
    float worldHalfSize_;
    HeightQueryFunc heightFunc_;
    std::vector<BuildingFootprint> buildings_;
    std::vector<WaterBody> water_;
};
