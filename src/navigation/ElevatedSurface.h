#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// XZ rectangle of an elevated surface
struct SurfaceBounds {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minZ = 0.0f;
    float maxZ = 0.0f;

    bool contains(float x, float z) const {
        return x >= minX && x <= maxX && z >= minZ && z <= maxZ;
    }

    glm::vec2 center() const {
        return glm::vec2((minX + maxX) * 0.5f, (minZ + maxZ) * 0.5f);
    }

    glm::vec2 clamp(float x, float z) const {
        return glm::vec2(glm::clamp(x, minX, maxX), glm::clamp(z, minZ, maxZ));
    }
};

// A walkable platform at a fixed height (scaffold deck, bridge, walkway)
struct ElevatedSurface {
    std::string id;
    float y = 0.0f;
    SurfaceBounds bounds;
    std::string parentId;        // Owning building, empty if none
    float cost = 1.0f;           // Movement cost multiplier
};

// One end of a stair. An empty surfaceId means ground level.
struct ConnectionEnd {
    glm::vec3 position{0.0f};
    std::optional<std::string> surfaceId;
};

// Stair or ramp between two elevations
struct ElevationConnection {
    std::string id;
    ConnectionEnd lower;
    ConnectionEnd upper;
    float width = 0.8f;
    float cost = 1.5f;
};

// A point on the elevated navigation graph
struct ElevatedNavPoint {
    float x = 0.0f;
    float z = 0.0f;
    float y = 0.0f;
    std::optional<std::string> surfaceId;    // nullopt = ground level
    bool isStair = false;
    std::optional<std::string> connectionId; // Set on stair entry points

    glm::vec3 position() const { return glm::vec3(x, y, z); }

    static ElevatedNavPoint at(const glm::vec3& p, std::optional<std::string> surface = std::nullopt) {
        ElevatedNavPoint point;
        point.x = p.x;
        point.y = p.y;
        point.z = p.z;
        point.surfaceId = std::move(surface);
        return point;
    }
};

// Ordered waypoints from start to goal; replaced wholesale, never edited
struct ElevatedPath {
    std::vector<ElevatedNavPoint> points;
    float totalCost = 0.0f;

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }
};
