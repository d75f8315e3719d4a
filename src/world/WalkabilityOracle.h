#pragma once

#include <functional>
#include <optional>

// Height query signature used by terrain providers
using HeightQueryFunc = std::function<float(float, float)>;

/**
 * Interface for ground queries consumed by movement planning and physics.
 * Implemented by VillageTerrain, decorated by WalkabilityCache.
 *
 * All queries are pure: the same (x, z) answers the same way until the
 * underlying terrain changes.
 */
class WalkabilityOracle {
public:
    virtual ~WalkabilityOracle() = default;

    // Ground is passable: inside the world, not water, not a building footprint
    virtual bool isWalkable(float x, float z) const = 0;

    // Building floor height inside a footprint, terrain height elsewhere
    virtual float groundHeight(float x, float z) const = 0;

    virtual bool isInsideBuilding(float x, float z) const = 0;

    // isWalkable answer shared by every point of the closed rectangle,
    // nullopt when it varies inside or the oracle cannot tell
    virtual std::optional<bool> regionWalkability(float /*minX*/, float /*minZ*/,
                                                  float /*maxX*/, float /*maxZ*/) const {
        return std::nullopt;
    }
};
