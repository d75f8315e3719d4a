#pragma once

#include "ElevatedSurfaceRegistry.h"
#include <optional>
#include <string>
#include <vector>

class SimRandom;

/**
 * A* over elevated surfaces and their stairs.
 *
 * Surfaces are sampled on a lattice of gridSize anchored at the start point.
 * Moves are 8-directional inside a surface, onto a stair when within its width
 * of a stair end, and onto an adjacent surface of the same level near a shared
 * edge. Stair moves and vertical moves cost 1.5x.
 */
class ElevatedPathfinder {
public:
    explicit ElevatedPathfinder(const ElevatedSurfaceRegistry& registry,
                                float gridSize = 0.5f,
                                int maxExpansions = 20000);

    // Path from start to goal inclusive of both ends; nullopt if unreachable
    std::optional<ElevatedPath> findPath(const ElevatedNavPoint& start, const ElevatedNavPoint& goal) const;

    // Random point on a random surface belonging to the parent; nullopt if it has none
    std::optional<ElevatedNavPoint> findRandomPointForParent(const std::string& parentId, SimRandom& rng) const;

    // Path from a ground position up to a random point on the target surface
    std::optional<ElevatedPath> findPathFromGround(float groundX, float groundZ, float groundY,
                                                   const std::string& targetSurfaceId, SimRandom& rng) const;

    float getGridSize() const { return gridSize_; }
    int getMaxExpansions() const { return maxExpansions_; }

    // Number of nodes expanded by the most recent findPath call
    int lastExpansionCount() const { return lastExpansions_; }

private:
    std::vector<ElevatedNavPoint> getNeighbors(const ElevatedNavPoint& point) const;
    void appendAdjacentSurfaces(const ElevatedSurface& current, const ElevatedNavPoint& point,
                                std::vector<ElevatedNavPoint>& out) const;

    float heuristic(const ElevatedNavPoint& from, const ElevatedNavPoint& to) const;
    float movementCost(const ElevatedNavPoint& from, const ElevatedNavPoint& to) const;
    bool isAtGoal(const ElevatedNavPoint& point, const ElevatedNavPoint& goal) const;
    std::string pointKey(const ElevatedNavPoint& point) const;

    const ElevatedSurfaceRegistry& registry_;
    float gridSize_;
    int maxExpansions_;
    mutable int lastExpansions_ = 0;
};
