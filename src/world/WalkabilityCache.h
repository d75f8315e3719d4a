#pragma once

#include "WalkabilityOracle.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

// Memoises isWalkable on a fixed grid in front of another oracle.
// Cells are keyed by floor(x / resolution), floor(z / resolution). A cell
// stores an answer only when the source reports it uniform over the whole
// cell; mixed cells (shore lines, footprint edges) forward every query.
// Height and building queries pass straight through.
class WalkabilityCache : public WalkabilityOracle {
public:
    WalkabilityCache(const WalkabilityOracle& source, float resolution = 0.5f);

    bool isWalkable(float x, float z) const override;
    float groundHeight(float x, float z) const override;
    bool isInsideBuilding(float x, float z) const override;

    // Call when buildings or water change
    void invalidate();

    size_t cachedCells() const { return cells_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    size_t passThroughs() const { return passThroughs_; }
    float getResolution() const { return resolution_; }

private:
    uint64_t cellKey(float x, float z) const;

    const WalkabilityOracle& source_;
    float resolution_;
    // nullopt marks a mixed cell
    mutable std::unordered_map<uint64_t, std::optional<bool>> cells_;
    mutable size_t hits_ = 0;
    mutable size_t misses_ = 0;
    mutable size_t passThroughs_ = 0;
};
