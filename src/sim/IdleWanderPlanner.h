#pragma once

#include "core/SimulationConfig.h"
#include "world/WalkabilityOracle.h"
#include <glm/glm.hpp>
#include <optional>

class SimRandom;

// Picks random walkable destinations for idle entities.
// Sampling is bounded by the profile's attempt limit; callers re-arm the
// idle timer when it returns nullopt.
class IdleWanderPlanner {
public:
    IdleWanderPlanner(const WalkabilityOracle& oracle, float worldHalfSize, float groundClearance);

    // Destination on the ground (y = ground height + clearance), or nullopt once
    // maxAttempts candidates have been rejected
    std::optional<glm::vec3> chooseDestination(const WanderProfile& profile,
                                               const glm::vec3& from,
                                               const glm::vec3& home,
                                               SimRandom& rng) const;

    // One raw candidate in the profile's region, before any rejection test
    glm::vec2 sampleCandidate(const WanderProfile& profile,
                              const glm::vec3& from,
                              const glm::vec3& home,
                              SimRandom& rng) const;

    // Region-independent rejection test: bounds, origin exclusion, buildings, walkability
    bool isAcceptable(const WanderProfile& profile, float x, float z) const;

    // Candidates drawn by the most recent chooseDestination call
    int lastAttemptCount() const { return lastAttempts_; }

    float getWorldHalfSize() const { return worldHalfSize_; }

private:
    const WalkabilityOracle& oracle_;
    float worldHalfSize_;
    float groundClearance_;
    mutable int lastAttempts_ = 0;
};
