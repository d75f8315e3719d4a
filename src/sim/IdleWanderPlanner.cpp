#include "IdleWanderPlanner.h"
#include "core/SimRandom.h"
#include <glm/gtc/constants.hpp>
#include <cmath>

IdleWanderPlanner::IdleWanderPlanner(const WalkabilityOracle& oracle, float worldHalfSize, float groundClearance)
    : oracle_(oracle)
    , worldHalfSize_(worldHalfSize)
    , groundClearance_(groundClearance) {
}

std::optional<glm::vec3> IdleWanderPlanner::chooseDestination(const WanderProfile& profile,
                                                              const glm::vec3& from,
                                                              const glm::vec3& home,
                                                              SimRandom& rng) const {
    lastAttempts_ = 0;

    for (int attempt = 0; attempt < profile.maxAttempts; attempt++) {
        lastAttempts_++;
        glm::vec2 candidate = sampleCandidate(profile, from, home, rng);

        if (!isAcceptable(profile, candidate.x, candidate.y)) {
            continue;
        }

        float y = oracle_.groundHeight(candidate.x, candidate.y) + groundClearance_;
        return glm::vec3(candidate.x, y, candidate.y);
    }

    return std::nullopt;
}

glm::vec2 IdleWanderPlanner::sampleCandidate(const WanderProfile& profile,
                                             const glm::vec3& from,
                                             const glm::vec3& home,
                                             SimRandom& rng) const {
    switch (profile.region) {
        case WanderRegion::WorldSquare: {
            float half = worldHalfSize_ * profile.squareFraction;
            return glm::vec2(rng.centered(2.0f * half), rng.centered(2.0f * half));
        }
        case WanderRegion::HomeDisc:
        case WanderRegion::LocalRing: {
            const glm::vec3& center = (profile.region == WanderRegion::HomeDisc) ? home : from;
            float angle = rng.unit() * glm::two_pi<float>();
            float distance = rng.range(profile.minDistance, profile.maxDistance);
            return glm::vec2(center.x + std::cos(angle) * distance,
                             center.z + std::sin(angle) * distance);
        }
    }
    return glm::vec2(from.x, from.z);
}

bool IdleWanderPlanner::isAcceptable(const WanderProfile& profile, float x, float z) const {
    float limit = worldHalfSize_ * profile.boundsFraction;
    if (std::abs(x) >= limit || std::abs(z) >= limit) {
        return false;
    }

    if (profile.originExclusion > 0.0f &&
        std::sqrt(x * x + z * z) <= profile.originExclusion) {
        return false;
    }

    if (oracle_.isInsideBuilding(x, z)) {
        return false;
    }

    return oracle_.isWalkable(x, z);
}
