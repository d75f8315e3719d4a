#include "WalkabilityCache.h"
#include <SDL3/SDL_log.h>
#include <cmath>

WalkabilityCache::WalkabilityCache(const WalkabilityOracle& source, float resolution)
    : source_(source)
    , resolution_(resolution > 0.0f ? resolution : 0.5f) {
}

uint64_t WalkabilityCache::cellKey(float x, float z) const {
    auto cx = static_cast<int32_t>(std::floor(x / resolution_));
    auto cz = static_cast<int32_t>(std::floor(z / resolution_));
    return (static_cast<uint64_t>(static_cast<uint32_t>(cx)) << 32) |
           static_cast<uint64_t>(static_cast<uint32_t>(cz));
}

bool WalkabilityCache::isWalkable(float x, float z) const {
    const auto cx = static_cast<int32_t>(std::floor(x / resolution_));
    const auto cz = static_cast<int32_t>(std::floor(z / resolution_));
    const uint64_t key = cellKey(x, z);

    auto it = cells_.find(key);
    if (it == cells_.end()) {
        misses_++;
        // Padded so rounding in the cell index never leaves x or z outside the tested region
        const float pad = resolution_ * 0.001f;
        const float minX = static_cast<float>(cx) * resolution_ - pad;
        const float minZ = static_cast<float>(cz) * resolution_ - pad;
        const float maxX = static_cast<float>(cx + 1) * resolution_ + pad;
        const float maxZ = static_cast<float>(cz + 1) * resolution_ + pad;
        it = cells_.emplace(key, source_.regionWalkability(minX, minZ, maxX, maxZ)).first;
    } else {
        hits_++;
    }

    if (it->second) {
        return *it->second;
    }
    passThroughs_++;
    return source_.isWalkable(x, z);
}

float WalkabilityCache::groundHeight(float x, float z) const {
    return source_.groundHeight(x, z);
}

bool WalkabilityCache::isInsideBuilding(float x, float z) const {
    return source_.isInsideBuilding(x, z);
}

void WalkabilityCache::invalidate() {
    if (!cells_.empty()) {
        SDL_Log("WalkabilityCache: Invalidated %zu cells", cells_.size());
    }
    cells_.clear();
}
