#include "ElevatedSurfaceRegistry.h"
#include "core/SimRandom.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <limits>

void ElevatedSurfaceRegistry::registerSurface(const ElevatedSurface& surface) {
    auto it = std::find_if(surfaces_.begin(), surfaces_.end(),
                           [&surface](const ElevatedSurface& s) { return s.id == surface.id; });
    if (it != surfaces_.end()) {
        if (it->parentId != surface.parentId) {
            auto parentIt = surfacesByParent_.find(it->parentId);
            if (parentIt != surfacesByParent_.end()) {
                auto& ids = parentIt->second;
                ids.erase(std::remove(ids.begin(), ids.end(), surface.id), ids.end());
                if (ids.empty()) {
                    surfacesByParent_.erase(parentIt);
                }
            }
            if (!surface.parentId.empty()) {
                surfacesByParent_[surface.parentId].push_back(surface.id);
            }
        }
        *it = surface;
        return;
    }

    surfaces_.push_back(surface);
    if (!surface.parentId.empty()) {
        surfacesByParent_[surface.parentId].push_back(surface.id);
    }
}

void ElevatedSurfaceRegistry::registerConnection(const ElevationConnection& connection) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&connection](const ElevationConnection& c) { return c.id == connection.id; });
    if (it != connections_.end()) {
        *it = connection;
        return;
    }
    connections_.push_back(connection);
}

size_t ElevatedSurfaceRegistry::unregisterByParent(const std::string& parentId) {
    auto parentIt = surfacesByParent_.find(parentId);
    if (parentIt == surfacesByParent_.end()) {
        return 0;
    }

    const std::vector<std::string> removedIds = std::move(parentIt->second);
    surfacesByParent_.erase(parentIt);

    auto isRemoved = [&removedIds](const std::string& id) {
        return std::find(removedIds.begin(), removedIds.end(), id) != removedIds.end();
    };

    surfaces_.erase(std::remove_if(surfaces_.begin(), surfaces_.end(),
                                   [&](const ElevatedSurface& s) { return isRemoved(s.id); }),
                    surfaces_.end());

    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [&](const ElevationConnection& c) {
                                          return (c.upper.surfaceId && isRemoved(*c.upper.surfaceId)) ||
                                                 (c.lower.surfaceId && isRemoved(*c.lower.surfaceId));
                                      }),
                       connections_.end());

    SDL_Log("ElevatedSurfaceRegistry: Unregistered %zu surfaces for '%s'", removedIds.size(), parentId.c_str());
    return removedIds.size();
}

const ElevatedSurface* ElevatedSurfaceRegistry::getSurfaceAt(float x, float z, float y, float tolerance) const {
    for (const auto& surface : surfaces_) {
        if (surface.bounds.contains(x, z) && std::abs(y - surface.y) < tolerance) {
            return &surface;
        }
    }
    return nullptr;
}

std::vector<const ElevatedSurface*> ElevatedSurfaceRegistry::getSurfacesAtXZ(float x, float z) const {
    std::vector<const ElevatedSurface*> result;
    for (const auto& surface : surfaces_) {
        if (surface.bounds.contains(x, z)) {
            result.push_back(&surface);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ElevatedSurface* a, const ElevatedSurface* b) { return a->y < b->y; });
    return result;
}

const ElevatedSurface* ElevatedSurfaceRegistry::getSurface(const std::string& id) const {
    for (const auto& surface : surfaces_) {
        if (surface.id == id) return &surface;
    }
    return nullptr;
}

const ElevationConnection* ElevatedSurfaceRegistry::getConnection(const std::string& id) const {
    for (const auto& conn : connections_) {
        if (conn.id == id) return &conn;
    }
    return nullptr;
}

std::vector<const ElevationConnection*> ElevatedSurfaceRegistry::getConnectionsForSurface(
    const std::string& surfaceId) const {
    std::vector<const ElevationConnection*> result;
    for (const auto& conn : connections_) {
        if (conn.upper.surfaceId == surfaceId || conn.lower.surfaceId == surfaceId) {
            result.push_back(&conn);
        }
    }
    return result;
}

std::vector<const ElevationConnection*> ElevatedSurfaceRegistry::getGroundConnections() const {
    std::vector<const ElevationConnection*> result;
    for (const auto& conn : connections_) {
        if (!conn.lower.surfaceId) {
            result.push_back(&conn);
        }
    }
    return result;
}

std::vector<const ElevatedSurface*> ElevatedSurfaceRegistry::getSurfacesForParent(const std::string& parentId) const {
    std::vector<const ElevatedSurface*> result;
    auto it = surfacesByParent_.find(parentId);
    if (it == surfacesByParent_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        if (const ElevatedSurface* surface = getSurface(id)) {
            result.push_back(surface);
        }
    }
    return result;
}

std::optional<ElevatedNavPoint> ElevatedSurfaceRegistry::getRandomPointOnSurface(
    const std::string& surfaceId, SimRandom& rng) const {
    const ElevatedSurface* surface = getSurface(surfaceId);
    if (!surface) return std::nullopt;

    ElevatedNavPoint point;
    point.x = rng.range(surface->bounds.minX, surface->bounds.maxX);
    point.z = rng.range(surface->bounds.minZ, surface->bounds.maxZ);
    point.y = surface->y;
    point.surfaceId = surface->id;
    return point;
}

const ElevatedSurface* ElevatedSurfaceRegistry::findNearestSurface(float x, float z, float y,
                                                                   const std::string& parentId) const {
    const ElevatedSurface* nearest = nullptr;
    float nearestDist = std::numeric_limits<float>::max();

    for (const auto& surface : surfaces_) {
        if (!parentId.empty() && surface.parentId != parentId) continue;

        glm::vec2 closest = surface.bounds.clamp(x, z);
        glm::vec3 delta(x - closest.x, y - surface.y, z - closest.y);
        float dist = glm::length(delta);
        if (dist < nearestDist) {
            nearestDist = dist;
            nearest = &surface;
        }
    }
    return nearest;
}

void ElevatedSurfaceRegistry::clear() {
    surfaces_.clear();
    connections_.clear();
    surfacesByParent_.clear();
}
