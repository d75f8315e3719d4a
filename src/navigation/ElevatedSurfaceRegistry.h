#pragma once

#include "ElevatedSurface.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class SimRandom;

/**
 * Registry of elevated walkable surfaces and the stairs connecting them.
 *
 * Works alongside ground-level walkability: entities can stand under a
 * platform, and several surfaces may share the same X,Z at different heights.
 * Iteration order is registration order so queries are deterministic.
 *
 * Pointers returned by lookups stay valid until the next register/unregister call.
 */
class ElevatedSurfaceRegistry {
public:
    ElevatedSurfaceRegistry() = default;

    // Non-copyable, movable
    ElevatedSurfaceRegistry(const ElevatedSurfaceRegistry&) = delete;
    ElevatedSurfaceRegistry& operator=(const ElevatedSurfaceRegistry&) = delete;
    ElevatedSurfaceRegistry(ElevatedSurfaceRegistry&&) = default;
    ElevatedSurfaceRegistry& operator=(ElevatedSurfaceRegistry&&) = default;

    // Register or replace a surface with the same id
    void registerSurface(const ElevatedSurface& surface);

    // Register or replace a connection with the same id
    void registerConnection(const ElevationConnection& connection);

    // Remove every surface of a parent and every connection touching them.
    // Returns the number of surfaces removed.
    size_t unregisterByParent(const std::string& parentId);

    // Surface whose bounds contain (x, z) and whose height is within tolerance of y
    const ElevatedSurface* getSurfaceAt(float x, float z, float y, float tolerance = 0.5f) const;

    // All surfaces covering (x, z), lowest first
    std::vector<const ElevatedSurface*> getSurfacesAtXZ(float x, float z) const;

    const ElevatedSurface* getSurface(const std::string& id) const;
    const ElevationConnection* getConnection(const std::string& id) const;

    std::vector<const ElevationConnection*> getConnectionsForSurface(const std::string& surfaceId) const;

    // Connections whose lower end is on the ground
    std::vector<const ElevationConnection*> getGroundConnections() const;

    std::vector<const ElevatedSurface*> getSurfacesForParent(const std::string& parentId) const;

    // Uniform point inside a surface's bounds, nullopt for an unknown id
    std::optional<ElevatedNavPoint> getRandomPointOnSurface(const std::string& surfaceId, SimRandom& rng) const;

    // Nearest surface by 3D distance to the closest point of its bounds. An empty parentId searches all surfaces.
    const ElevatedSurface* findNearestSurface(float x, float z, float y,
                                              const std::string& parentId = {}) const;

    const std::vector<ElevatedSurface>& getAllSurfaces() const { return surfaces_; }
    const std::vector<ElevationConnection>& getAllConnections() const { return connections_; }
    size_t surfaceCount() const { return surfaces_.size(); }
    size_t connectionCount() const { return connections_.size(); }

    void clear();

private:
    std::vector<ElevatedSurface> surfaces_;
    std::vector<ElevationConnection> connections_;
    std::unordered_map<std::string, std::vector<std::string>> surfacesByParent_;
};
