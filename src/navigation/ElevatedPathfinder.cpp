#include "ElevatedPathfinder.h"
#include "core/SimRandom.h"
#include <algorithm>
#include <cmath>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace {

struct PathNode {
    ElevatedNavPoint point;
    float g = 0.0f;
    float f = 0.0f;
    int parent = -1;
};

struct OpenEntry {
    float f;
    int node;
    bool operator>(const OpenEntry& other) const { return f > other.f; }
};

constexpr float SAME_LEVEL_TOLERANCE = 0.5f;
constexpr float COST_MULTIPLIER = 1.5f;

} // namespace

ElevatedPathfinder::ElevatedPathfinder(const ElevatedSurfaceRegistry& registry, float gridSize, int maxExpansions)
    : registry_(registry)
    , gridSize_(gridSize > 0.0f ? gridSize : 0.5f)
    , maxExpansions_(maxExpansions) {
}

std::optional<ElevatedPath> ElevatedPathfinder::findPath(const ElevatedNavPoint& start,
                                                         const ElevatedNavPoint& goal) const {
    std::vector<PathNode> nodes;
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<OpenEntry>> open;
    std::unordered_map<std::string, float> bestG;
    std::unordered_set<std::string> closed;

    nodes.push_back(PathNode{start, 0.0f, heuristic(start, goal), -1});
    open.push(OpenEntry{nodes.back().f, 0});
    bestG[pointKey(start)] = 0.0f;

    lastExpansions_ = 0;

    while (!open.empty()) {
        const int currentIndex = open.top().node;
        open.pop();

        // Copy: nodes may reallocate while expanding
        const PathNode current = nodes[currentIndex];

        if (isAtGoal(current.point, goal)) {
            ElevatedPath path;
            path.totalCost = current.g;
            for (int i = currentIndex; i >= 0; i = nodes[i].parent) {
                path.points.push_back(nodes[i].point);
            }
            std::reverse(path.points.begin(), path.points.end());
            return path;
        }

        const std::string currentKey = pointKey(current.point);
        if (!closed.insert(currentKey).second) continue;

        if (++lastExpansions_ > maxExpansions_) {
            return std::nullopt;
        }

        for (const auto& neighbor : getNeighbors(current.point)) {
            const std::string neighborKey = pointKey(neighbor);
            if (closed.count(neighborKey)) continue;

            const float g = current.g + movementCost(current.point, neighbor);
            auto it = bestG.find(neighborKey);
            if (it != bestG.end() && g >= it->second) continue;
            bestG[neighborKey] = g;

            nodes.push_back(PathNode{neighbor, g, g + heuristic(neighbor, goal), currentIndex});
            open.push(OpenEntry{nodes.back().f, static_cast<int>(nodes.size()) - 1});
        }
    }

    return std::nullopt;
}

std::vector<ElevatedNavPoint> ElevatedPathfinder::getNeighbors(const ElevatedNavPoint& point) const {
    std::vector<ElevatedNavPoint> neighbors;

    if (point.isStair && point.connectionId) {
        // On a stair: step off at either end
        const ElevationConnection* conn = registry_.getConnection(*point.connectionId);
        if (conn) {
            neighbors.push_back(ElevatedNavPoint::at(conn->upper.position, conn->upper.surfaceId));
            neighbors.push_back(ElevatedNavPoint::at(conn->lower.position, conn->lower.surfaceId));
        }
        return neighbors;
    }

    if (point.surfaceId) {
        const ElevatedSurface* surface = registry_.getSurface(*point.surfaceId);
        if (!surface) return neighbors;

        static const int dirs[8][2] = {
            {-1, -1}, {0, -1}, {1, -1},
            {-1, 0},           {1, 0},
            {-1, 1},  {0, 1},  {1, 1},
        };

        for (const auto& dir : dirs) {
            const float nx = point.x + static_cast<float>(dir[0]) * gridSize_;
            const float nz = point.z + static_cast<float>(dir[1]) * gridSize_;
            if (surface->bounds.contains(nx, nz)) {
                neighbors.push_back(ElevatedNavPoint::at(glm::vec3(nx, surface->y, nz), surface->id));
            }
        }

        // Stair entries within reach
        for (const ElevationConnection* conn : registry_.getConnectionsForSurface(surface->id)) {
            const ConnectionEnd& end = (conn->upper.surfaceId == surface->id) ? conn->upper : conn->lower;
            const float dx = point.x - end.position.x;
            const float dz = point.z - end.position.z;
            if (std::sqrt(dx * dx + dz * dz) < conn->width) {
                ElevatedNavPoint entry = ElevatedNavPoint::at(end.position, surface->id);
                entry.isStair = true;
                entry.connectionId = conn->id;
                neighbors.push_back(entry);
            }
        }

        appendAdjacentSurfaces(*surface, point, neighbors);
        return neighbors;
    }

    // Ground level: only stairs going up are reachable
    for (const ElevationConnection* conn : registry_.getGroundConnections()) {
        const float dx = point.x - conn->lower.position.x;
        const float dz = point.z - conn->lower.position.z;
        if (std::sqrt(dx * dx + dz * dz) < conn->width + gridSize_) {
            ElevatedNavPoint entry = ElevatedNavPoint::at(conn->lower.position);
            entry.isStair = true;
            entry.connectionId = conn->id;
            neighbors.push_back(entry);
        }
    }
    return neighbors;
}

void ElevatedPathfinder::appendAdjacentSurfaces(const ElevatedSurface& current, const ElevatedNavPoint& point,
                                                std::vector<ElevatedNavPoint>& out) const {
    const float tolerance = gridSize_ * 2.0f;
    const SurfaceBounds& cb = current.bounds;

    const bool nearEdgeX = point.x <= cb.minX + tolerance || point.x >= cb.maxX - tolerance;
    const bool nearEdgeZ = point.z <= cb.minZ + tolerance || point.z >= cb.maxZ - tolerance;
    if (!nearEdgeX && !nearEdgeZ) return;

    for (const auto& surface : registry_.getAllSurfaces()) {
        if (surface.id == current.id) continue;
        if (std::abs(surface.y - current.y) > SAME_LEVEL_TOLERANCE) continue;

        const SurfaceBounds& sb = surface.bounds;
        const bool overlapX = !(sb.maxX < cb.minX - tolerance || sb.minX > cb.maxX + tolerance);
        const bool overlapZ = !(sb.maxZ < cb.minZ - tolerance || sb.minZ > cb.maxZ + tolerance);
        if (!overlapX || !overlapZ) continue;

        // Closest point on the neighbor must actually be within reach
        const glm::vec2 clamped = sb.clamp(point.x, point.z);
        const float dx = clamped.x - point.x;
        const float dz = clamped.y - point.z;
        if (std::sqrt(dx * dx + dz * dz) > tolerance) continue;

        out.push_back(ElevatedNavPoint::at(glm::vec3(clamped.x, surface.y, clamped.y), surface.id));
    }
}

float ElevatedPathfinder::heuristic(const ElevatedNavPoint& from, const ElevatedNavPoint& to) const {
    return glm::length(to.position() - from.position());
}

float ElevatedPathfinder::movementCost(const ElevatedNavPoint& from, const ElevatedNavPoint& to) const {
    const glm::vec3 delta = to.position() - from.position();
    float cost = glm::length(delta);

    if (from.isStair || to.isStair) {
        cost *= COST_MULTIPLIER;
    }
    if (std::abs(delta.y) > 0.1f) {
        cost *= COST_MULTIPLIER;
    }
    return cost;
}

bool ElevatedPathfinder::isAtGoal(const ElevatedNavPoint& point, const ElevatedNavPoint& goal) const {
    return std::abs(point.x - goal.x) < gridSize_ &&
           std::abs(point.z - goal.z) < gridSize_ &&
           std::abs(point.y - goal.y) < SAME_LEVEL_TOLERANCE;
}

std::string ElevatedPathfinder::pointKey(const ElevatedNavPoint& point) const {
    const long x = std::lround(point.x / gridSize_);
    const long z = std::lround(point.z / gridSize_);
    const long y = std::lround(point.y * 2.0f);
    std::string key = std::to_string(x) + "," + std::to_string(z) + "," + std::to_string(y) + ",";
    key += point.surfaceId ? *point.surfaceId : "g";
    if (point.isStair) key += ",s";
    return key;
}

std::optional<ElevatedNavPoint> ElevatedPathfinder::findRandomPointForParent(const std::string& parentId,
                                                                             SimRandom& rng) const {
    const auto surfaces = registry_.getSurfacesForParent(parentId);
    if (surfaces.empty()) return std::nullopt;

    const ElevatedSurface* surface = surfaces[rng.index(surfaces.size())];
    return registry_.getRandomPointOnSurface(surface->id, rng);
}

std::optional<ElevatedPath> ElevatedPathfinder::findPathFromGround(float groundX, float groundZ, float groundY,
                                                                   const std::string& targetSurfaceId,
                                                                   SimRandom& rng) const {
    const ElevatedNavPoint start = ElevatedNavPoint::at(glm::vec3(groundX, groundY, groundZ));

    const auto target = registry_.getRandomPointOnSurface(targetSurfaceId, rng);
    if (!target) return std::nullopt;

    return findPath(start, *target);
}
