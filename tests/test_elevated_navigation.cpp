#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <algorithm>

#include "core/SimRandom.h"
#include "navigation/ElevatedPathfinder.h"
#include "navigation/ElevatedSurfaceRegistry.h"
#include "navigation/ScaffoldLayout.h"

namespace {

ElevatedSurface makeDeck(const std::string& id, float y, SurfaceBounds bounds, const std::string& parent = "") {
    ElevatedSurface surface;
    surface.id = id;
    surface.y = y;
    surface.bounds = bounds;
    surface.parentId = parent;
    return surface;
}

bool hasStair(const ElevatedPath& path) {
    return std::any_of(path.points.begin(), path.points.end(),
                       [](const ElevatedNavPoint& p) { return p.isStair; });
}

} // namespace

TEST_SUITE("ElevatedSurfaceRegistry") {
    TEST_CASE("finds surfaces by position and height tolerance") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("low", 2.0f, {0.0f, 4.0f, 0.0f, 4.0f}));
        registry.registerSurface(makeDeck("high", 5.0f, {0.0f, 4.0f, 0.0f, 4.0f}));

        const ElevatedSurface* low = registry.getSurfaceAt(1.0f, 1.0f, 2.3f);
        REQUIRE(low != nullptr);
        CHECK(low->id == "low");

        const ElevatedSurface* high = registry.getSurfaceAt(1.0f, 1.0f, 4.8f, 0.5f);
        REQUIRE(high != nullptr);
        CHECK(high->id == "high");

        CHECK(registry.getSurfaceAt(1.0f, 1.0f, 3.5f, 0.5f) == nullptr);
        CHECK(registry.getSurfaceAt(6.0f, 1.0f, 2.0f) == nullptr);
    }

    TEST_CASE("surfaces at a column come back lowest first") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("top", 7.0f, {0.0f, 2.0f, 0.0f, 2.0f}));
        registry.registerSurface(makeDeck("bottom", 1.0f, {0.0f, 2.0f, 0.0f, 2.0f}));
        registry.registerSurface(makeDeck("middle", 4.0f, {0.0f, 2.0f, 0.0f, 2.0f}));

        auto column = registry.getSurfacesAtXZ(1.0f, 1.0f);
        REQUIRE(column.size() == 3);
        CHECK(column[0]->id == "bottom");
        CHECK(column[1]->id == "middle");
        CHECK(column[2]->id == "top");
    }

    TEST_CASE("registering an existing id replaces it") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("deck", 2.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "hall"));
        registry.registerSurface(makeDeck("deck", 3.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "hall"));

        CHECK(registry.surfaceCount() == 1);
        CHECK(registry.getSurface("deck")->y == doctest::Approx(3.0f));
        CHECK(registry.getSurfacesForParent("hall").size() == 1);
    }

    TEST_CASE("re-registering under another parent moves the surface") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("deck", 2.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "hall"));
        registry.registerSurface(makeDeck("deck", 2.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "barn"));

        CHECK(registry.getSurfacesForParent("hall").empty());
        REQUIRE(registry.getSurfacesForParent("barn").size() == 1);
        CHECK(registry.getSurfacesForParent("barn")[0]->id == "deck");

        CHECK(registry.unregisterByParent("hall") == 0);
        CHECK(registry.surfaceCount() == 1);
        CHECK(registry.unregisterByParent("barn") == 1);
        CHECK(registry.surfaceCount() == 0);
    }

    TEST_CASE("unregistering a parent drops its surfaces and their stairs") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));
        registerScaffolding(registry, "barn", glm::vec2(20.0f, 0.0f));

        CHECK(registry.surfaceCount() == 16);
        CHECK(registry.connectionCount() == 4);

        CHECK(registry.unregisterByParent("hall") == 8);
        CHECK(registry.surfaceCount() == 8);
        CHECK(registry.connectionCount() == 2);
        CHECK(registry.getSurfacesForParent("hall").empty());
        CHECK(registry.getConnection("hall-stair-g-to-1") == nullptr);
        CHECK(registry.getConnection("barn-stair-g-to-1") != nullptr);

        CHECK(registry.unregisterByParent("hall") == 0);
    }

    TEST_CASE("random points stay on their surface") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("deck", 2.5f, {-1.0f, 3.0f, 4.0f, 5.0f}));
        SimRandom rng(7);

        for (int i = 0; i < 50; ++i) {
            auto point = registry.getRandomPointOnSurface("deck", rng);
            REQUIRE(point.has_value());
            CHECK(point->x >= -1.0f);
            CHECK(point->x <= 3.0f);
            CHECK(point->z >= 4.0f);
            CHECK(point->z <= 5.0f);
            CHECK(point->y == doctest::Approx(2.5f));
            CHECK(point->surfaceId == std::optional<std::string>("deck"));
        }

        CHECK_FALSE(registry.getRandomPointOnSurface("missing", rng).has_value());
    }

    TEST_CASE("nearest surface is measured to its closest edge, not its center") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("short", 2.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "hall"));
        registry.registerSurface(makeDeck("long", 2.0f, {-10.0f, 10.0f, 3.0f, 4.0f}, "hall"));

        // The short deck's center is closer, the long deck's edge is one unit away
        const ElevatedSurface* nearest = registry.findNearestSurface(5.0f, 2.0f, 2.0f, "hall");
        REQUIRE(nearest != nullptr);
        CHECK(nearest->id == "long");
    }

    TEST_CASE("nearest surface can be restricted to one parent") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("near", 2.0f, {0.0f, 1.0f, 0.0f, 1.0f}, "barn"));
        registry.registerSurface(makeDeck("far", 2.0f, {10.0f, 11.0f, 0.0f, 1.0f}, "hall"));

        CHECK(registry.findNearestSurface(0.5f, 0.5f, 2.0f)->id == "near");
        CHECK(registry.findNearestSurface(0.5f, 0.5f, 2.0f, "hall")->id == "far");
        CHECK(registry.findNearestSurface(0.5f, 0.5f, 2.0f, "shed") == nullptr);
    }
}

TEST_SUITE("ScaffoldLayout") {
    TEST_CASE("registers four platforms per level and the stairs between them") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f, 0.0f));

        CHECK(registry.surfaceCount() == 8);
        CHECK(registry.connectionCount() == 2);
        CHECK(registry.getGroundConnections().size() == 1);

        const ElevatedSurface* front = registry.getSurface(scaffoldSurfaceId("hall", 1, "front"));
        REQUIRE(front != nullptr);
        CHECK(front->id == "hall-scaffold-f1-front");
        CHECK(front->y == doctest::Approx(2.5f));
        CHECK(front->parentId == "hall");

        const ElevatedSurface* upper = registry.getSurface("hall-scaffold-f2-back");
        REQUIRE(upper != nullptr);
        CHECK(upper->y == doctest::Approx(5.0f));

        const ElevationConnection* ladder = registry.getConnection("hall-stair-1-to-2");
        REQUIRE(ladder != nullptr);
        CHECK(ladder->lower.surfaceId == std::optional<std::string>("hall-scaffold-f1-front"));
        CHECK(ladder->upper.surfaceId == std::optional<std::string>("hall-scaffold-f2-front"));
    }

    TEST_CASE("stair ends lie on the platforms they join") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(5.0f, -3.0f));

        for (const auto& conn : registry.getAllConnections()) {
            for (const ConnectionEnd* end : {&conn.lower, &conn.upper}) {
                if (!end->surfaceId) continue;
                const ElevatedSurface* surface = registry.getSurface(*end->surfaceId);
                REQUIRE(surface != nullptr);
                CHECK(surface->bounds.contains(end->position.x, end->position.z));
                CHECK(end->position.y == doctest::Approx(surface->y));
            }
        }
    }

    TEST_CASE("entry position snaps onto the first front platform") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));

        glm::vec3 entry = scaffoldEntryPosition(glm::vec2(0.0f));
        const ElevatedSurface* surface = registry.getSurfaceAt(entry.x, entry.z, entry.y - 0.3f, 0.5f);
        REQUIRE(surface != nullptr);
        CHECK(surface->id == "hall-scaffold-f1-front");
    }
}

TEST_SUITE("ElevatedPathfinder") {
    TEST_CASE("straight path across a single deck") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("deck", 1.0f, {-5.0f, 5.0f, -5.0f, 5.0f}));
        ElevatedPathfinder pathfinder(registry);

        auto start = ElevatedNavPoint::at(glm::vec3(0.0f, 1.0f, 0.0f), std::string("deck"));
        auto goal = ElevatedNavPoint::at(glm::vec3(3.0f, 1.0f, 0.0f), std::string("deck"));

        auto path = pathfinder.findPath(start, goal);
        REQUIRE(path.has_value());
        CHECK(path->points.front().x == doctest::Approx(0.0f));
        CHECK(path->points.back().x == doctest::Approx(3.0f));
        CHECK(path->points.back().z == doctest::Approx(0.0f));
        CHECK(path->totalCost == doctest::Approx(3.0f));
        CHECK(path->size() == 7);
    }

    TEST_CASE("climbs a ladder between levels") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));
        ElevatedPathfinder pathfinder(registry);

        auto start = ElevatedNavPoint::at(glm::vec3(0.0f, 2.5f, 3.5f), std::string("hall-scaffold-f1-front"));
        auto goal = ElevatedNavPoint::at(glm::vec3(0.0f, 5.0f, 3.5f), std::string("hall-scaffold-f2-front"));

        auto path = pathfinder.findPath(start, goal);
        REQUIRE(path.has_value());
        CHECK(hasStair(*path));
        CHECK(path->points.back().y == doctest::Approx(5.0f));
        CHECK(std::abs(path->points.back().x - goal.x) < 0.5f);
        CHECK(pathfinder.lastExpansionCount() > 0);
    }

    TEST_CASE("walks around the corner onto an adjacent platform") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));
        ElevatedPathfinder pathfinder(registry);

        auto start = ElevatedNavPoint::at(glm::vec3(0.0f, 2.5f, 3.5f), std::string("hall-scaffold-f1-front"));
        auto goal = ElevatedNavPoint::at(glm::vec3(-4.0f, 2.5f, -2.0f), std::string("hall-scaffold-f1-left"));

        auto path = pathfinder.findPath(start, goal);
        REQUIRE(path.has_value());
        CHECK_FALSE(hasStair(*path));
        for (const auto& point : path->points) {
            CHECK(point.y == doctest::Approx(2.5f));
        }
    }

    TEST_CASE("climbs from the ground onto a platform") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));
        ElevatedPathfinder pathfinder(registry);
        SimRandom rng(3);

        const ElevationConnection* stair = registry.getConnection("hall-stair-g-to-1");
        REQUIRE(stair != nullptr);
        const glm::vec3 foot = stair->lower.position;

        auto path = pathfinder.findPathFromGround(foot.x, foot.z, foot.y, "hall-scaffold-f1-front", rng);
        REQUIRE(path.has_value());
        CHECK_FALSE(path->points.front().surfaceId.has_value());
        CHECK(hasStair(*path));
        CHECK(path->points.back().y == doctest::Approx(2.5f));
    }

    TEST_CASE("unconnected surfaces have no path") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("a", 2.0f, {0.0f, 2.0f, 0.0f, 2.0f}));
        registry.registerSurface(makeDeck("b", 2.0f, {20.0f, 22.0f, 0.0f, 2.0f}));
        ElevatedPathfinder pathfinder(registry);

        auto path = pathfinder.findPath(ElevatedNavPoint::at(glm::vec3(1.0f, 2.0f, 1.0f), std::string("a")),
                                        ElevatedNavPoint::at(glm::vec3(21.0f, 2.0f, 1.0f), std::string("b")));
        CHECK_FALSE(path.has_value());
    }

    TEST_CASE("gives up after the expansion limit") {
        ElevatedSurfaceRegistry registry;
        registry.registerSurface(makeDeck("field", 0.0f, {-30.0f, 30.0f, -30.0f, 30.0f}));
        ElevatedPathfinder pathfinder(registry, 0.5f, 5);

        auto path = pathfinder.findPath(ElevatedNavPoint::at(glm::vec3(-25.0f, 0.0f, -25.0f), std::string("field")),
                                        ElevatedNavPoint::at(glm::vec3(25.0f, 0.0f, 25.0f), std::string("field")));
        CHECK_FALSE(path.has_value());
        CHECK(pathfinder.lastExpansionCount() > 5);
    }

    TEST_CASE("random point for a parent lands on one of its surfaces") {
        ElevatedSurfaceRegistry registry;
        registerScaffolding(registry, "hall", glm::vec2(0.0f));
        ElevatedPathfinder pathfinder(registry);
        SimRandom rng(11);

        for (int i = 0; i < 20; ++i) {
            auto point = pathfinder.findRandomPointForParent("hall", rng);
            REQUIRE(point.has_value());
            REQUIRE(point->surfaceId.has_value());
            const ElevatedSurface* surface = registry.getSurface(*point->surfaceId);
            REQUIRE(surface != nullptr);
            CHECK(surface->parentId == "hall");
            CHECK(surface->bounds.contains(point->x, point->z));
        }

        CHECK_FALSE(pathfinder.findRandomPointForParent("barn", rng).has_value());
    }
}
