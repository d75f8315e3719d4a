#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "navigation/ScaffoldLayout.h"
#include "sim/TickDriver.h"
#include "world/VillageTerrain.h"

namespace {

struct DriverFixture {
    VillageTerrain terrain{40.0f};
    std::unique_ptr<TickDriver> sim;

    explicit DriverFixture(SimulationConfig config = {}) {
        TickDriver::InitInfo info{};
        info.oracle = &terrain;
        info.config = config;
        sim = TickDriver::create(info);
        REQUIRE(sim != nullptr);
    }

    // Tick at 60 Hz until the clock has advanced by at least the given time
    void runFor(double seconds) {
        const double end = sim->simTime() + seconds;
        while (sim->simTime() < end) {
            sim->tick(1.0f / 60.0f);
        }
    }

    MovementTag tagOf(EntityId id) const { return *sim->world().getMovementTag(id); }
    const Transform& transformOf(EntityId id) const { return *sim->world().getTransform(id); }
};

} // namespace

TEST_SUITE("TickDriver") {
    TEST_CASE("creation needs an oracle and a usable inbox") {
        TickDriver::InitInfo missing{};
        CHECK(TickDriver::create(missing) == nullptr);

        VillageTerrain terrain(40.0f);
        TickDriver::InitInfo noInbox{};
        noInbox.oracle = &terrain;
        noInbox.config.inboxCapacity = 0;
        CHECK(TickDriver::create(noInbox) == nullptr);

        TickDriver::InitInfo ok{};
        ok.oracle = &terrain;
        auto sim = TickDriver::create(ok);
        REQUIRE(sim != nullptr);
        CHECK(sim->simTime() == doctest::Approx(0.0));
        CHECK(sim->world().entityCount() == 0);
    }

    TEST_CASE("frame delta is clamped and non-finite deltas are dropped") {
        DriverFixture f;

        f.sim->tick(0.5f);
        CHECK(f.sim->simTime() == doctest::Approx(0.1));

        f.sim->tick(std::numeric_limits<float>::quiet_NaN());
        f.sim->tick(std::numeric_limits<float>::infinity());
        f.sim->tick(-1.0f);
        CHECK(f.sim->simTime() == doctest::Approx(0.1));

        f.sim->tick(0.02f);
        CHECK(f.sim->simTime() == doctest::Approx(0.12));
        CHECK(f.sim->tickCount() == 5);
    }

    TEST_CASE("events apply on the next tick, in order") {
        DriverFixture f;
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        CHECK(f.sim->post(events::EntityGrabbed{bob}));
        CHECK(f.sim->post(events::HeldEntityMoved{bob, glm::vec3(3.0f, 4.0f, 3.0f)}));
        CHECK(f.tagOf(bob) == MovementTag::Idle);
        CHECK(f.sim->inbox().size() == 2);

        f.sim->tick(1.0f / 60.0f);

        CHECK(f.tagOf(bob) == MovementTag::Grabbed);
        CHECK(f.transformOf(bob).position == glm::vec3(3.0f, 4.0f, 3.0f));
        CHECK(f.sim->inbox().empty());
    }

    TEST_CASE("a full inbox refuses events until drained") {
        SimulationConfig config;
        config.inboxCapacity = 2;
        DriverFixture f(config);

        CHECK(f.sim->post(events::MenuVisibilityChanged{true}));
        CHECK(f.sim->post(events::MenuVisibilityChanged{false}));
        CHECK_FALSE(f.sim->post(events::MenuVisibilityChanged{true}));
        CHECK(f.sim->inbox().droppedCount() == 1);

        f.sim->tick(1.0f / 60.0f);
        CHECK_FALSE(f.sim->isMenuOpen());
        CHECK(f.sim->post(events::ToggleFirstPerson{}));
    }

    TEST_CASE("released entities fall, land and idle") {
        DriverFixture f;
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::EntitySuspended{bob});
        f.sim->post(events::HeldEntityMoved{bob, glm::vec3(4.0f, 3.0f, 4.0f)});
        f.sim->tick(1.0f / 60.0f);
        REQUIRE(f.tagOf(bob) == MovementTag::Suspended);

        f.sim->post(events::EntityReleased{bob});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.tagOf(bob) == MovementTag::Thrown);

        f.runFor(3.0);
        CHECK(f.tagOf(bob) != MovementTag::Thrown);
        CHECK(f.transformOf(bob).position.y == doctest::Approx(0.1f));
    }

    TEST_CASE("throw events launch the entity") {
        DriverFixture f;
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::EntityThrown{bob, glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(3.0f, 6.0f, 0.0f)});
        f.sim->tick(1.0f / 60.0f);

        REQUIRE(f.tagOf(bob) == MovementTag::Thrown);
        CHECK(f.transformOf(bob).position.x == doctest::Approx(0.05f));
        CHECK(f.transformOf(bob).position.y > 5.0f);
    }

    TEST_CASE("drag and release of entities that are not held are reported") {
        DriverFixture f;
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::HeldEntityMoved{bob, glm::vec3(0.0f, 5.0f, 0.0f)});
        f.sim->post(events::EntityReleased{bob});
        f.sim->post(events::EntityGrabbed{404});
        f.sim->tick(1.0f / 60.0f);

        CHECK(f.sim->diagnostics().contains("not held"));
        CHECK(f.sim->diagnostics().contains("Grab: unknown entity 404"));
        CHECK(f.sim->diagnostics().count() == 3);
        CHECK(f.transformOf(bob).position.y == doctest::Approx(0.1f));
    }

    TEST_CASE("conversation participants cannot be grabbed or thrown") {
        DriverFixture f;
        EntityId wizard = f.sim->spawnWizard();
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::EntitySelected{bob});
        f.sim->tick(1.0f / 60.0f);
        REQUIRE(f.sim->conversation().active);

        f.sim->post(events::EntityGrabbed{bob});
        f.sim->post(events::EntityThrown{wizard, glm::vec3(0.0f, 3.0f, 0.0f), glm::vec3(0.0f, 5.0f, 0.0f)});
        f.sim->tick(1.0f / 60.0f);

        CHECK(f.tagOf(bob) == MovementTag::Conversing);
        CHECK(f.tagOf(wizard) == MovementTag::Conversing);
        CHECK(f.sim->diagnostics().contains("is in a conversation"));
        CHECK(f.sim->interactionMode() == InteractionMode::ConversationTransition);
        CHECK_FALSE(f.sim->orbitControlsEnabled());
    }

    TEST_CASE("full conversation through events with a reaction") {
        DriverFixture f;
        f.sim->spawnWizard();
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        std::vector<std::pair<EntityId, Reaction>> reactions;
        f.sim->setReactionCallback([&reactions](EntityId id, Reaction reaction) {
            reactions.emplace_back(id, reaction);
        });

        f.sim->post(events::EntitySelected{bob});
        f.runFor(1.0);
        REQUIRE(f.sim->conversation().is(ConversationPhase::Active));
        REQUIRE(reactions.size() == 1);
        CHECK(reactions[0].first == bob);
        CHECK(reactions[0].second == Reaction::Wave);     // First minion is friendly

        f.sim->post(events::ToggleFirstPerson{});
        f.sim->tick(1.0f / 60.0f);
        CHECK_FALSE(f.sim->mode().transitioning);
        CHECK(f.sim->diagnostics().contains("toggle refused during conversation"));

        f.sim->post(events::ConversationCancelled{});
        f.runFor(1.2);
        CHECK_FALSE(f.sim->conversation().active);
        CHECK(f.tagOf(bob) != MovementTag::Conversing);
        CHECK(f.sim->interactionMode() == InteractionMode::Isometric);
        CHECK(f.sim->orbitControlsEnabled());
    }

    TEST_CASE("removing the subject mid-conversation exits cleanly") {
        DriverFixture f;
        f.sim->spawnWizard();
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::EntitySelected{bob});
        f.runFor(1.0);
        REQUIRE(f.sim->conversation().is(ConversationPhase::Active));

        CHECK(f.sim->removeEntity(bob));
        CHECK_FALSE(f.sim->removeEntity(bob));
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.sim->conversation().is(ConversationPhase::Exiting));

        f.runFor(1.2);
        CHECK_FALSE(f.sim->conversation().active);
    }

    TEST_CASE("selection is ignored outside the settled isometric view") {
        DriverFixture f;
        EntityId wizard = f.sim->spawnWizard();
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));

        f.sim->post(events::ToggleFirstPerson{});
        f.sim->tick(1.0f / 60.0f);
        REQUIRE(f.sim->mode().mode == CameraMode::FirstPerson);
        CHECK(f.sim->interactionMode() == InteractionMode::FirstPerson);

        f.sim->post(events::EntitySelected{bob});
        f.sim->tick(1.0f / 60.0f);
        CHECK_FALSE(f.sim->conversation().active);
        CHECK(f.sim->diagnostics().contains("ignored in firstPerson view"));

        // The avatar cannot be picked up while the player drives it
        f.sim->post(events::EntityGrabbed{wizard});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.tagOf(wizard) == MovementTag::Idle);
        CHECK(f.sim->diagnostics().contains("player controlled"));
    }

    TEST_CASE("first person input drives the wizard and the eye follows") {
        DriverFixture f;
        EntityId wizard = f.sim->spawnWizard();
        CHECK_FALSE(f.sim->firstPersonEyePosition().has_value());

        f.sim->post(events::ToggleFirstPerson{});
        f.runFor(0.6);
        REQUIRE(f.sim->mode().mode == CameraMode::FirstPerson);
        CHECK_FALSE(f.sim->mode().transitioning);

        const glm::vec3 start = f.transformOf(wizard).position;
        f.sim->setFirstPersonInput(FirstPersonInput{1.0f, 0.0f, 0.0f});
        f.sim->tick(0.1f);

        CHECK(f.transformOf(wizard).position.z == doctest::Approx(start.z + 0.5f));
        auto eye = f.sim->firstPersonEyePosition();
        REQUIRE(eye.has_value());
        CHECK(eye->y == doctest::Approx(f.transformOf(wizard).position.y + 1.6f));
        CHECK(eye->z == doctest::Approx(f.transformOf(wizard).position.z));
    }

    TEST_CASE("menu visibility disables orbit controls") {
        DriverFixture f;
        CHECK(f.sim->orbitControlsEnabled());

        f.sim->post(events::MenuVisibilityChanged{true});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.sim->isMenuOpen());
        CHECK_FALSE(f.sim->orbitControlsEnabled());
    }

    TEST_CASE("building assignment puts minions on the scaffold and back") {
        DriverFixture f;
        registerScaffolding(f.sim->surfaces(), "hall", glm::vec2(0.0f));
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(10.0f, 0.0f, 10.0f));
        EntityId rabbit = f.sim->spawnWildlife("Rabbit", glm::vec3(20.0f, 0.0f, 20.0f));

        f.sim->post(events::AssignedToBuilding{bob, "hall", scaffoldEntryPosition(glm::vec2(0.0f))});
        f.sim->post(events::AssignedToBuilding{rabbit, "hall", scaffoldEntryPosition(glm::vec2(0.0f))});
        f.sim->tick(1.0f / 60.0f);

        CHECK(f.tagOf(bob) == MovementTag::ScaffoldWalking);
        CHECK(f.transformOf(bob).position.y == doctest::Approx(2.5f));
        CHECK(f.sim->diagnostics().contains("only minions build"));

        f.runFor(2.0);
        const MovementTag onScaffold = f.tagOf(bob);
        CHECK((onScaffold == MovementTag::ScaffoldWalking || onScaffold == MovementTag::ScaffoldWorking));
        CHECK(f.transformOf(bob).position.y > 2.0f);

        f.sim->post(events::UnassignedFromBuilding{bob});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.tagOf(bob) == MovementTag::Idle);
        CHECK(f.transformOf(bob).position.y == doctest::Approx(0.1f));
        CHECK_FALSE(f.sim->world().registry().all_of<BuildingAssignment>(f.sim->world().find(bob)));

        f.sim->post(events::UnassignedFromBuilding{bob});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.sim->diagnostics().contains("has no building"));
    }

    TEST_CASE("unassigning a scaffold worker mid-conversation lands it after the talk") {
        DriverFixture f;
        registerScaffolding(f.sim->surfaces(), "hall", glm::vec2(0.0f));
        f.sim->spawnWizard();
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(10.0f, 0.0f, 10.0f));

        f.sim->post(events::AssignedToBuilding{bob, "hall", scaffoldEntryPosition(glm::vec2(0.0f))});
        f.sim->tick(1.0f / 60.0f);
        REQUIRE(f.transformOf(bob).position.y > 2.0f);

        f.sim->post(events::EntitySelected{bob});
        f.runFor(1.0);
        REQUIRE(f.sim->conversation().is(ConversationPhase::Active));

        f.sim->post(events::UnassignedFromBuilding{bob});
        f.sim->tick(1.0f / 60.0f);
        CHECK(f.tagOf(bob) == MovementTag::Conversing);
        CHECK_FALSE(f.sim->world().registry().all_of<BuildingAssignment>(f.sim->world().find(bob)));

        f.sim->post(events::ConversationCancelled{});
        f.runFor(1.2);
        CHECK_FALSE(f.sim->conversation().active);
        REQUIRE(f.tagOf(bob) == MovementTag::Idle);
        CHECK(f.transformOf(bob).position.y == doctest::Approx(0.1f));
    }

    TEST_CASE("spawned minions cycle personalities and vary their speed") {
        DriverFixture f;
        std::vector<EntityId> minions;
        for (int i = 0; i < 4; ++i) {
            minions.push_back(f.sim->spawnMinion("m", glm::vec3(static_cast<float>(i), 0.0f, 0.0f)));
        }

        const auto& world = f.sim->world();
        CHECK(world.get<EntityInfo>(minions[0])->personality == Personality::Friendly);
        CHECK(world.get<EntityInfo>(minions[1])->personality == Personality::Cautious);
        CHECK(world.get<EntityInfo>(minions[2])->personality == Personality::Grumpy);
        CHECK(world.get<EntityInfo>(minions[3])->personality == Personality::Friendly);

        for (EntityId id : minions) {
            float speed = world.get<Locomotion>(id)->speed;
            CHECK(speed >= 2.0f);
            CHECK(speed <= 2.5f);
            CHECK(world.getTransform(id)->position.y == doctest::Approx(0.1f));
        }

        EntityId wizard = f.sim->spawnWizard();
        CHECK(f.sim->spawnWizard() == wizard);
        CHECK(world.get<Locomotion>(wizard)->speed == doctest::Approx(1.5f));
        CHECK(world.getTransform(wizard)->position.z == doctest::Approx(2.0f));
    }

    TEST_CASE("render pose mirrors the simulated transform") {
        DriverFixture f;
        EntityId bob = f.sim->spawnMinion("Bob", glm::vec3(4.0f, 0.0f, 4.0f));
        f.sim->post(events::EntityThrown{bob, glm::vec3(1.0f, 6.0f, 1.0f), glm::vec3(2.0f, 0.0f, 0.0f)});
        f.sim->tick(1.0f / 60.0f);

        const RenderPose* pose = f.sim->world().get<RenderPose>(bob);
        REQUIRE(pose != nullptr);
        CHECK(pose->position == f.transformOf(bob).position);
        CHECK(pose->rotation == f.transformOf(bob).rotation);
        CHECK(pose->tag == MovementTag::Thrown);
    }

    TEST_CASE("state stays consistent over a long busy run") {
        DriverFixture f;
        f.terrain.addWater(WaterBody{glm::vec2(12.0f, -8.0f), 4.0f});
        f.sim->invalidateWalkability();

        f.sim->spawnWizard();
        std::vector<EntityId> minions;
        for (int i = 0; i < 6; ++i) {
            float angle = static_cast<float>(i) * 1.047f;
            minions.push_back(f.sim->spawnMinion("m", glm::vec3(std::cos(angle) * 6.0f, 0.0f, std::sin(angle) * 6.0f)));
        }
        f.sim->spawnWildlife("r1", glm::vec3(20.0f, 0.0f, 20.0f));
        f.sim->spawnWildlife("r2", glm::vec3(-20.0f, 0.0f, 18.0f));

        std::mt19937 script(7);
        std::uniform_real_distribution<float> spread(-8.0f, 8.0f);

        for (int tick = 0; tick < 1800; ++tick) {
            if (tick % 150 == 0) {
                EntityId target = minions[static_cast<size_t>(tick / 150) % minions.size()];
                f.sim->post(events::EntityThrown{target, glm::vec3(0.0f, 3.0f, 0.0f),
                                                 glm::vec3(spread(script), 8.0f, spread(script))});
            }
            f.sim->tick(1.0f / 60.0f);

            for (EntityId id : f.sim->world().ids()) {
                const Transform& transform = f.transformOf(id);
                const MovementState& state = *f.sim->world().getMovement(id);
                const glm::vec3& p = transform.position;

                REQUIRE(std::isfinite(p.x));
                REQUIRE(std::isfinite(p.y));
                REQUIRE(std::isfinite(p.z));
                CHECK(std::abs(p.x) <= 40.0f);
                CHECK(std::abs(p.z) <= 40.0f);
                CHECK(p.y >= 0.1f - 1e-4f);

                if (const auto* walking = state.as<movement::Walking>()) {
                    CHECK(f.terrain.isWalkable(walking->target.x, walking->target.z));
                    CHECK(p.y == doctest::Approx(0.1f));
                }
                if (state.is<movement::Thrown>()) {
                    CHECK(std::abs(p.x) <= 38.0f);
                    CHECK(std::abs(p.z) <= 38.0f);
                }

                const RenderPose* pose = f.sim->world().get<RenderPose>(id);
                CHECK(pose->tag == state.tag());
            }
        }

        CHECK(f.sim->tickCount() == 1800);
        CHECK(f.sim->diagnostics().empty());
    }
}
