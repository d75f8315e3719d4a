#pragma once

#include <glm/glm.hpp>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include "MovementState.h"
#include "core/SimulationConfig.h"

// What kind of actor an entity is
enum class EntityKind : uint8_t {
    Minion,
    Wizard,
    Wildlife,
    Prop        // Thrown object with no AI of its own
};

// Picks a reaction only; never changes movement or physics
enum class Personality : uint8_t {
    Friendly,
    Cautious,
    Grumpy
};

enum class Reaction : uint8_t {
    Wave,
    Exclamation,
    Anger
};

inline Reaction reactionForPersonality(Personality personality) {
    switch (personality) {
        case Personality::Friendly: return Reaction::Wave;
        case Personality::Cautious: return Reaction::Exclamation;
        case Personality::Grumpy: return Reaction::Anger;
    }
    return Reaction::Exclamation;
}

const char* entityKindName(EntityKind kind);

// Core transform component - position and rotation for entities
struct Transform {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};  // Euler angles in radians, y is yaw

    float yaw() const { return rotation.y; }

    // Face along an XZ direction; yaw 0 looks down +Z
    void faceDirection(float dx, float dz) {
        rotation.y = std::atan2(dx, dz);
    }

    void faceTowards(const glm::vec3& target) {
        faceDirection(target.x - position.x, target.z - position.z);
    }

    glm::vec3 getForward() const {
        return glm::vec3(std::sin(rotation.y), 0.0f, std::cos(rotation.y));
    }
};

// Identity shared with the UI and the interaction controller
struct EntityInfo {
    EntityId id = INVALID_ENTITY_ID;
    EntityKind kind = EntityKind::Minion;
    std::string name;
    Personality personality = Personality::Friendly;
};

// Ground speed in units per second
struct Locomotion {
    float speed = 2.0f;
};

// How and where the entity picks idle destinations
struct Wanderer {
    WanderProfile profile;
    glm::vec3 home{0.0f};
    float decisionAccumulator = 0.0f;
};

// Additive vertical offset written by the external animator; the FSM never owns it
struct BounceOffset {
    float value = 0.0f;
};

// Wildlife hop animation phase
struct HopAnimation {
    float phase = 0.0f;
};

// Building assignment flag plus the entity's place on the scaffold graph
struct BuildingAssignment {
    std::string buildingId;
    glm::vec3 scaffoldPosition{0.0f};
    std::optional<ElevatedNavPoint> currentPoint;   // Created lazily when placed on the scaffold
    bool placed = false;
};

// Tag: the avatar driven by first-person input (the wizard)
struct PlayerAvatarTag {};

// Tag: currently steered by first-person input, autonomous AI skipped
struct PlayerControlled {};

// Final pose handed to rendering after each tick
struct RenderPose {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
    float armAngle = 0.0f;      // Hammer arm for scaffold workers
    MovementTag tag = MovementTag::Idle;
};

inline const char* entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Minion: return "minion";
        case EntityKind::Wizard: return "wizard";
        case EntityKind::Wildlife: return "wildlife";
        case EntityKind::Prop: return "prop";
    }
    return "unknown";
}
