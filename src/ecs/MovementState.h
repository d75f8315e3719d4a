#pragma once

#include "navigation/ElevatedSurface.h"
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

using EntityId = uint32_t;
constexpr EntityId INVALID_ENTITY_ID = 0xFFFFFFFF;

// Tag order matches the MovementState variant alternatives
enum class MovementTag : uint8_t {
    Idle,
    Walking,
    Conversing,
    Grabbed,
    Suspended,
    Thrown,
    ScaffoldWalking,
    ScaffoldWorking
};

const char* movementTagName(MovementTag tag);

namespace movement {

// Waiting for the idle timer before choosing a destination
struct Idle {
    float timer = 0.0f;
};

// Heading for a ground target
struct Walking {
    glm::vec3 target{0.0f};
};

// Frozen in place facing the partner
struct Conversing {
    EntityId partner = INVALID_ENTITY_ID;
};

// Position owned by the interaction controller
struct Grabbed {};
struct Suspended {};

// Airborne, integrated by ProjectilePhysics
struct Thrown {
    glm::vec3 velocity{0.0f};
    glm::vec3 angularVelocity{0.0f};
    int bounceCount = 0;
};

// Walking scaffold waypoints; no path means waiting for the next request
struct ScaffoldWalking {
    std::optional<ElevatedPath> path;
    size_t nextWaypoint = 0;
    float retryTimer = 0.0f;
};

// Hammering at the end of a scaffold path
struct ScaffoldWorking {
    float timer = 0.0f;
    float phase = 0.0f;     // Accumulated hammer cycles
};

} // namespace movement

// Exactly one movement state is active per entity. Assigning a new alternative
// drops every timer and target of the previous one.
struct MovementState {
    using Variant = std::variant<movement::Idle,
                                 movement::Walking,
                                 movement::Conversing,
                                 movement::Grabbed,
                                 movement::Suspended,
                                 movement::Thrown,
                                 movement::ScaffoldWalking,
                                 movement::ScaffoldWorking>;

    Variant current{movement::Idle{}};

    MovementTag tag() const { return static_cast<MovementTag>(current.index()); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(current); }

    template<typename T>
    T* as() { return std::get_if<T>(&current); }

    template<typename T>
    const T* as() const { return std::get_if<T>(&current); }

    // Autonomous states may be interrupted by AI decisions and scaffold assignment
    bool isAutonomous() const {
        MovementTag t = tag();
        return t == MovementTag::Idle || t == MovementTag::Walking ||
               t == MovementTag::ScaffoldWalking || t == MovementTag::ScaffoldWorking;
    }

    // States where the interaction controller or physics owns the position
    bool isHeldOrAirborne() const {
        MovementTag t = tag();
        return t == MovementTag::Grabbed || t == MovementTag::Suspended || t == MovementTag::Thrown;
    }
};

inline const char* movementTagName(MovementTag tag) {
    switch (tag) {
        case MovementTag::Idle: return "idle";
        case MovementTag::Walking: return "walking";
        case MovementTag::Conversing: return "conversing";
        case MovementTag::Grabbed: return "grabbed";
        case MovementTag::Suspended: return "suspended";
        case MovementTag::Thrown: return "thrown";
        case MovementTag::ScaffoldWalking: return "scaffoldWalking";
        case MovementTag::ScaffoldWorking: return "scaffoldWorking";
    }
    return "unknown";
}
