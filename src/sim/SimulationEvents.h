#pragma once

#include "ecs/MovementState.h"
#include <glm/glm.hpp>
#include <string>
#include <variant>

// Requests from the interaction and UI layers. They are queued and applied
// at the start of the next tick, never in the middle of the FSM pass.
namespace events {

struct EntityThrown {
    EntityId id = INVALID_ENTITY_ID;
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
};

struct EntityGrabbed {
    EntityId id = INVALID_ENTITY_ID;
};

struct EntitySuspended {
    EntityId id = INVALID_ENTITY_ID;
};

// Drag update while grabbed or suspended
struct HeldEntityMoved {
    EntityId id = INVALID_ENTITY_ID;
    glm::vec3 position{0.0f};
};

// Let go without a throw
struct EntityReleased {
    EntityId id = INVALID_ENTITY_ID;
};

// Click on an entity in the isometric view
struct EntitySelected {
    EntityId id = INVALID_ENTITY_ID;
};

struct ConversationCancelled {};

struct ToggleFirstPerson {};

struct MenuVisibilityChanged {
    bool open = false;
};

struct AssignedToBuilding {
    EntityId id = INVALID_ENTITY_ID;
    std::string buildingId;
    glm::vec3 scaffoldPosition{0.0f};
};

struct UnassignedFromBuilding {
    EntityId id = INVALID_ENTITY_ID;
};

} // namespace events

using SimulationEvent = std::variant<events::EntityThrown,
                                     events::EntityGrabbed,
                                     events::EntitySuspended,
                                     events::HeldEntityMoved,
                                     events::EntityReleased,
                                     events::EntitySelected,
                                     events::ConversationCancelled,
                                     events::ToggleFirstPerson,
                                     events::MenuVisibilityChanged,
                                     events::AssignedToBuilding,
                                     events::UnassignedFromBuilding>;

const char* eventName(const SimulationEvent& event);
