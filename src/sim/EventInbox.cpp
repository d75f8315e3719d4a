#include "EventInbox.h"
#include <SDL3/SDL_log.h>
#include <type_traits>
#include <utility>

const char* eventName(const SimulationEvent& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, events::EntityThrown>) return "EntityThrown";
        else if constexpr (std::is_same_v<T, events::EntityGrabbed>) return "EntityGrabbed";
        else if constexpr (std::is_same_v<T, events::EntitySuspended>) return "EntitySuspended";
        else if constexpr (std::is_same_v<T, events::HeldEntityMoved>) return "HeldEntityMoved";
        else if constexpr (std::is_same_v<T, events::EntityReleased>) return "EntityReleased";
        else if constexpr (std::is_same_v<T, events::EntitySelected>) return "EntitySelected";
        else if constexpr (std::is_same_v<T, events::ConversationCancelled>) return "ConversationCancelled";
        else if constexpr (std::is_same_v<T, events::ToggleFirstPerson>) return "ToggleFirstPerson";
        else if constexpr (std::is_same_v<T, events::MenuVisibilityChanged>) return "MenuVisibilityChanged";
        else if constexpr (std::is_same_v<T, events::AssignedToBuilding>) return "AssignedToBuilding";
        else return "UnassignedFromBuilding";
    }, event);
}

EventInbox::EventInbox(size_t capacity)
    : capacity_(capacity) {
    pending_.reserve(capacity_);
}

bool EventInbox::push(SimulationEvent event) {
    if (pending_.size() >= capacity_) {
        dropped_++;
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EventInbox: full (%zu), dropping %s",
                    capacity_, eventName(event));
        return false;
    }
    pending_.push_back(std::move(event));
    return true;
}

std::vector<SimulationEvent> EventInbox::drain() {
    std::vector<SimulationEvent> out;
    out.swap(pending_);
    pending_.reserve(capacity_);
    return out;
}
