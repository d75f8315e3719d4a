#pragma once

#include "sim/ConversationCoordinator.h"
#include "sim/SimulationContext.h"
#include <cstdint>
#include <optional>

enum class CameraMode : uint8_t {
    Isometric,
    FirstPerson
};

// What the input layer should route clicks and keys to
enum class InteractionMode : uint8_t {
    Isometric,
    FirstPerson,
    ConversationTransition
};

inline const char* cameraModeName(CameraMode mode) {
    return mode == CameraMode::FirstPerson ? "firstPerson" : "isometric";
}

struct ModeState {
    CameraMode mode = CameraMode::Isometric;
    bool transitioning = false;
};

// Camera mode switches between the isometric view and driving the wizard.
// Switching is refused while a conversation exists or a switch is still animating.
class ModeCoordinator {
public:
    ModeCoordinator() = default;

    // Toggle between isometric and first person; false (with a diagnostic) when refused
    bool requestToggle(SimulationContext& ctx, const ConversationState& conversation);

    // Finish the camera transition once its deadline has passed
    void update(double now);

    const ModeState& state() const { return state_; }
    bool isFirstPerson() const { return state_.mode == CameraMode::FirstPerson; }

    InteractionMode interactionMode(const ConversationState& conversation) const;

    // Orbit controls only run in a settled isometric view with nothing else claiming input
    bool orbitControlsEnabled(const ConversationState& conversation) const;

    void setMenuOpen(bool open) { menuOpen_ = open; }
    bool isMenuOpen() const { return menuOpen_; }

    std::optional<double> transitionDeadline() const { return transitionDeadline_; }

private:
    bool enterFirstPerson(SimulationContext& ctx);
    void exitFirstPerson(SimulationContext& ctx);

    ModeState state_;
    bool menuOpen_ = false;
    std::optional<double> transitionDeadline_;
    EntityId avatarId_ = INVALID_ENTITY_ID;
};
