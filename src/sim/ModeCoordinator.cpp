#include "ModeCoordinator.h"
#include "sim/MovementSystem.h"
#include <SDL3/SDL_log.h>

bool ModeCoordinator::requestToggle(SimulationContext& ctx, const ConversationState& conversation) {
    if (conversation.active) {
        ctx.diagnostics.report(ctx.now, "Mode: toggle refused during conversation (%s)",
                               conversationPhaseName(*conversation.phase));
        return false;
    }
    if (state_.transitioning) {
        ctx.diagnostics.report(ctx.now, "Mode: toggle refused, transition to %s in progress",
                               cameraModeName(state_.mode));
        return false;
    }

    if (state_.mode == CameraMode::Isometric) {
        if (!enterFirstPerson(ctx)) {
            return false;
        }
    } else {
        exitFirstPerson(ctx);
    }

    state_.transitioning = true;
    transitionDeadline_ = ctx.now + ctx.config.mode.firstPersonTransition;
    SDL_Log("Mode: switching to %s", cameraModeName(state_.mode));
    return true;
}

void ModeCoordinator::update(double now) {
    if (transitionDeadline_ && now >= *transitionDeadline_) {
        transitionDeadline_.reset();
        state_.transitioning = false;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Mode: %s settled", cameraModeName(state_.mode));
    }
}

InteractionMode ModeCoordinator::interactionMode(const ConversationState& conversation) const {
    if (conversation.phase) {
        return InteractionMode::ConversationTransition;
    }
    return state_.mode == CameraMode::FirstPerson ? InteractionMode::FirstPerson : InteractionMode::Isometric;
}

bool ModeCoordinator::orbitControlsEnabled(const ConversationState& conversation) const {
    return state_.mode == CameraMode::Isometric &&
           !state_.transitioning &&
           !conversation.active &&
           !menuOpen_;
}

bool ModeCoordinator::enterFirstPerson(SimulationContext& ctx) {
    EntityId wizardId = ctx.world.findWizard();
    entt::entity wizard = ctx.world.find(wizardId);
    if (wizard == entt::null) {
        ctx.diagnostics.report(ctx.now, "Mode: no wizard to control");
        return false;
    }

    auto& registry = ctx.world.registry();
    const auto& current = registry.get<MovementState>(wizard);
    if (current.isHeldOrAirborne()) {
        ctx.diagnostics.report(ctx.now, "Mode: wizard is %s", movementTagName(current.tag()));
        return false;
    }

    // Autonomous wandering stops while the player drives the wizard
    MovementSystem::transitionTo(ctx.world, wizard, movement::Idle{0.0f});
    registry.emplace_or_replace<PlayerControlled>(wizard);

    avatarId_ = wizardId;
    state_.mode = CameraMode::FirstPerson;
    return true;
}

void ModeCoordinator::exitFirstPerson(SimulationContext& ctx) {
    state_.mode = CameraMode::Isometric;

    entt::entity wizard = ctx.world.find(avatarId_);
    avatarId_ = INVALID_ENTITY_ID;
    if (wizard == entt::null) {
        return;
    }

    auto& registry = ctx.world.registry();
    registry.remove<PlayerControlled>(wizard);

    const WanderProfile& profile = MovementSystem::profileFor(ctx, wizard);
    MovementSystem::transitionTo(ctx.world, wizard,
                                 movement::Idle{ctx.rng.range(profile.arrivalIdle.min, profile.arrivalIdle.max)});
}
