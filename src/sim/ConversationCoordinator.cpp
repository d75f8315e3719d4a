#include "ConversationCoordinator.h"
#include "sim/MovementSystem.h"
#include <SDL3/SDL_log.h>

bool ConversationCoordinator::select(SimulationContext& ctx, EntityId id) {
    const auto* info = ctx.world.get<EntityInfo>(id);
    if (!info) {
        ctx.diagnostics.report(ctx.now, "Conversation: unknown entity %u", id);
        return false;
    }
    if (info->kind != EntityKind::Minion) {
        ctx.diagnostics.report(ctx.now, "Conversation: entity %u is a %s, not a minion",
                               id, entityKindName(info->kind));
        return false;
    }

    const MovementState* current = ctx.world.getMovement(id);
    if (!state_.active) {
        if (current->isHeldOrAirborne()) {
            ctx.diagnostics.report(ctx.now, "Conversation: entity %u is %s", id, movementTagName(current->tag()));
            return false;
        }
        startWith(ctx, id);
        return true;
    }

    if (state_.is(ConversationPhase::Active)) {
        if (isSubject(id)) {
            return false;
        }
        if (current->isHeldOrAirborne()) {
            ctx.diagnostics.report(ctx.now, "Conversation: entity %u is %s", id, movementTagName(current->tag()));
            return false;
        }

        EntityId previous = *state_.subjectId;
        releaseSubject(ctx, previous);
        state_.subjectId = id;
        engageWizard(ctx, id);
        SDL_Log("Conversation: switched subject %u -> %u", previous, id);
        return true;
    }

    ctx.diagnostics.report(ctx.now, "Conversation: selection of %u ignored while %s",
                           id, conversationPhaseName(*state_.phase));
    return false;
}

bool ConversationCoordinator::cancel(SimulationContext& ctx) {
    if (!state_.is(ConversationPhase::Active)) {
        return false;
    }
    beginExit(ctx);
    return true;
}

void ConversationCoordinator::update(SimulationContext& ctx) {
    if (state_.active) {
        const EntityId subject = *state_.subjectId;

        if (!ctx.world.valid(subject)) {
            if (!state_.is(ConversationPhase::Exiting)) {
                ctx.diagnostics.report(ctx.now, "Conversation: subject %u was removed, exiting", subject);
                beginExit(ctx);
            }
        } else {
            // The subject stays frozen until the conversation is cleared
            entt::entity entity = ctx.world.find(subject);
            const auto& current = ctx.world.registry().get<MovementState>(entity);
            if (!current.is<movement::Conversing>()) {
                MovementSystem::transitionTo(ctx.world, entity, movement::Conversing{wizardId_});
            }
        }
    }

    if (teleportDeadline_ && ctx.now >= *teleportDeadline_) {
        teleportWizard(ctx);
    }

    if (reactionDeadline_ && ctx.now >= *reactionDeadline_) {
        fireReaction(ctx);
    }

    if (state_.active && ctx.now >= phaseDeadline_) {
        if (state_.is(ConversationPhase::Entering)) {
            state_.phase = ConversationPhase::Active;
            SDL_Log("Conversation: active with %u", *state_.subjectId);
        } else if (state_.is(ConversationPhase::Exiting)) {
            clear(ctx);
        }
    }
}

std::optional<double> ConversationCoordinator::phaseDeadline() const {
    if (!state_.active || state_.is(ConversationPhase::Active)) {
        return std::nullopt;
    }
    return phaseDeadline_;
}

void ConversationCoordinator::startWith(SimulationContext& ctx, EntityId subject) {
    state_.active = true;
    state_.subjectId = subject;
    state_.phase = ConversationPhase::Entering;
    phaseDeadline_ = ctx.now + ctx.config.conversation.enterDuration;

    wizardId_ = ctx.world.findWizard();
    engageWizard(ctx, subject);

    SDL_Log("Conversation: entering with %u", subject);
}

void ConversationCoordinator::beginExit(SimulationContext& ctx) {
    const ConversationConfig& cfg = ctx.config.conversation;

    state_.phase = ConversationPhase::Exiting;
    phaseDeadline_ = ctx.now + cfg.exitDuration;

    teleportTarget_ = TeleportTarget::Home;
    teleportDeadline_ = ctx.now + cfg.teleportDelay;
    reactionDeadline_.reset();

    SDL_Log("Conversation: exiting");
}

void ConversationCoordinator::clear(SimulationContext& ctx) {
    if (state_.subjectId) {
        releaseSubject(ctx, *state_.subjectId);
    }

    state_ = ConversationState{};
    reactionDeadline_.reset();
    reactionSubject_ = INVALID_ENTITY_ID;

    SDL_Log("Conversation: cleared");
}

void ConversationCoordinator::releaseSubject(SimulationContext& ctx, EntityId id) {
    entt::entity entity = ctx.world.find(id);
    if (entity == entt::null || !ctx.world.registry().valid(entity)) {
        return;
    }

    auto& registry = ctx.world.registry();
    if (!registry.get<MovementState>(entity).is<movement::Conversing>()) {
        return;
    }

    const auto* assignment = registry.try_get<BuildingAssignment>(entity);
    if (assignment && assignment->placed) {
        MovementSystem::transitionTo(ctx.world, entity, movement::ScaffoldWalking{});
    } else {
        // Back on the ground, even if the scaffold assignment was dropped mid-conversation
        auto& transform = registry.get<Transform>(entity);
        transform.position.y = MovementSystem::standingHeight(ctx, transform.position.x, transform.position.z);

        const FloatRange& idle = ctx.config.conversation.releaseIdle;
        MovementSystem::transitionTo(ctx.world, entity, movement::Idle{ctx.rng.range(idle.min, idle.max)});
    }
}

void ConversationCoordinator::engageWizard(SimulationContext& ctx, EntityId subject) {
    const ConversationConfig& cfg = ctx.config.conversation;
    auto& registry = ctx.world.registry();

    MovementSystem::transitionTo(ctx.world, ctx.world.find(subject), movement::Conversing{wizardId_});

    entt::entity wizard = ctx.world.find(wizardId_);
    if (wizard != entt::null && registry.valid(wizard) &&
        !registry.all_of<PlayerControlled>(wizard) &&
        !registry.get<MovementState>(wizard).isHeldOrAirborne()) {
        MovementSystem::transitionTo(ctx.world, wizard, movement::Conversing{subject});
    }

    teleportTarget_ = TeleportTarget::BesideSubject;
    teleportDeadline_ = ctx.now + cfg.teleportDelay;

    reactionSubject_ = subject;
    reactionDeadline_ = ctx.now + cfg.reactionDelay;
}

void ConversationCoordinator::teleportWizard(SimulationContext& ctx) {
    teleportDeadline_.reset();

    auto& registry = ctx.world.registry();
    entt::entity wizard = ctx.world.find(wizardId_);
    if (wizard == entt::null || !registry.valid(wizard)) {
        return;
    }
    if (registry.all_of<PlayerControlled>(wizard) || registry.get<MovementState>(wizard).isHeldOrAirborne()) {
        return;
    }

    auto& transform = registry.get<Transform>(wizard);

    if (teleportTarget_ == TeleportTarget::BesideSubject) {
        if (!state_.active || state_.is(ConversationPhase::Exiting) || !ctx.world.valid(*state_.subjectId)) {
            return;
        }
        const EntityId subject = *state_.subjectId;
        const glm::vec3 subjectPos = ctx.world.getTransform(subject)->position;

        glm::vec3 target = subjectPos + ctx.config.conversation.wizardOffset;
        target.y = MovementSystem::standingHeight(ctx, target.x, target.z);
        transform.position = target;
        transform.faceTowards(subjectPos);

        MovementSystem::transitionTo(ctx.world, wizard, movement::Conversing{subject});
        return;
    }

    // Home: only once the conversation is leaving or gone
    if (state_.active && !state_.is(ConversationPhase::Exiting)) {
        return;
    }

    glm::vec3 home = ctx.config.wizard.home;
    home.y = MovementSystem::standingHeight(ctx, home.x, home.z);
    transform.position = home;

    if (registry.get<MovementState>(wizard).is<movement::Conversing>()) {
        const WanderProfile& profile = MovementSystem::profileFor(ctx, wizard);
        MovementSystem::transitionTo(ctx.world, wizard,
                                     movement::Idle{ctx.rng.range(profile.arrivalIdle.min, profile.arrivalIdle.max)});
    }
}

void ConversationCoordinator::fireReaction(SimulationContext& ctx) {
    reactionDeadline_.reset();

    if (!state_.active || state_.is(ConversationPhase::Exiting) || !isSubject(reactionSubject_)) {
        return;
    }
    const auto* info = ctx.world.get<EntityInfo>(reactionSubject_);
    if (!info) {
        return;
    }

    Reaction reaction = reactionForPersonality(info->personality);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Conversation: %s reacts (%d)",
                 info->name.c_str(), static_cast<int>(reaction));

    if (reactionCallback_) {
        reactionCallback_(reactionSubject_, reaction);
    }
}
