#pragma once

#include "sim/SimulationContext.h"
#include <cstdint>
#include <functional>
#include <optional>

enum class ConversationPhase : uint8_t {
    Entering,   // Camera and wizard moving in
    Active,     // Dialogue open, subject may be swapped
    Exiting     // Wizard walking off, camera returning
};

inline const char* conversationPhaseName(ConversationPhase phase) {
    switch (phase) {
        case ConversationPhase::Entering: return "entering";
        case ConversationPhase::Active: return "active";
        case ConversationPhase::Exiting: return "exiting";
    }
    return "unknown";
}

// Snapshot shared with the UI. active, subjectId and phase are set together.
struct ConversationState {
    bool active = false;
    std::optional<EntityId> subjectId;
    std::optional<ConversationPhase> phase;

    bool is(ConversationPhase p) const { return phase && *phase == p; }
};

// Fired once per subject, a short while after the conversation starts
using ReactionCallback = std::function<void(EntityId subject, Reaction reaction)>;

/**
 * Drives a single wizard-minion conversation through entering, active and
 * exiting. Delayed effects are deadlines on the simulation clock; each one
 * re-checks that its entities still exist and that the phase still matches
 * before it fires.
 */
class ConversationCoordinator {
public:
    ConversationCoordinator() = default;

    // Select a minion: starts a conversation, or swaps the subject while active.
    // Rejected (with a diagnostic) while entering or exiting.
    bool select(SimulationContext& ctx, EntityId id);

    // Escape: active -> exiting. Ignored in any other phase.
    bool cancel(SimulationContext& ctx);

    // Fire due deadlines and advance phases; run once per tick before movement
    void update(SimulationContext& ctx);

    const ConversationState& state() const { return state_; }
    bool isSubject(EntityId id) const { return state_.subjectId && *state_.subjectId == id; }
    EntityId wizard() const { return wizardId_; }

    // Next phase change on the simulation clock, if a conversation exists
    std::optional<double> phaseDeadline() const;

    void setReactionCallback(ReactionCallback callback) { reactionCallback_ = std::move(callback); }

private:
    enum class TeleportTarget : uint8_t { BesideSubject, Home };

    void startWith(SimulationContext& ctx, EntityId subject);
    void beginExit(SimulationContext& ctx);
    void clear(SimulationContext& ctx);

    void releaseSubject(SimulationContext& ctx, EntityId id);
    void engageWizard(SimulationContext& ctx, EntityId subject);
    void teleportWizard(SimulationContext& ctx);
    void fireReaction(SimulationContext& ctx);

    ConversationState state_;
    EntityId wizardId_ = INVALID_ENTITY_ID;
    double phaseDeadline_ = 0.0;

    std::optional<double> teleportDeadline_;
    TeleportTarget teleportTarget_ = TeleportTarget::BesideSubject;

    std::optional<double> reactionDeadline_;
    EntityId reactionSubject_ = INVALID_ENTITY_ID;

    ReactionCallback reactionCallback_;
};
