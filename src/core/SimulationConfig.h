#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

// Closed-open range sampled uniformly by SimRandom::range
struct FloatRange {
    float min = 0.0f;
    float max = 0.0f;
};

// Where an idle entity looks for its next destination
enum class WanderRegion : uint8_t {
    WorldSquare,   // Uniform in a square around the origin
    HomeDisc,      // Uniform angle and distance around a fixed home point
    LocalRing      // Uniform angle, distance band around the current position
};

// Destination sampling and idle timing for one kind of wandering entity
struct WanderProfile {
    WanderRegion region = WanderRegion::WorldSquare;
    float squareFraction = 0.8f;        // WorldSquare: half-size as a fraction of the world half-size
    float minDistance = 0.0f;           // HomeDisc/LocalRing inner radius
    float maxDistance = 8.0f;           // HomeDisc/LocalRing outer radius
    float boundsFraction = 1.0f;        // |x|,|z| must stay below worldHalfSize * boundsFraction
    float originExclusion = 0.0f;       // Target must be farther than this from the origin
    int maxAttempts = 15;

    FloatRange arrivalIdle{1.0f, 4.0f}; // After reaching a target
    FloatRange retryIdle{1.0f, 3.0f};   // After sampling was exhausted
    FloatRange blockedIdle{0.5f, 1.5f}; // After walking into a non-walkable cell

    float decisionInterval = 0.0f;      // Minimum seconds between AI decisions (0 = every tick)

    static WanderProfile minion();
    static WanderProfile wizard();
    static WanderProfile wildlife();
};

struct WorldConfig {
    float worldHalfSize = 40.0f;        // Playable square is [-half, half] on X and Z
    float groundClearance = 0.1f;       // Standing offset above terrain/floor
    float maxFrameDelta = 0.1f;         // Clamp for the per-tick delta after stalls
    float walkabilityResolution = 0.5f; // Cache cell size
};

struct PhysicsConfig {
    float gravity = 35.0f;
    float bounceDamping = 0.55f;
    float horizontalRetention = 0.7f;
    float horizontalJitter = 3.0f;      // Full width of the (rand - 0.5) jitter
    float angularJitter = 10.0f;        // Added to x/z angular velocity per bounce
    float minBounceVelocity = 2.0f;     // Settle when |vy| drops below this
    int maxBounces = 4;
    float worldLimitFraction = 0.95f;   // Bounds clamp as a fraction of the world half-size
    float boundsRestitution = 0.5f;     // Horizontal speed kept when hitting the bounds
    float angularDecay = 0.98f;         // Per-tick multiplier
    glm::vec3 throwSpin{15.0f, 20.0f, 15.0f}; // Initial angular velocity scale
    FloatRange settleIdle{2.0f, 4.0f};
    float releaseGroundTolerance = 0.05f; // Released entities closer than this to the ground go idle
};

struct ScaffoldConfig {
    float speedMultiplier = 0.6f;       // Relative to locomotion speed
    float waypointTolerance = 0.3f;     // 3D arrival distance
    FloatRange workDuration{3.0f, 7.0f};
    float hammerCyclesPerSecond = 4.0f;
    float standingOffset = 0.3f;        // Subtracted from y when snapping onto a surface
    float snapTolerance = 0.5f;
    float snapFallbackDistance = 1.5f;  // Max distance for the nearest-surface fallback
    float pathRetryInterval = 0.1f;
    float idleBobAmplitude = 0.03f;
    float idleBobFrequency = 2.0f;
    float gridSize = 0.5f;
    int maxPathExpansions = 20000;
};

struct ConversationConfig {
    float enterDuration = 0.9f;         // entering -> active
    float exitDuration = 1.0f;          // exiting -> cleared
    float teleportDelay = 0.2f;         // Wizard teleport after a phase change
    float reactionDelay = 0.5f;         // Subject reaction after entering
    glm::vec3 wizardOffset{-1.5f, 0.0f, 1.5f}; // Wizard placement relative to the subject
    FloatRange releaseIdle{1.0f, 3.0f}; // Idle timer given to subjects leaving a conversation
};

struct ModeConfig {
    float firstPersonTransition = 0.5f;
    float firstPersonSpeed = 5.0f;
    float eyeHeight = 1.6f;
};

struct WizardConfig {
    glm::vec3 home{0.0f, 0.0f, 2.0f};
    float speed = 1.5f;
};

// Aggregate configuration for one simulation instance
struct SimulationConfig {
    uint32_t seed = 42;
    size_t inboxCapacity = 256;
    size_t diagnosticCapacity = 128;

    WorldConfig world;
    PhysicsConfig physics;
    ScaffoldConfig scaffold;
    ConversationConfig conversation;
    ModeConfig mode;
    WizardConfig wizard;

    WanderProfile minionWander = WanderProfile::minion();
    WanderProfile wizardWander = WanderProfile::wizard();
    WanderProfile wildlifeWander = WanderProfile::wildlife();

    // Load from a JSON file; missing keys keep their defaults.
    // Returns defaults if the file cannot be opened or parsed.
    static SimulationConfig loadFromJson(const std::string& jsonPath);
    static SimulationConfig loadFromJsonString(const std::string& jsonString);
};
