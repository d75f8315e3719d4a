#include "SimulationConfig.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

WanderProfile WanderProfile::minion() {
    WanderProfile profile;
    profile.region = WanderRegion::WorldSquare;
    profile.squareFraction = 0.8f;
    profile.maxAttempts = 15;
    profile.arrivalIdle = {1.0f, 4.0f};
    profile.retryIdle = {1.0f, 3.0f};
    profile.blockedIdle = {0.5f, 1.5f};
    return profile;
}

WanderProfile WanderProfile::wizard() {
    WanderProfile profile;
    profile.region = WanderRegion::HomeDisc;
    profile.minDistance = 0.0f;
    profile.maxDistance = 8.0f;
    profile.maxAttempts = 10;
    profile.arrivalIdle = {2.0f, 5.0f};
    profile.retryIdle = {2.0f, 5.0f};
    profile.blockedIdle = {2.0f, 5.0f};
    return profile;
}

WanderProfile WanderProfile::wildlife() {
    WanderProfile profile;
    profile.region = WanderRegion::LocalRing;
    profile.minDistance = 3.0f;
    profile.maxDistance = 11.0f;
    profile.boundsFraction = 0.85f;
    profile.originExclusion = 12.0f;
    profile.maxAttempts = 5;
    profile.arrivalIdle = {2.0f, 7.0f};
    profile.retryIdle = {1.0f, 3.0f};
    profile.blockedIdle = {0.5f, 1.5f};
    profile.decisionInterval = 0.1f;
    return profile;
}

namespace {

void readRange(const json& j, const char* key, FloatRange& range) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (value.is_array() && value.size() == 2) {
        range.min = value[0].get<float>();
        range.max = value[1].get<float>();
    } else if (value.is_object()) {
        range.min = value.value("min", range.min);
        range.max = value.value("max", range.max);
    }
}

void readVec3(const json& j, const char* key, glm::vec3& v) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (value.is_array() && value.size() == 3) {
        v = glm::vec3(value[0].get<float>(), value[1].get<float>(), value[2].get<float>());
    }
}

WanderRegion parseRegion(const std::string& name, WanderRegion fallback) {
    if (name == "worldSquare") return WanderRegion::WorldSquare;
    if (name == "homeDisc") return WanderRegion::HomeDisc;
    if (name == "localRing") return WanderRegion::LocalRing;
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SimulationConfig: Unknown wander region '%s'", name.c_str());
    return fallback;
}

void readWander(const json& j, WanderProfile& profile) {
    if (j.contains("region")) {
        profile.region = parseRegion(j["region"].get<std::string>(), profile.region);
    }
    profile.squareFraction = j.value("squareFraction", profile.squareFraction);
    profile.minDistance = j.value("minDistance", profile.minDistance);
    profile.maxDistance = j.value("maxDistance", profile.maxDistance);
    profile.boundsFraction = j.value("boundsFraction", profile.boundsFraction);
    profile.originExclusion = j.value("originExclusion", profile.originExclusion);
    profile.maxAttempts = j.value("maxAttempts", profile.maxAttempts);
    profile.decisionInterval = j.value("decisionInterval", profile.decisionInterval);
    readRange(j, "arrivalIdle", profile.arrivalIdle);
    readRange(j, "retryIdle", profile.retryIdle);
    readRange(j, "blockedIdle", profile.blockedIdle);
}

} // namespace

SimulationConfig SimulationConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SimulationConfig: Failed to open config file: %s", jsonPath.c_str());
        return SimulationConfig{};
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

SimulationConfig SimulationConfig::loadFromJsonString(const std::string& jsonString) {
    SimulationConfig config;

    try {
        json j = json::parse(jsonString);

        config.seed = j.value("seed", config.seed);
        config.inboxCapacity = j.value("inboxCapacity", config.inboxCapacity);
        config.diagnosticCapacity = j.value("diagnosticCapacity", config.diagnosticCapacity);

        if (j.contains("world")) {
            const auto& w = j["world"];
            config.world.worldHalfSize = w.value("halfSize", config.world.worldHalfSize);
            config.world.groundClearance = w.value("groundClearance", config.world.groundClearance);
            config.world.maxFrameDelta = w.value("maxFrameDelta", config.world.maxFrameDelta);
            config.world.walkabilityResolution = w.value("walkabilityResolution", config.world.walkabilityResolution);
        }

        if (j.contains("physics")) {
            const auto& p = j["physics"];
            config.physics.gravity = p.value("gravity", config.physics.gravity);
            config.physics.bounceDamping = p.value("bounceDamping", config.physics.bounceDamping);
            config.physics.horizontalRetention = p.value("horizontalRetention", config.physics.horizontalRetention);
            config.physics.horizontalJitter = p.value("horizontalJitter", config.physics.horizontalJitter);
            config.physics.angularJitter = p.value("angularJitter", config.physics.angularJitter);
            config.physics.minBounceVelocity = p.value("minBounceVelocity", config.physics.minBounceVelocity);
            config.physics.maxBounces = p.value("maxBounces", config.physics.maxBounces);
            config.physics.worldLimitFraction = p.value("worldLimitFraction", config.physics.worldLimitFraction);
            config.physics.boundsRestitution = p.value("boundsRestitution", config.physics.boundsRestitution);
            config.physics.angularDecay = p.value("angularDecay", config.physics.angularDecay);
            readVec3(p, "throwSpin", config.physics.throwSpin);
            readRange(p, "settleIdle", config.physics.settleIdle);
        }

        if (j.contains("scaffold")) {
            const auto& s = j["scaffold"];
            config.scaffold.speedMultiplier = s.value("speedMultiplier", config.scaffold.speedMultiplier);
            config.scaffold.waypointTolerance = s.value("waypointTolerance", config.scaffold.waypointTolerance);
            readRange(s, "workDuration", config.scaffold.workDuration);
            config.scaffold.hammerCyclesPerSecond = s.value("hammerCyclesPerSecond", config.scaffold.hammerCyclesPerSecond);
            config.scaffold.standingOffset = s.value("standingOffset", config.scaffold.standingOffset);
            config.scaffold.snapTolerance = s.value("snapTolerance", config.scaffold.snapTolerance);
            config.scaffold.snapFallbackDistance = s.value("snapFallbackDistance", config.scaffold.snapFallbackDistance);
            config.scaffold.pathRetryInterval = s.value("pathRetryInterval", config.scaffold.pathRetryInterval);
            config.scaffold.idleBobAmplitude = s.value("idleBobAmplitude", config.scaffold.idleBobAmplitude);
            config.scaffold.idleBobFrequency = s.value("idleBobFrequency", config.scaffold.idleBobFrequency);
            config.scaffold.gridSize = s.value("gridSize", config.scaffold.gridSize);
            config.scaffold.maxPathExpansions = s.value("maxPathExpansions", config.scaffold.maxPathExpansions);
        }

        if (j.contains("conversation")) {
            const auto& c = j["conversation"];
            config.conversation.enterDuration = c.value("enterDuration", config.conversation.enterDuration);
            config.conversation.exitDuration = c.value("exitDuration", config.conversation.exitDuration);
            config.conversation.teleportDelay = c.value("teleportDelay", config.conversation.teleportDelay);
            config.conversation.reactionDelay = c.value("reactionDelay", config.conversation.reactionDelay);
            readVec3(c, "wizardOffset", config.conversation.wizardOffset);
            readRange(c, "releaseIdle", config.conversation.releaseIdle);
        }

        if (j.contains("mode")) {
            const auto& m = j["mode"];
            config.mode.firstPersonTransition = m.value("firstPersonTransition", config.mode.firstPersonTransition);
            config.mode.firstPersonSpeed = m.value("firstPersonSpeed", config.mode.firstPersonSpeed);
            config.mode.eyeHeight = m.value("eyeHeight", config.mode.eyeHeight);
        }

        if (j.contains("wizard")) {
            const auto& wz = j["wizard"];
            readVec3(wz, "home", config.wizard.home);
            config.wizard.speed = wz.value("speed", config.wizard.speed);
        }

        if (j.contains("wander")) {
            const auto& wander = j["wander"];
            if (wander.contains("minion")) readWander(wander["minion"], config.minionWander);
            if (wander.contains("wizard")) readWander(wander["wizard"], config.wizardWander);
            if (wander.contains("wildlife")) readWander(wander["wildlife"], config.wildlifeWander);
        }

        SDL_Log("SimulationConfig: Loaded config with seed=%u, worldHalfSize=%.1f",
                config.seed, config.world.worldHalfSize);

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SimulationConfig: JSON parse error: %s", e.what());
        return SimulationConfig{};
    }

    return config;
}
