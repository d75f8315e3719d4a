#pragma once

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Components.h"

namespace ecs {

// Spawn parameters for any simulated actor
struct SpawnInfo {
    EntityKind kind = EntityKind::Minion;
    std::string name;
    glm::vec3 position{0.0f};
    float yaw = 0.0f;                   // Radians
    float speed = 2.0f;
    Personality personality = Personality::Friendly;
    float initialIdle = 0.0f;
    std::optional<WanderProfile> wander; // No wanderer component if unset
    glm::vec3 home{0.0f};
};

// World class - owns the entity state store.
// Entities are addressed by stable EntityIds handed out in spawn order;
// the registry handle behind an id never leaks to the UI.
class World {
public:
    World() = default;
    ~World() = default;

    // Non-copyable, movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = default;
    World& operator=(World&&) = default;

    // Access to underlying registry
    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    // Create an entity with the components every actor carries
    EntityId createEntity(const SpawnInfo& info) {
        auto entity = registry_.create();
        EntityId id = nextId_++;

        Transform transform;
        transform.position = info.position;
        transform.rotation.y = info.yaw;

        registry_.emplace<Transform>(entity, transform);
        registry_.emplace<EntityInfo>(entity, EntityInfo{id, info.kind, info.name, info.personality});
        registry_.emplace<Locomotion>(entity, Locomotion{info.speed});
        registry_.emplace<MovementState>(entity, MovementState{movement::Idle{info.initialIdle}});
        registry_.emplace<BounceOffset>(entity);
        registry_.emplace<RenderPose>(entity, RenderPose{info.position, transform.rotation, 0.0f, MovementTag::Idle});

        if (info.wander) {
            registry_.emplace<Wanderer>(entity, Wanderer{*info.wander, info.home, 0.0f});
        }
        if (info.kind == EntityKind::Wildlife) {
            registry_.emplace<HopAnimation>(entity);
        }
        if (info.kind == EntityKind::Wizard) {
            registry_.emplace<PlayerAvatarTag>(entity);
        }

        entities_[id] = entity;

        SDL_Log("Spawned %s '%s' (ID: %u) at (%.1f, %.1f, %.1f)",
                entityKindName(info.kind), info.name.c_str(), id,
                info.position.x, info.position.y, info.position.z);
        return id;
    }

    // Destroy an entity; unknown ids are reported and ignored
    bool destroyEntity(EntityId id) {
        auto it = entities_.find(id);
        if (it == entities_.end()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Attempted to remove non-existent entity ID: %u", id);
            return false;
        }
        registry_.destroy(it->second);
        entities_.erase(it);
        SDL_Log("Removed entity ID: %u", id);
        return true;
    }

    // Registry handle for an id, entt::null if unknown
    entt::entity find(EntityId id) const {
        auto it = entities_.find(id);
        if (it == entities_.end()) {
            return entt::null;
        }
        return it->second;
    }

    bool valid(EntityId id) const {
        entt::entity entity = find(id);
        return entity != entt::null && registry_.valid(entity);
    }

    EntityId idOf(entt::entity entity) const {
        if (registry_.valid(entity) && registry_.all_of<EntityInfo>(entity)) {
            return registry_.get<EntityInfo>(entity).id;
        }
        return INVALID_ENTITY_ID;
    }

    // Find the wizard (assumes at most one)
    EntityId findWizard() const {
        auto view = registry_.view<PlayerAvatarTag, EntityInfo>();
        for (auto entity : view) {
            return view.get<EntityInfo>(entity).id;
        }
        return INVALID_ENTITY_ID;
    }

    // Component accessors, nullptr if the entity or component is missing
    template<typename T>
    T* get(EntityId id) {
        entt::entity entity = find(id);
        if (entity == entt::null || !registry_.valid(entity)) return nullptr;
        return registry_.try_get<T>(entity);
    }

    template<typename T>
    const T* get(EntityId id) const {
        entt::entity entity = find(id);
        if (entity == entt::null || !registry_.valid(entity)) return nullptr;
        return registry_.try_get<T>(entity);
    }

    Transform* getTransform(EntityId id) { return get<Transform>(id); }
    const Transform* getTransform(EntityId id) const { return get<Transform>(id); }
    MovementState* getMovement(EntityId id) { return get<MovementState>(id); }
    const MovementState* getMovement(EntityId id) const { return get<MovementState>(id); }

    std::optional<MovementTag> getMovementTag(EntityId id) const {
        if (const MovementState* state = getMovement(id)) {
            return state->tag();
        }
        return std::nullopt;
    }

    size_t entityCount() const { return entities_.size(); }

    // Live ids in ascending order
    std::vector<EntityId> ids() const {
        std::vector<EntityId> result;
        result.reserve(entities_.size());
        for (const auto& entry : entities_) {
            result.push_back(entry.first);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

private:
    entt::registry registry_;
    std::unordered_map<EntityId, entt::entity> entities_;
    EntityId nextId_ = 1;
};

} // namespace ecs
