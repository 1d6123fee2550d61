/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityDataManager.hpp"
#include "core/Logger.hpp"
#include "managers/CollisionManager.hpp"
#include <algorithm>
#include <string>

namespace DinerEngine {

EntityDataManager::EntityDataManager(CollisionManager& collisions)
    : m_collisions(collisions) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

EntityID EntityDataManager::createEntity(const Entity& entityTemplate) {
    const auto it = std::find_if(m_entities.begin(), m_entities.end(),
                                 [](const Entity& e) { return !e.active; });
    if (it == m_entities.end()) {
        ENTITY_CRITICAL(std::string("No free entity slots for ") +
                        EntityTraits::kindToString(entityTemplate.kind) + " (capacity " +
                        std::to_string(MAX_ENTITIES) + ")");
        return INVALID_ENTITY_ID;
    }

    const auto id = static_cast<EntityID>(std::distance(m_entities.begin(), it));
    Entity& entity = *it;
    entity = entityTemplate;
    entity.active = true;
    entity.id = id;

    if (entity.shape == EntityShape::Circle && entity.size.getX() != entity.size.getY()) {
        ENTITY_WARN(std::string("Circle entity ") + std::to_string(id) +
                    " does not have equal width and height");
    }

    if (entity.collider && !m_collisions.registerCollider(id, entity.collider->mask)) {
        // Registry full means the slot bookkeeping is broken; refuse the entity
        entity.active = false;
        ENTITY_CRITICAL(std::string("Collider registration failed, entity ") +
                        std::to_string(id) + " rolled back");
        return INVALID_ENTITY_ID;
    }

    ENTITY_DEBUG(std::string("Created ") + EntityTraits::kindToString(entity.kind) +
                 " " + std::to_string(id));
    return id;
}

bool EntityDataManager::destroyEntity(EntityID id) {
    if (!isValidEntityId(id)) {
        ENTITY_WARN(std::string("destroyEntity: id out of range: ") + std::to_string(id));
        return false;
    }

    Entity& entity = m_entities[id];
    if (!entity.active) {
        ENTITY_WARN(std::string("destroyEntity: entity ") + std::to_string(id) +
                    " is already inactive");
        return false;
    }

    entity.active = false;
    if (entity.collider) {
        m_collisions.unregisterCollider(id, entity.collider->mask);
    }

    ENTITY_DEBUG(std::string("Destroyed ") + EntityTraits::kindToString(entity.kind) +
                 " " + std::to_string(id));
    return true;
}

void EntityDataManager::clean() {
    for (auto& entity : m_entities) {
        entity.active = false;
    }
    m_collisions.clean();
    ENTITY_INFO("All entity slots released");
}

// ============================================================================
// LOOKUP
// ============================================================================

Entity* EntityDataManager::get(EntityID id) {
    if (!isValidEntityId(id) || !m_entities[id].active) {
        ENTITY_DEBUG(std::string("Dead entity reference: ") + std::to_string(id));
        return nullptr;
    }
    return &m_entities[id];
}

const Entity* EntityDataManager::get(EntityID id) const {
    if (!isValidEntityId(id) || !m_entities[id].active) {
        return nullptr;
    }
    return &m_entities[id];
}

bool EntityDataManager::isActive(EntityID id) const {
    return isValidEntityId(id) && m_entities[id].active;
}

EntityID EntityDataManager::findFirst(EntityKind kind) const {
    for (EntityID id : kindView(kind)) {
        return id;
    }
    return INVALID_ENTITY_ID;
}

size_t EntityDataManager::getActiveCount() const {
    return static_cast<size_t>(std::count_if(m_entities.begin(), m_entities.end(),
                                             [](const Entity& e) { return e.active; }));
}

size_t EntityDataManager::getActiveCount(EntityKind kind) const {
    const auto view = kindView(kind);
    return static_cast<size_t>(std::distance(view.begin(), view.end()));
}

} // namespace DinerEngine
