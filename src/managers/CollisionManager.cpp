/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CollisionManager.hpp"
#include "core/Logger.hpp"

namespace DinerEngine {

CollisionManager::CollisionManager()
    : m_registries{ColliderRegistry(CollisionMask::Player),
                   ColliderRegistry(CollisionMask::Terrain),
                   ColliderRegistry(CollisionMask::Projectile)} {}

bool CollisionManager::registerCollider(EntityID id, CollisionMask mask) {
    return registryFor(mask).add(id);
}

bool CollisionManager::unregisterCollider(EntityID id, CollisionMask mask) {
    return registryFor(mask).remove(id);
}

bool CollisionManager::isRegistered(EntityID id, CollisionMask mask) const {
    return getRegistry(mask).contains(id);
}

bool CollisionManager::isRegisteredAnywhere(EntityID id) const {
    for (const auto& registry : m_registries) {
        if (registry.contains(id)) {
            return true;
        }
    }
    return false;
}

const ColliderRegistry& CollisionManager::getRegistry(CollisionMask mask) const {
    return m_registries[static_cast<size_t>(mask)];
}

ColliderRegistry& CollisionManager::registryFor(CollisionMask mask) {
    return m_registries[static_cast<size_t>(mask)];
}

size_t CollisionManager::getTotalColliderCount() const {
    size_t total = 0;
    for (const auto& registry : m_registries) {
        total += registry.size();
    }
    return total;
}

void CollisionManager::clean() {
    for (auto& registry : m_registries) {
        registry.clear();
    }
    COLLISION_DEBUG("Collider registries cleared");
}

} // namespace DinerEngine
