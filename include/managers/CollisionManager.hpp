/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_MANAGER_HPP
#define COLLISION_MANAGER_HPP

/**
 * @file CollisionManager.hpp
 * @brief Owner of the per-mask collider registries
 *
 * There is no broad phase: consumers walk the registry of the mask they
 * care about and run NarrowPhase::testCollision() on each member.
 * Registration is driven by EntityDataManager create/destroy so that
 * membership always mirrors (active && collider) of the owning entity.
 */

#include "collisions/ColliderRegistry.hpp"
#include "collisions/CollisionBody.hpp"
#include "entities/EntityKind.hpp"
#include <array>
#include <cstddef>
#include <span>

namespace DinerEngine {

class CollisionManager {
public:
    CollisionManager();

    [[nodiscard]] bool registerCollider(EntityID id, CollisionMask mask);
    bool unregisterCollider(EntityID id, CollisionMask mask);

    bool isRegistered(EntityID id, CollisionMask mask) const;
    // True if the id is in any registry
    bool isRegisteredAnywhere(EntityID id) const;

    const ColliderRegistry& getRegistry(CollisionMask mask) const;
    std::span<const EntityID> getColliders(CollisionMask mask) const {
        return getRegistry(mask).items();
    }

    size_t getTotalColliderCount() const;

    void clean();

private:
    static constexpr size_t MASK_COUNT = static_cast<size_t>(CollisionMask::COUNT);

    ColliderRegistry& registryFor(CollisionMask mask);

    std::array<ColliderRegistry, MASK_COUNT> m_registries;
};

} // namespace DinerEngine

#endif // COLLISION_MANAGER_HPP
