/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLIDER_REGISTRY_HPP
#define COLLIDER_REGISTRY_HPP

#include "collisions/CollisionBody.hpp"
#include "entities/EntityKind.hpp"
#include <array>
#include <cstddef>
#include <span>

namespace DinerEngine {

/**
 * @brief Unordered set of entity ids sharing one collision mask.
 *
 * Backed by a fixed array sized to the entity cap, so a full registry
 * means the one-slot-per-collidered-entity invariant is already broken.
 * Removal swaps the last element into the hole: O(1), order not kept.
 */
class ColliderRegistry {
public:
    explicit ColliderRegistry(CollisionMask mask = CollisionMask::Terrain) : m_mask(mask) {}

    /**
     * @brief Appends an id
     * @return false (logged as CRITICAL) if the registry is full
     */
    [[nodiscard]] bool add(EntityID id);

    /**
     * @brief Swap-removes an id
     * @return false (logged as a warning) if the id was not registered
     */
    bool remove(EntityID id);

    bool contains(EntityID id) const;
    void clear() { m_size = 0; }

    std::span<const EntityID> items() const { return {m_ids.data(), m_size}; }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    bool full() const { return m_size == m_ids.size(); }
    static constexpr size_t capacity() { return MAX_ENTITIES; }

private:
    std::array<EntityID, MAX_ENTITIES> m_ids{};
    size_t m_size{0};
    CollisionMask m_mask;
};

} // namespace DinerEngine

#endif // COLLIDER_REGISTRY_HPP
