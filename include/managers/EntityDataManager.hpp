/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_DATA_MANAGER_HPP
#define ENTITY_DATA_MANAGER_HPP

/**
 * @file EntityDataManager.hpp
 * @brief Fixed-capacity entity registry
 *
 * EntityDataManager owns every entity record in one std::array of
 * MAX_ENTITIES slots. There is no per-entity allocation:
 * - createEntity() takes the first inactive slot (linear scan from 0) and
 *   overwrites it with a template
 * - destroyEntity() only clears the active flag; slot memory stays inert
 *   until it is handed out again
 * - ids are slot indices, so any id held elsewhere is a weak reference and
 *   must be resolved through get(), which checks liveness
 *
 * Colliders are registered with / removed from the CollisionManager as
 * part of create / destroy.
 */

#include "entities/Entity.hpp"
#include "entities/EntityKind.hpp"
#include <array>
#include <cstddef>
#include <iterator>
#include <span>

namespace DinerEngine {

class CollisionManager;

class EntityDataManager {
public:
    using Storage = std::array<Entity, MAX_ENTITIES>;

    /**
     * @brief Lazy range of active entity ids of one kind.
     *
     * Each traversal scans the whole array; it is cheap to construct and
     * can be restarted by calling kindView() again.
     */
    class KindView {
    public:
        class Iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = EntityID;
            using difference_type = std::ptrdiff_t;
            using pointer = const EntityID*;
            using reference = EntityID;

            Iterator() = default;
            Iterator(const Storage* storage, EntityKind kind, size_t index)
                : mp_storage(storage), m_kind(kind), m_index(index) {
                skipToMatch();
            }

            EntityID operator*() const { return static_cast<EntityID>(m_index); }

            Iterator& operator++() {
                ++m_index;
                skipToMatch();
                return *this;
            }

            Iterator operator++(int) {
                Iterator copy = *this;
                ++(*this);
                return copy;
            }

            bool operator==(const Iterator& other) const { return m_index == other.m_index; }
            bool operator!=(const Iterator& other) const { return m_index != other.m_index; }

        private:
            void skipToMatch() {
                while (m_index < MAX_ENTITIES &&
                       (!(*mp_storage)[m_index].active || (*mp_storage)[m_index].kind != m_kind)) {
                    ++m_index;
                }
            }

            const Storage* mp_storage{nullptr};
            EntityKind m_kind{EntityKind::Generic};
            size_t m_index{MAX_ENTITIES};
        };

        KindView(const Storage& storage, EntityKind kind) : mp_storage(&storage), m_kind(kind) {}

        Iterator begin() const { return Iterator(mp_storage, m_kind, 0); }
        Iterator end() const { return Iterator(mp_storage, m_kind, MAX_ENTITIES); }

    private:
        const Storage* mp_storage;
        EntityKind m_kind;
    };

    explicit EntityDataManager(CollisionManager& collisions);

    EntityDataManager(const EntityDataManager&) = delete;
    EntityDataManager& operator=(const EntityDataManager&) = delete;

    /**
     * @brief Allocates the first free slot and initializes it from a template
     *
     * The template's active/id fields are overwritten. A circle shape with
     * unequal width and height is accepted with a warning.
     *
     * @return The new id, or INVALID_ENTITY_ID (logged as CRITICAL) when
     *         every slot is in use. Nothing is modified on failure.
     */
    [[nodiscard]] EntityID createEntity(const Entity& entityTemplate);

    /**
     * @brief Deactivates an entity and drops its collider registration
     * @return false if the id was out of range or already inactive
     */
    bool destroyEntity(EntityID id);

    /**
     * @brief Resolves a weak id
     * @return The live entity, or nullptr when the slot is inactive or the
     *         id is out of range
     */
    Entity* get(EntityID id);
    const Entity* get(EntityID id) const;
    Entity* get(const std::optional<EntityID>& id) {
        return id ? get(*id) : nullptr;
    }

    bool isActive(EntityID id) const;

    KindView kindView(EntityKind kind) const { return KindView(m_entities, kind); }

    // First active entity of a kind, INVALID_ENTITY_ID if none
    EntityID findFirst(EntityKind kind) const;

    size_t getActiveCount() const;
    size_t getActiveCount(EntityKind kind) const;
    static constexpr size_t getCapacity() { return MAX_ENTITIES; }

    /**
     * @brief Raw slot access for the per-frame update pass
     *
     * Unlike get(), this returns inactive slots too; the caller checks
     * `active`.
     */
    Entity& slot(size_t index) { return m_entities[index]; }

    /**
     * @brief Deactivates every entity and clears all collider registries
     */
    void clean();

private:
    Storage m_entities{};
    CollisionManager& m_collisions;
};

} // namespace DinerEngine

#endif // ENTITY_DATA_MANAGER_HPP
