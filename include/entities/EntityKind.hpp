/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_KIND_HPP
#define ENTITY_KIND_HPP

#include <cstddef>
#include <cstdint>

namespace DinerEngine {

/// Slot index into the fixed entity array
using EntityID = uint16_t;

/// Compile-time entity cap
inline constexpr size_t MAX_ENTITIES = 512;

/// Saturated sentinel returned when no slot could be allocated
inline constexpr EntityID INVALID_ENTITY_ID = static_cast<EntityID>(MAX_ENTITIES);

constexpr bool isValidEntityId(EntityID id) noexcept {
    return id < MAX_ENTITIES;
}

/**
 * @brief Closed set of entity kinds; selects the update function and payload
 */
enum class EntityKind : uint8_t {
    Generic = 0,      // Static props, walls, counters, tables
    Player = 1,
    Ingredient = 2,
    IngredientBin = 3,
    Stove = 4,
    Dish = 5,
    Seat = 6,
    Customer = 7,
    Projectile = 8,
    COUNT
};

enum class EntityShape : uint8_t {
    Rect = 0,
    Circle = 1
};

namespace EntityTraits {

/// Returns string name for EntityKind (for logging)
constexpr const char* kindToString(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Generic:       return "Generic";
        case EntityKind::Player:        return "Player";
        case EntityKind::Ingredient:    return "Ingredient";
        case EntityKind::IngredientBin: return "IngredientBin";
        case EntityKind::Stove:         return "Stove";
        case EntityKind::Dish:          return "Dish";
        case EntityKind::Seat:          return "Seat";
        case EntityKind::Customer:      return "Customer";
        case EntityKind::Projectile:    return "Projectile";
        default:                        return "Unknown";
    }
}

} // namespace EntityTraits

} // namespace DinerEngine

#endif // ENTITY_KIND_HPP
