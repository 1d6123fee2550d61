/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "collisions/CollisionBody.hpp"
#include "entities/EntityKind.hpp"
#include "entities/Recipes.hpp"
#include "render/IRenderBackend.hpp"
#include "utils/Color.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/static_vector.hpp>
#include <cstdint>
#include <optional>

namespace DinerEngine {

/// Ingredient capacity of a single stove
inline constexpr size_t MAX_STOVE_INGREDIENTS = 8;

// ============================================================================
// KIND PAYLOADS
// ============================================================================

struct PlayerData {
    Vector2D handsPosition;   // Where held items are carried
};

struct IngredientData {
    IngredientColor color{IngredientColor::Red};
};

struct IngredientBinData {
    IngredientColor color{IngredientColor::Red};   // Color dispensed on click
};

enum class StoveState : uint8_t {
    Idle = 0,
    Cooking = 1,
    DishReady = 2
};

struct StoveData {
    StoveState state{StoveState::Idle};
    boost::container::static_vector<IngredientColor, MAX_STOVE_INGREDIENTS> ingredients;
    float cookTimer{0.0f};      // Seconds left while cooking
    float spinPhase{0.0f};      // Ingredient orbit, in revolutions
    float flickerPhase{0.0f};   // Fire animation, in radians
    DishType result{DishType::Burnt};   // Valid in DishReady
};

struct DishData {
    DishType type{DishType::Burnt};
};

struct SeatData {
    bool occupied{false};
    std::optional<EntityID> customer;   // Weak
    std::optional<EntityID> dish;       // Weak; dish placed on the table for this seat
    Vector2D dishTargetOffset;          // Relative to the seat position
};

enum class CustomerMood : uint8_t {
    Ordering = 0,
    Angry = 1,
    Eating = 2
};

enum class CustomerArchetype : uint8_t {
    Sniper = 0,     // One aimed shot
    Spreader = 1,   // Three-way spread
    Barrager = 2,   // Rotating ring
    COUNT
};

inline constexpr size_t CUSTOMER_ARCHETYPE_COUNT = static_cast<size_t>(CustomerArchetype::COUNT);

struct CustomerData {
    EntityID seat{INVALID_ENTITY_ID};   // Weak
    DishType order{DishType::Salad};
    CustomerMood mood{CustomerMood::Ordering};
    CustomerArchetype archetype{CustomerArchetype::Sniper};
    float waitTimer{0.0f};
    float eatTimer{0.0f};
    float fireTimer{0.0f};
    float barragePhase{0.0f};   // Radians, advanced once per ring volley
};

struct ProjectileData {
    EntityID owner{INVALID_ENTITY_ID};   // Weak; never hit by its own shots
    float lifetime{0.0f};                // Seconds since spawn
};

// ============================================================================
// ENTITY RECORD
// ============================================================================

/**
 * @brief One slot of the fixed entity array.
 *
 * Every kind shares this record. Kind specific state lives in the optional
 * payloads; only the payload matching `kind` is expected to be engaged.
 * Ids stored in payloads and in `holding` are weak references: the target
 * may have been destroyed since, so they must be resolved through
 * EntityDataManager::get() before use.
 */
struct Entity {
    bool active{false};
    EntityID id{INVALID_ENTITY_ID};
    EntityKind kind{EntityKind::Generic};

    Vector2D position;
    Vector2D size;
    float rotation{0.0f};     // Radians, counter-clockwise
    int8_t zIndex{0};

    //- gfx: sprite wins over shape when both are set
    std::optional<TextureHandle> sprite;
    std::optional<EntityShape> shape;
    std::optional<Color> color;

    //- movement
    Vector2D velocity;
    float acceleration{0.0f};
    float speed{0.0f};        // Velocity magnitude cap

    uint32_t health{0};

    std::optional<Collider> collider;
    std::optional<EntityID> holding;       // Weak
    std::optional<float> droppedTimer;     // Seconds until despawn

    std::optional<PlayerData> player;
    std::optional<IngredientData> ingredient;
    std::optional<IngredientBinData> ingredientBin;
    std::optional<StoveData> stove;
    std::optional<DishData> dish;
    std::optional<SeatData> seat;
    std::optional<CustomerData> customer;
    std::optional<ProjectileData> projectile;
};

} // namespace DinerEngine

#endif // ENTITY_HPP
