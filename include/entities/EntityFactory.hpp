/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

/**
 * @file EntityFactory.hpp
 * @brief Named constructors for every entity kind and the level layout
 *
 * Each function fills an Entity template from GameTuning and the sprite
 * table and hands it to EntityDataManager::createEntity(). All of them
 * return INVALID_ENTITY_ID when the registry is full.
 */

#include "entities/Entity.hpp"
#include "entities/EntityKind.hpp"
#include "entities/Recipes.hpp"
#include "utils/Vector2D.hpp"

namespace DinerEngine {

class GameWorld;

namespace EntityFactory {

// Z layers
inline constexpr int8_t Z_FLOOR = 0;
inline constexpr int8_t Z_SEAT = 1;
inline constexpr int8_t Z_DISH_TARGET = 2;
inline constexpr int8_t Z_FIRE = 4;
inline constexpr int8_t Z_STATION = 5;
inline constexpr int8_t Z_STATION_CONTENTS = 6;
inline constexpr int8_t Z_CUSTOMER = 8;
inline constexpr int8_t Z_CUSTOMER_ORDER = 9;
inline constexpr int8_t Z_PLAYER = 10;
inline constexpr int8_t Z_ITEM = 20;
inline constexpr int8_t Z_PROJECTILE = 50;
inline constexpr int8_t Z_HANDS = 100;
inline constexpr int8_t Z_HUD = 110;

inline constexpr size_t MAX_STOVES = 5;

EntityID createPlayer(GameWorld& world);

// Static terrain: box and circle obstacles
EntityID createBlock(GameWorld& world, const Vector2D& position, const Vector2D& size,
                     const Vector2D& colliderSize, const Color& color);
EntityID createPillar(GameWorld& world, const Vector2D& position, float diameter);

// Table with three seats on each long side
EntityID createTable(GameWorld& world, const Vector2D& position, const Vector2D& size);
EntityID createSeat(GameWorld& world, const Vector2D& position, const Vector2D& dishTargetOffset);

EntityID createIngredientBin(GameWorld& world, const Vector2D& position, IngredientColor color);
EntityID createStove(GameWorld& world, const Vector2D& position);

/**
 * @brief Seats a new customer with a random archetype and weighted order
 * @param seatId Must be a free seat; it is marked occupied on success
 */
EntityID createCustomer(GameWorld& world, EntityID seatId);

EntityID createIngredient(GameWorld& world, const Vector2D& position, IngredientColor color);
EntityID createDish(GameWorld& world, const Vector2D& position, DishType type);
EntityID createProjectile(GameWorld& world, const Vector2D& position,
                          const Vector2D& direction, EntityID owner);

/**
 * @brief Creates the player first, then the counter, stations, tables,
 *        obstacles and boundary walls
 * @return The player id
 */
EntityID buildLevel(GameWorld& world);

/**
 * @brief Advances the spawn timer and seats a customer when it runs out
 * @return The new customer id, or INVALID_ENTITY_ID if none was spawned
 */
EntityID spawnCustomers(GameWorld& world, float delta);

} // namespace EntityFactory

} // namespace DinerEngine

#endif // ENTITY_FACTORY_HPP
