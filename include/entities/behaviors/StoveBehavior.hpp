/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STOVE_BEHAVIOR_HPP
#define STOVE_BEHAVIOR_HPP

#include "entities/Entity.hpp"
#include "entities/Recipes.hpp"
#include <optional>

namespace DinerEngine {

class GameWorld;

namespace StoveBehavior {

// Accepted only while idle and below MAX_STOVE_INGREDIENTS
bool addIngredient(StoveData& stove, IngredientColor color);

// Starts the cook timer; needs an idle stove with at least one ingredient
bool beginCooking(StoveData& stove, float cookTime);

// Hands out the finished dish and returns the stove to idle
std::optional<DishType> takeDish(StoveData& stove);

/**
 * @brief Advances the cook timer and animation phases
 * @return true on the step that finished cooking
 */
bool advance(StoveData& stove, float delta, float spinSpeed, float flickerSpeed);

void update(Entity& stove, GameWorld& world, float delta);

} // namespace StoveBehavior

} // namespace DinerEngine

#endif // STOVE_BEHAVIOR_HPP
