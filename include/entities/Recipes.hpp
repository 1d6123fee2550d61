/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RECIPES_HPP
#define RECIPES_HPP

#include "utils/Color.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace DinerEngine {

enum class IngredientColor : uint8_t {
    Red = 0,
    Green = 1,
    Blue = 2,
    Purple = 3,
    COUNT
};

enum class DishType : uint8_t {
    Salad = 0,
    Soup = 1,
    Curry = 2,
    Smoothie = 3,
    Burnt = 4,     // Produced when no recipe matches; never ordered
    COUNT
};

inline constexpr size_t INGREDIENT_COLOR_COUNT = static_cast<size_t>(IngredientColor::COUNT);
inline constexpr size_t DISH_TYPE_COUNT = static_cast<size_t>(DishType::COUNT);

/// Multiset of ingredient colors, stored as a count per color
using IngredientCounts = std::array<uint8_t, INGREDIENT_COLOR_COUNT>;

struct Recipe {
    IngredientCounts counts;
    DishType dish;
};

namespace Recipes {

/// Dish produced when the accumulated ingredients match no recipe
inline constexpr DishType FALLBACK_DISH = DishType::Burnt;

IngredientCounts countIngredients(std::span<const IngredientColor> ingredients);

/**
 * @brief Resolves the dish for an unordered set of ingredients.
 *
 * Only the count of each color matters, so any permutation of the same
 * ingredients gives the same dish. No match gives FALLBACK_DISH.
 */
DishType resolve(std::span<const IngredientColor> ingredients);
DishType resolve(const IngredientCounts& counts);

/// Relative likelihood of each orderable dish (Burnt has weight zero)
std::array<float, DISH_TYPE_COUNT> orderWeights();

/// Score awarded when a customer finishes eating this dish
uint32_t dishValue(DishType dish);

Color ingredientColor(IngredientColor color);
Color dishColor(DishType dish);

const char* ingredientName(IngredientColor color);
const char* dishName(DishType dish);

} // namespace Recipes

} // namespace DinerEngine

#endif // RECIPES_HPP
