/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Recipes.hpp"
#include <algorithm>

namespace DinerEngine {
namespace Recipes {

namespace {
// Counts are {red, green, blue, purple}
constexpr std::array<Recipe, 4> RECIPE_TABLE{{
    {{1, 1, 0, 0}, DishType::Salad},
    {{0, 0, 2, 0}, DishType::Soup},
    {{1, 0, 1, 1}, DishType::Curry},
    {{0, 1, 0, 2}, DishType::Smoothie},
}};
} // namespace

IngredientCounts countIngredients(std::span<const IngredientColor> ingredients) {
    IngredientCounts counts{};
    for (IngredientColor color : ingredients) {
        const auto index = static_cast<size_t>(color);
        if (index < counts.size()) {
            ++counts[index];
        }
    }
    return counts;
}

DishType resolve(std::span<const IngredientColor> ingredients) {
    return resolve(countIngredients(ingredients));
}

DishType resolve(const IngredientCounts& counts) {
    const auto it = std::find_if(RECIPE_TABLE.begin(), RECIPE_TABLE.end(),
                                 [&counts](const Recipe& recipe) {
                                     return recipe.counts == counts;
                                 });
    return it != RECIPE_TABLE.end() ? it->dish : FALLBACK_DISH;
}

std::array<float, DISH_TYPE_COUNT> orderWeights() {
    return {4.0f, 3.0f, 2.0f, 1.0f, 0.0f};
}

uint32_t dishValue(DishType dish) {
    switch (dish) {
        case DishType::Salad:    return 1;
        case DishType::Soup:     return 2;
        case DishType::Curry:    return 3;
        case DishType::Smoothie: return 3;
        default:                 return 0;
    }
}

Color ingredientColor(IngredientColor color) {
    switch (color) {
        case IngredientColor::Red:    return Colors::Red;
        case IngredientColor::Green:  return Colors::Green;
        case IngredientColor::Blue:   return Colors::Blue;
        case IngredientColor::Purple: return Colors::Purple;
        default:                      return Colors::White;
    }
}

Color dishColor(DishType dish) {
    switch (dish) {
        case DishType::Salad:    return Colors::Green;
        case DishType::Soup:     return Colors::Blue;
        case DishType::Curry:    return Colors::Orange;
        case DishType::Smoothie: return Colors::Purple;
        case DishType::Burnt:    return Colors::DarkGrey;
        default:                 return Colors::White;
    }
}

const char* ingredientName(IngredientColor color) {
    switch (color) {
        case IngredientColor::Red:    return "red";
        case IngredientColor::Green:  return "green";
        case IngredientColor::Blue:   return "blue";
        case IngredientColor::Purple: return "purple";
        default:                      return "unknown";
    }
}

const char* dishName(DishType dish) {
    switch (dish) {
        case DishType::Salad:    return "salad";
        case DishType::Soup:     return "soup";
        case DishType::Curry:    return "curry";
        case DishType::Smoothie: return "smoothie";
        case DishType::Burnt:    return "burnt";
        default:                 return "unknown";
    }
}

} // namespace Recipes
} // namespace DinerEngine
