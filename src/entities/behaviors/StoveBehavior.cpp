/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/behaviors/StoveBehavior.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "render/RenderCommand.hpp"
#include <cmath>
#include <numbers>
#include <span>
#include <string>

namespace DinerEngine {
namespace StoveBehavior {

namespace {

constexpr float ORBIT_RADIUS_FACTOR = 0.35f;   // Of the stove size
constexpr float ORBIT_ITEM_FACTOR = 0.6f;      // Of the ingredient size
constexpr float FIRE_SCALE = 1.2f;

void drawContents(const Entity& entity, const StoveData& stove, GameWorld& world) {
    const GameTuning& tuning = world.getTuning();

    if (stove.state == StoveState::Cooking) {
        const float flicker = 0.7f + 0.3f * std::sin(stove.flickerPhase);
        world.draw(RenderCommand::rect(entity.position, entity.size * FIRE_SCALE,
                                       EntityFactory::Z_FIRE,
                                       Colors::Orange.withAlpha(flicker)));
    }

    if (stove.state == StoveState::DishReady) {
        const Vector2D size = Vector2D::splat(tuning.dishSize);
        if (const auto sprite = world.getSprites().dish(stove.result)) {
            world.draw(RenderCommand::sprite(entity.position, size,
                                             EntityFactory::Z_STATION_CONTENTS, *sprite));
        } else {
            world.draw(RenderCommand::circle(entity.position, size,
                                             EntityFactory::Z_STATION_CONTENTS,
                                             Recipes::dishColor(stove.result)));
        }
        return;
    }

    const size_t count = stove.ingredients.size();
    if (count == 0) {
        return;
    }

    const float radius = entity.size.getX() * ORBIT_RADIUS_FACTOR;
    const Vector2D itemSize = Vector2D::splat(tuning.ingredientSize * ORBIT_ITEM_FACTOR);
    for (size_t i = 0; i < count; ++i) {
        const float turns = stove.spinPhase + static_cast<float>(i) / static_cast<float>(count);
        const float angle = turns * 2.0f * std::numbers::pi_v<float>;
        const Vector2D offset = Vector2D(radius, 0.0f).rotated(angle);
        world.draw(RenderCommand::circle(entity.position + offset, itemSize,
                                         EntityFactory::Z_STATION_CONTENTS,
                                         Recipes::ingredientColor(stove.ingredients[i])));
    }
}

} // namespace

bool addIngredient(StoveData& stove, IngredientColor color) {
    if (stove.state != StoveState::Idle) {
        STOVE_DEBUG("Stove busy, ingredient rejected");
        return false;
    }
    if (stove.ingredients.size() >= MAX_STOVE_INGREDIENTS) {
        STOVE_DEBUG("Stove full, ingredient rejected");
        return false;
    }
    stove.ingredients.push_back(color);
    return true;
}

bool beginCooking(StoveData& stove, float cookTime) {
    if (stove.state != StoveState::Idle || stove.ingredients.empty()) {
        return false;
    }
    stove.state = StoveState::Cooking;
    stove.cookTimer = cookTime;
    stove.spinPhase = 0.0f;
    stove.flickerPhase = 0.0f;
    return true;
}

std::optional<DishType> takeDish(StoveData& stove) {
    if (stove.state != StoveState::DishReady) {
        return std::nullopt;
    }
    const DishType dish = stove.result;
    stove.state = StoveState::Idle;
    stove.result = Recipes::FALLBACK_DISH;
    return dish;
}

bool advance(StoveData& stove, float delta, float spinSpeed, float flickerSpeed) {
    if (stove.state != StoveState::Cooking) {
        return false;
    }

    stove.spinPhase = std::fmod(stove.spinPhase + spinSpeed * delta, 1.0f);
    stove.flickerPhase = std::fmod(stove.flickerPhase + flickerSpeed * delta,
                                   2.0f * std::numbers::pi_v<float>);
    stove.cookTimer -= delta;
    if (stove.cookTimer > 0.0f) {
        return false;
    }

    stove.result = Recipes::resolve(std::span<const IngredientColor>(
        stove.ingredients.data(), stove.ingredients.size()));
    stove.ingredients.clear();
    stove.cookTimer = 0.0f;
    stove.state = StoveState::DishReady;
    return true;
}

void update(Entity& entity, GameWorld& world, float delta) {
    StoveData& stove = *entity.stove;
    const GameTuning& tuning = world.getTuning();

    if (advance(stove, delta, tuning.ingredientSpinSpeed, tuning.flickerSpeed)) {
        STOVE_INFO("Stove " + std::to_string(entity.id) + " finished " +
                   Recipes::dishName(stove.result));
        world.playSound(SoundCue::CookDone);
    }

    drawContents(entity, stove, world);
}

} // namespace StoveBehavior
} // namespace DinerEngine
