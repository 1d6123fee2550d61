/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityBehaviors.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "entities/behaviors/CustomerBehavior.hpp"
#include "entities/behaviors/PlayerBehavior.hpp"
#include "entities/behaviors/ProjectileBehavior.hpp"
#include "entities/behaviors/SeatBehavior.hpp"
#include "entities/behaviors/StoveBehavior.hpp"
#include "render/RenderCommand.hpp"
#include <algorithm>
#include <string>

namespace DinerEngine {
namespace EntityBehaviors {

bool hasPayload(const Entity& entity) {
    switch (entity.kind) {
        case EntityKind::Generic:       return true;
        case EntityKind::Player:        return entity.player.has_value();
        case EntityKind::Ingredient:    return entity.ingredient.has_value();
        case EntityKind::IngredientBin: return entity.ingredientBin.has_value();
        case EntityKind::Stove:         return entity.stove.has_value();
        case EntityKind::Dish:          return entity.dish.has_value();
        case EntityKind::Seat:          return entity.seat.has_value();
        case EntityKind::Customer:      return entity.customer.has_value();
        case EntityKind::Projectile:    return entity.projectile.has_value();
        default:                        return false;
    }
}

void update(Entity& entity, GameWorld& world, float delta) {
    if (!entity.active) {
        return;
    }

    if (!hasPayload(entity)) {
        ENTITY_WARN(std::string(EntityTraits::kindToString(entity.kind)) + " " +
                    std::to_string(entity.id) + " has no payload, skipping");
        return;
    }

    switch (entity.kind) {
        case EntityKind::Player:
            PlayerBehavior::update(entity, world, delta);
            break;
        case EntityKind::Stove:
            StoveBehavior::update(entity, world, delta);
            break;
        case EntityKind::Customer:
            CustomerBehavior::update(entity, world, delta);
            break;
        case EntityKind::Projectile:
            ProjectileBehavior::update(entity, world, delta);
            break;
        case EntityKind::Seat:
            SeatBehavior::update(entity, world, delta);
            break;
        case EntityKind::Generic:
        case EntityKind::Ingredient:
        case EntityKind::IngredientBin:
        case EntityKind::Dish:
        default:
            // Carried, placed or static; nothing of their own to do
            break;
    }

    // The kind behavior may have destroyed the entity
    if (!entity.active) {
        return;
    }

    if (!updateDropDecay(entity, world, delta)) {
        return;
    }

    draw(entity, world);
}

bool updateDropDecay(Entity& entity, GameWorld& world, float delta) {
    if (!entity.droppedTimer) {
        return true;
    }

    *entity.droppedTimer -= delta;
    if (*entity.droppedTimer <= 0.0f) {
        world.getEntities().destroyEntity(entity.id);
        return false;
    }
    return true;
}

float dropAlpha(const Entity& entity, float expiration) {
    if (!entity.droppedTimer || expiration <= 0.0f) {
        return 1.0f;
    }
    return std::clamp(*entity.droppedTimer / expiration, 0.0f, 1.0f);
}

void draw(const Entity& entity, GameWorld& world) {
    const float alpha = dropAlpha(entity, world.getTuning().droppedExpiration);

    if (entity.sprite) {
        world.draw(RenderCommand::sprite(entity.position, entity.size, entity.zIndex,
                                         *entity.sprite, entity.rotation, alpha));
        return;
    }

    if (!entity.shape) {
        return;
    }

    const Color base = entity.color.value_or(Colors::White);
    const Color color = base.withAlpha(base.a * alpha);
    switch (*entity.shape) {
        case EntityShape::Rect:
            world.draw(RenderCommand::rect(entity.position, entity.size, entity.zIndex, color));
            break;
        case EntityShape::Circle:
            world.draw(RenderCommand::circle(entity.position, entity.size, entity.zIndex, color));
            break;
    }
}

} // namespace EntityBehaviors
} // namespace DinerEngine
