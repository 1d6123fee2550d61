/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/behaviors/PlayerBehavior.hpp"
#include "collisions/AABB.hpp"
#include "collisions/NarrowPhase.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityFactory.hpp"
#include "entities/behaviors/SeatBehavior.hpp"
#include "entities/behaviors/StoveBehavior.hpp"
#include "render/RenderCommand.hpp"
#include <cmath>
#include <string>

namespace DinerEngine {
namespace PlayerBehavior {

namespace {

// Keeps `point` within `radius` of `center`
Vector2D clampToRadius(const Vector2D& point, const Vector2D& center, float radius) {
    const Vector2D diff = point - center;
    const float distance = diff.length();
    if (distance <= radius || distance <= 0.0f) {
        return point;
    }
    return center + diff * (radius / distance);
}

void move(Entity& player, GameWorld& world, float delta) {
    const Vector2D axis = world.getInput().getMovementAxis();

    player.velocity = Vector2D(
        accelerateAxis(player.velocity.getX(), axis.getX(), player.acceleration, delta),
        accelerateAxis(player.velocity.getY(), axis.getY(), player.acceleration, delta));
    player.velocity = player.velocity.limited(player.speed);
    player.position += player.velocity * delta;
}

void resolveTerrain(Entity& player, GameWorld& world) {
    EntityDataManager& entities = world.getEntities();

    for (EntityID id : world.getCollisions().getColliders(CollisionMask::Terrain)) {
        const Entity* terrain = entities.get(id);
        if (!terrain) {
            PLAYER_WARN("Terrain collider " + std::to_string(id) + " is dead");
            continue;
        }

        const auto contact = NarrowPhase::testCollision(player, *terrain);
        if (!contact) {
            continue;
        }

        player.position += contact->normal * contact->penetration;

        const float intoSurface = player.velocity.dot(contact->normal);
        if (intoSurface < 0.0f) {
            player.velocity -= contact->normal * intoSurface;
        }
    }
}

void updateHands(Entity& player, PlayerData& data, GameWorld& world, float delta) {
    InputManager& input = world.getInput();
    const GameTuning& tuning = world.getTuning();

    // The cursor is relative to the player while the mouse moves
    if (input.isMouseMoving()) {
        input.setCursor(input.getCursor() + player.velocity * delta);
    }
    input.setCursor(clampToRadius(input.getCursor(), player.position, tuning.handsReach));

    const Vector2D step = (input.getCursor() - data.handsPosition).limited(tuning.handsSpeed * delta);
    data.handsPosition = clampToRadius(data.handsPosition + step, player.position, tuning.handsReach);

    const Color color = input.isKeyDown(KeyCode::MouseLeft) ? Colors::Blue : Colors::Green;
    world.draw(RenderCommand::circle(data.handsPosition, Vector2D::splat(tuning.handsSize),
                                     EntityFactory::Z_HANDS, color));
}

void carryHeld(Entity& player, const PlayerData& data, GameWorld& world) {
    if (!player.holding) {
        return;
    }

    Entity* held = world.getEntities().get(*player.holding);
    if (!held) {
        PLAYER_DEBUG("Held entity " + std::to_string(*player.holding) + " is gone");
        player.holding.reset();
        return;
    }
    held->position = data.handsPosition;
}

// Returns the first hovered entity of a kind that satisfies `pred`
template<typename Pred>
Entity* findHovered(GameWorld& world, EntityKind kind, Pred pred) {
    EntityDataManager& entities = world.getEntities();
    const InputManager& input = world.getInput();
    for (EntityID id : entities.kindView(kind)) {
        Entity* e = entities.get(id);
        if (e && input.isHoveringEntity(*e) && pred(*e)) {
            return e;
        }
    }
    return nullptr;
}

void hold(Entity& player, EntityID id) {
    player.holding = id;
}

void drop(Entity& player, Entity& held, GameWorld& world) {
    held.droppedTimer = world.getTuning().droppedExpiration;
    player.holding.reset();
    world.playSound(SoundCue::Drop);
}

bool tryAddToStove(Entity& player, Entity& held, GameWorld& world) {
    if (!held.ingredient) {
        return false;
    }

    Entity* stove = findHovered(world, EntityKind::Stove, [](const Entity& e) {
        return e.stove && e.stove->state == StoveState::Idle &&
               e.stove->ingredients.size() < MAX_STOVE_INGREDIENTS;
    });
    if (!stove || !StoveBehavior::addIngredient(*stove->stove, held.ingredient->color)) {
        return false;
    }

    PLAYER_DEBUG(std::string("Added ") + Recipes::ingredientName(held.ingredient->color) +
                 " to stove " + std::to_string(stove->id));
    player.holding.reset();
    world.getEntities().destroyEntity(held.id);
    world.playSound(SoundCue::Drop);
    return true;
}

bool tryServeDish(Entity& player, Entity& held, GameWorld& world) {
    if (!held.dish) {
        return false;
    }

    EntityDataManager& entities = world.getEntities();
    const InputManager& input = world.getInput();
    const Vector2D targetSize = Vector2D::splat(world.getTuning().seatDishTargetSize);

    for (EntityID id : entities.kindView(EntityKind::Seat)) {
        Entity* seat = entities.get(id);
        if (!seat || !seat->seat || !seat->seat->occupied || seat->seat->dish) {
            continue;
        }

        const Vector2D target = SeatBehavior::dishTarget(*seat);
        if (!AABB::fromSize(target, targetSize).containsStrict(input.getCursor())) {
            continue;
        }

        held.position = target;
        held.droppedTimer.reset();
        seat->seat->dish = held.id;
        player.holding.reset();
        world.playSound(SoundCue::Serve);
        PLAYER_DEBUG(std::string("Served ") + Recipes::dishName(held.dish->type) +
                     " at seat " + std::to_string(id));
        return true;
    }
    return false;
}

void handleLeftClickHolding(Entity& player, Entity& held, GameWorld& world) {
    if (tryAddToStove(player, held, world)) {
        return;
    }
    if (tryServeDish(player, held, world)) {
        return;
    }
    drop(player, held, world);
}

void handleLeftClickEmpty(Entity& player, PlayerData& data, GameWorld& world) {
    Entity* stove = findHovered(world, EntityKind::Stove, [](const Entity& e) {
        return e.stove && e.stove->state == StoveState::DishReady;
    });
    if (stove) {
        // The stove keeps its dish until the dish entity exists
        const EntityID id = EntityFactory::createDish(world, data.handsPosition,
                                                      stove->stove->result);
        if (id != INVALID_ENTITY_ID && StoveBehavior::takeDish(*stove->stove)) {
            hold(player, id);
            world.playSound(SoundCue::Pickup);
        }
        return;
    }

    auto isDropped = [](const Entity& e) { return e.droppedTimer.has_value(); };
    Entity* dropped = findHovered(world, EntityKind::Ingredient, isDropped);
    if (!dropped) {
        dropped = findHovered(world, EntityKind::Dish, isDropped);
    }
    if (dropped) {
        dropped->droppedTimer.reset();
        hold(player, dropped->id);
        world.playSound(SoundCue::Pickup);
        return;
    }

    Entity* bin = findHovered(world, EntityKind::IngredientBin,
                              [](const Entity& e) { return e.ingredientBin.has_value(); });
    if (bin) {
        const EntityID id = EntityFactory::createIngredient(world, data.handsPosition,
                                                           bin->ingredientBin->color);
        if (id != INVALID_ENTITY_ID) {
            hold(player, id);
            world.playSound(SoundCue::Pickup);
        }
    }
}

void handleClicks(Entity& player, PlayerData& data, GameWorld& world) {
    InputManager& input = world.getInput();

    if (input.wasLeftClicked()) {
        Entity* held = player.holding ? world.getEntities().get(*player.holding) : nullptr;
        if (held) {
            handleLeftClickHolding(player, *held, world);
        } else {
            player.holding.reset();
            handleLeftClickEmpty(player, data, world);
        }
    }

    if (input.wasRightClicked()) {
        Entity* stove = findHovered(world, EntityKind::Stove,
                                    [](const Entity& e) { return e.stove.has_value(); });
        if (stove && StoveBehavior::beginCooking(*stove->stove, world.getTuning().cookTime)) {
            PLAYER_DEBUG("Stove " + std::to_string(stove->id) + " started cooking");
        }
    }
}

} // namespace

float accelerateAxis(float velocity, float input, float acceleration, float delta) {
    const float step = acceleration * delta;
    if (input != 0.0f) {
        return velocity + input * step;
    }
    // Brake toward zero without crossing it
    if (std::abs(velocity) <= step) {
        return 0.0f;
    }
    return velocity > 0.0f ? velocity - step : velocity + step;
}

void update(Entity& player, GameWorld& world, float delta) {
    PlayerData& data = *player.player;

    move(player, world, delta);
    resolveTerrain(player, world);
    updateHands(player, data, world, delta);
    carryHeld(player, data, world);
    handleClicks(player, data, world);

    if (player.health == 0 && !world.isGameOver()) {
        PLAYER_INFO("Player is out of health");
        world.setGameOver(true);
    }
}

} // namespace PlayerBehavior
} // namespace DinerEngine
