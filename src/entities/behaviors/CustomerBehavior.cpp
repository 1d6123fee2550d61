/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/behaviors/CustomerBehavior.hpp"
#include "core/GameTuning.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "render/RenderCommand.hpp"
#include <cmath>
#include <numbers>
#include <string>

namespace DinerEngine {
namespace CustomerBehavior {

namespace {

constexpr float ORDER_BUBBLE_SIZE = 28.0f;
constexpr float ORDER_BUBBLE_BORDER = 2.0f;

float degreesToRadians(float degrees) {
    return degrees * std::numbers::pi_v<float> / 180.0f;
}

const char* moodName(CustomerMood mood) {
    switch (mood) {
        case CustomerMood::Ordering: return "ordering";
        case CustomerMood::Angry:    return "angry";
        case CustomerMood::Eating:   return "eating";
        default:                     return "unknown";
    }
}

void setMood(Entity& entity, CustomerData& customer, CustomerMood mood, const GameTuning& tuning) {
    CUSTOMER_DEBUG("Customer " + std::to_string(entity.id) + " " + moodName(customer.mood) +
                   " -> " + moodName(mood));
    customer.mood = mood;
    switch (mood) {
        case CustomerMood::Angry:
            customer.fireTimer = tuning.fireTime;
            break;
        case CustomerMood::Eating:
            customer.eatTimer = tuning.eatTime;
            break;
        case CustomerMood::Ordering:
            customer.waitTimer = tuning.waitTime;
            break;
    }
}

// Handles a dish placed on the seat while ordering or angry
void checkServedDish(Entity& entity, CustomerData& customer, SeatData& seat, GameWorld& world) {
    EntityDataManager& entities = world.getEntities();
    Entity* dish = entities.get(seat.dish);
    if (!dish) {
        seat.dish.reset();
        return;
    }
    if (!dish->dish) {
        CUSTOMER_WARN("Entity " + std::to_string(dish->id) + " on seat is not a dish");
        seat.dish.reset();
        return;
    }

    if (dish->dish->type == customer.order) {
        setMood(entity, customer, CustomerMood::Eating, world.getTuning());
        return;
    }

    CUSTOMER_DEBUG(std::string("Customer rejected ") + Recipes::dishName(dish->dish->type) +
                   ", wanted " + Recipes::dishName(customer.order));
    entities.destroyEntity(dish->id);
    seat.dish.reset();
    if (customer.mood != CustomerMood::Angry) {
        setMood(entity, customer, CustomerMood::Angry, world.getTuning());
    }
}

void fireAtPlayer(Entity& entity, CustomerData& customer, GameWorld& world) {
    const Entity* player = world.getPlayer();
    if (!player) {
        return;
    }

    const Vector2D toPlayer = player->position - entity.position;
    if (toPlayer.length() <= world.getTuning().safeRadius) {
        return;
    }

    for (const Vector2D& direction : volley(customer, toPlayer, world.getTuning())) {
        EntityFactory::createProjectile(world, entity.position, direction, entity.id);
    }
    world.playSound(SoundCue::Throw);
}

void leave(Entity& entity, CustomerData& customer, SeatData* seat, GameWorld& world) {
    EntityDataManager& entities = world.getEntities();
    if (seat) {
        if (Entity* dish = entities.get(seat->dish)) {
            entities.destroyEntity(dish->id);
        }
        seat->dish.reset();
        seat->customer.reset();
        seat->occupied = false;
    }

    const uint32_t value = Recipes::dishValue(customer.order);
    world.addScore(value);
    CUSTOMER_INFO("Customer " + std::to_string(entity.id) + " finished " +
                  Recipes::dishName(customer.order) + ", +" + std::to_string(value));
    entities.destroyEntity(entity.id);
}

void drawOrder(const Entity& entity, const CustomerData& customer, GameWorld& world) {
    if (customer.mood == CustomerMood::Eating) {
        return;
    }

    const Vector2D bubble = entity.position +
                            Vector2D(0.0f, world.getTuning().customerDialogOffset);
    const Vector2D size = Vector2D::splat(ORDER_BUBBLE_SIZE);
    const Color frame = customer.mood == CustomerMood::Angry ? Colors::Red : Colors::White;

    world.draw(RenderCommand::borderRect(bubble, size, EntityFactory::Z_CUSTOMER_ORDER,
                                         ORDER_BUBBLE_BORDER, frame));
    if (const auto sprite = world.getSprites().dish(customer.order)) {
        world.draw(RenderCommand::sprite(bubble, size, EntityFactory::Z_CUSTOMER_ORDER, *sprite));
    } else {
        world.draw(RenderCommand::circle(bubble, size * 0.7f, EntityFactory::Z_CUSTOMER_ORDER,
                                         Recipes::dishColor(customer.order)));
    }
}

} // namespace

ShotDirections volley(CustomerData& customer, const Vector2D& toTarget, const GameTuning& tuning) {
    ShotDirections shots;
    const Vector2D aim = toTarget.normalized();

    switch (customer.archetype) {
        case CustomerArchetype::Sniper:
            shots.push_back(aim);
            break;
        case CustomerArchetype::Spreader: {
            const float spread = degreesToRadians(tuning.spreadAngleDegrees);
            shots.push_back(aim.rotated(-spread));
            shots.push_back(aim);
            shots.push_back(aim.rotated(spread));
            break;
        }
        case CustomerArchetype::Barrager: {
            const uint32_t count = tuning.barrageCount;
            const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(count == 0 ? 1 : count);
            for (uint32_t i = 0; i < count; ++i) {
                shots.push_back(Vector2D(1.0f, 0.0f).rotated(customer.barragePhase + step * static_cast<float>(i)));
            }
            customer.barragePhase = std::fmod(customer.barragePhase + tuning.barragePhaseStep,
                                              2.0f * std::numbers::pi_v<float>);
            break;
        }
        default:
            break;
    }
    return shots;
}

void update(Entity& entity, GameWorld& world, float delta) {
    CustomerData& customer = *entity.customer;
    const GameTuning& tuning = world.getTuning();

    Entity* seatEntity = world.getEntities().get(customer.seat);
    SeatData* seat = seatEntity && seatEntity->seat ? &*seatEntity->seat : nullptr;
    if (!seat) {
        CUSTOMER_WARN("Customer " + std::to_string(entity.id) + " has no valid seat " +
                      std::to_string(customer.seat));
    }

    switch (customer.mood) {
        case CustomerMood::Ordering:
            customer.waitTimer -= delta;
            if (seat && seat->dish) {
                checkServedDish(entity, customer, *seat, world);
            }
            if (customer.mood == CustomerMood::Ordering && customer.waitTimer <= 0.0f) {
                setMood(entity, customer, CustomerMood::Angry, tuning);
            }
            break;

        case CustomerMood::Angry:
            if (seat && seat->dish) {
                checkServedDish(entity, customer, *seat, world);
                if (customer.mood != CustomerMood::Angry) {
                    break;
                }
            }
            customer.fireTimer -= delta;
            if (customer.fireTimer <= 0.0f) {
                customer.fireTimer = tuning.fireTime;
                fireAtPlayer(entity, customer, world);
            }
            break;

        case CustomerMood::Eating:
            customer.eatTimer -= delta;
            if (customer.eatTimer <= 0.0f) {
                leave(entity, customer, seat, world);
                return;
            }
            break;
    }

    drawOrder(entity, customer, world);
}

} // namespace CustomerBehavior
} // namespace DinerEngine
