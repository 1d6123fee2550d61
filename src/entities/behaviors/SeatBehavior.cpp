/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/behaviors/SeatBehavior.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityFactory.hpp"
#include "render/RenderCommand.hpp"
#include <string>

namespace DinerEngine {
namespace SeatBehavior {

namespace {
constexpr float DISH_TARGET_BORDER = 2.0f;
}

Vector2D dishTarget(const Entity& seat) {
    return seat.seat ? seat.position + seat.seat->dishTargetOffset : seat.position;
}

void update(Entity& entity, GameWorld& world, float /*delta*/) {
    SeatData& seat = *entity.seat;
    EntityDataManager& entities = world.getEntities();

    if (seat.dish && !entities.isActive(*seat.dish)) {
        SEAT_DEBUG("Seat " + std::to_string(entity.id) + " dropped stale dish " +
                   std::to_string(*seat.dish));
        seat.dish.reset();
    }

    if (seat.customer && !entities.isActive(*seat.customer)) {
        SEAT_WARN("Seat " + std::to_string(entity.id) + " lost its customer " +
                  std::to_string(*seat.customer));
        seat.customer.reset();
        seat.occupied = false;
    }

    if (seat.occupied && !seat.dish) {
        world.draw(RenderCommand::borderRect(dishTarget(entity),
                                             Vector2D::splat(world.getTuning().seatDishTargetSize),
                                             EntityFactory::Z_DISH_TARGET, DISH_TARGET_BORDER,
                                             Colors::White));
    }
}

} // namespace SeatBehavior
} // namespace DinerEngine
