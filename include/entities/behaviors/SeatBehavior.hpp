/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEAT_BEHAVIOR_HPP
#define SEAT_BEHAVIOR_HPP

#include "utils/Vector2D.hpp"

namespace DinerEngine {

class GameWorld;
struct Entity;

namespace SeatBehavior {

Vector2D dishTarget(const Entity& seat);

// Drops dead references and marks an empty dish target while occupied
void update(Entity& seat, GameWorld& world, float delta);

} // namespace SeatBehavior

} // namespace DinerEngine

#endif // SEAT_BEHAVIOR_HPP
