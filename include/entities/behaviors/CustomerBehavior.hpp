/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CUSTOMER_BEHAVIOR_HPP
#define CUSTOMER_BEHAVIOR_HPP

#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>

namespace DinerEngine {

class GameWorld;
struct GameTuning;

namespace CustomerBehavior {

using ShotDirections = boost::container::small_vector<Vector2D, 8>;

/**
 * @brief Unit directions of one volley
 *
 * Sniper fires once at the target, Spreader fans three shots around it and
 * Barrager fires a ring starting at the current barrage phase, which is
 * then advanced.
 */
ShotDirections volley(CustomerData& customer, const Vector2D& toTarget, const GameTuning& tuning);

/**
 * @brief Mood state machine
 *
 * Ordering waits for a dish on its seat; the right dish starts eating, the
 * wrong one is thrown away and the customer turns angry, as does running
 * out of patience. Angry customers fire at the player every fireTime
 * seconds unless the player is within safeRadius. When eating is done the
 * dish is cleared, the seat freed, the score credited and the customer
 * leaves.
 */
void update(Entity& customer, GameWorld& world, float delta);

} // namespace CustomerBehavior

} // namespace DinerEngine

#endif // CUSTOMER_BEHAVIOR_HPP
