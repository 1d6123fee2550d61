/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_BEHAVIOR_HPP
#define PLAYER_BEHAVIOR_HPP

namespace DinerEngine {

class GameWorld;
struct Entity;

namespace PlayerBehavior {

/**
 * @brief Movement, terrain response, hands and click interactions
 *
 * Order within a frame: accelerate from WASD, clamp speed, integrate, push
 * out of every terrain collider, move the cursor and hands, carry the held
 * entity, then resolve clicks. Raises game over when health reaches zero.
 */
void update(Entity& player, GameWorld& world, float delta);

// Per-axis acceleration toward the input direction, braking without overshoot
float accelerateAxis(float velocity, float input, float acceleration, float delta);

} // namespace PlayerBehavior

} // namespace DinerEngine

#endif // PLAYER_BEHAVIOR_HPP
