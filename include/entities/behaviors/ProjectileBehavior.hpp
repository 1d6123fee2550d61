/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROJECTILE_BEHAVIOR_HPP
#define PROJECTILE_BEHAVIOR_HPP

namespace DinerEngine {

class GameWorld;
struct Entity;

namespace ProjectileBehavior {

// Moves in a straight line; on the first player or terrain hit other than
// its owner, damages the target if it has health and is destroyed
void update(Entity& projectile, GameWorld& world, float delta);

} // namespace ProjectileBehavior

} // namespace DinerEngine

#endif // PROJECTILE_BEHAVIOR_HPP
