/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_BEHAVIORS_HPP
#define ENTITY_BEHAVIORS_HPP

/**
 * @file EntityBehaviors.hpp
 * @brief Per-frame update dispatch keyed by EntityKind
 *
 * update() runs the kind behavior, then the shared step: drop decay and
 * queueing the entity's own sprite or shape. An entity whose payload does
 * not match its kind is skipped for the frame with a warning.
 */

namespace DinerEngine {

class GameWorld;
struct Entity;

namespace EntityBehaviors {

// True if the payload required by the entity's kind is engaged
bool hasPayload(const Entity& entity);

void update(Entity& entity, GameWorld& world, float delta);

/**
 * @brief Counts down a running drop timer
 * @return false if the timer ran out and the entity was destroyed
 */
bool updateDropDecay(Entity& entity, GameWorld& world, float delta);

// Alpha of a dropped entity: fades linearly to zero over the expiration
float dropAlpha(const Entity& entity, float expiration);

// Queues the sprite (preferred) or shape of the entity
void draw(const Entity& entity, GameWorld& world);

} // namespace EntityBehaviors

} // namespace DinerEngine

#endif // ENTITY_BEHAVIORS_HPP
