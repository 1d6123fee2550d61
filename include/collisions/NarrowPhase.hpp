/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NARROW_PHASE_HPP
#define NARROW_PHASE_HPP

#include "collisions/CollisionBody.hpp"
#include "collisions/CollisionInfo.hpp"
#include "utils/Vector2D.hpp"
#include <optional>

namespace DinerEngine {

struct Entity;

namespace NarrowPhase {

/**
 * @brief Tests two entities for overlap.
 *
 * Returns nothing if either entity has no collider. The contact normal
 * points toward `a`, so callers resolving `a` add normal * penetration to
 * its position.
 */
std::optional<Contact> testCollision(const Entity& a, const Entity& b);

// Shape-level tests, positions are shape centers
std::optional<Contact> circleToCircle(const Vector2D& posA, float radiusA,
                                      const Vector2D& posB, float radiusB);

std::optional<Contact> circleToBox(const Vector2D& circlePos, float radius,
                                   const Vector2D& boxPos, const Vector2D& halfExtents);

std::optional<Contact> boxToBox(const Vector2D& posA, const Vector2D& halfA,
                                const Vector2D& posB, const Vector2D& halfB);

std::optional<Contact> testShapes(const Vector2D& posA, const ColliderShape& shapeA,
                                  const Vector2D& posB, const ColliderShape& shapeB);

} // namespace NarrowPhase

} // namespace DinerEngine

#endif // NARROW_PHASE_HPP
