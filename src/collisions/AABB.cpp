/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

namespace DinerEngine {

bool AABB::overlaps(const AABB& other) const {
    return left() <= other.right() && other.left() <= right() &&
           other.bottom() <= top() && bottom() <= other.top();
}

bool AABB::containsStrict(const Vector2D& p) const {
    return left() < p.getX() && p.getX() < right() &&
           bottom() < p.getY() && p.getY() < top();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    return center + (p - center).clamped(-halfSize, halfSize);
}

} // namespace DinerEngine
