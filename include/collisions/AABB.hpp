/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace DinerEngine {

// World space box, y axis pointing up
struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(const Vector2D& c, const Vector2D& half) : center(c), halfSize(half) {}
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    static AABB fromSize(const Vector2D& c, const Vector2D& size) {
        return AABB(c, size * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float bottom() const { return center.getY() - halfSize.getY(); }
    float top() const { return center.getY() + halfSize.getY(); }

    // Edge contact counts as overlap
    bool overlaps(const AABB& other) const;
    // Strict interior test, used for cursor hover checks
    bool containsStrict(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;
};

} // namespace DinerEngine

#endif // AABB_HPP
