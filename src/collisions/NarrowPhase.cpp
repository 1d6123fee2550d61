/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/NarrowPhase.hpp"
#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"
#include <initializer_list>
#include <utility>

namespace DinerEngine {
namespace NarrowPhase {

namespace {

// +1 when a lies on the positive side of b. Equal keys defer to the next
// pair, so swapping a and b flips the sign unless every key matches.
float sideSign(std::initializer_list<std::pair<float, float>> keys) {
    for (const auto& [a, b] : keys) {
        if (a > b) {
            return 1.0f;
        }
        if (a < b) {
            return -1.0f;
        }
    }
    return 1.0f;
}

} // namespace

std::optional<Contact> testCollision(const Entity& a, const Entity& b) {
    if (!a.collider || !b.collider) {
        return std::nullopt;
    }
    return testShapes(a.position, a.collider->shape, b.position, b.collider->shape);
}

std::optional<Contact> testShapes(const Vector2D& posA, const ColliderShape& shapeA,
                                  const Vector2D& posB, const ColliderShape& shapeB) {
    const auto* circleA = std::get_if<CircleShape>(&shapeA);
    const auto* circleB = std::get_if<CircleShape>(&shapeB);
    const auto* boxA = std::get_if<BoxShape>(&shapeA);
    const auto* boxB = std::get_if<BoxShape>(&shapeB);

    if (circleA && circleB) {
        return circleToCircle(posA, circleA->radius, posB, circleB->radius);
    }
    if (circleA && boxB) {
        return circleToBox(posA, circleA->radius, posB, boxB->halfExtents);
    }
    if (boxA && circleB) {
        // Solve from the circle's side, then point the normal back at the box
        auto contact = circleToBox(posB, circleB->radius, posA, boxA->halfExtents);
        if (contact) {
            contact->normal = -contact->normal;
        }
        return contact;
    }
    if (boxA && boxB) {
        return boxToBox(posA, boxA->halfExtents, posB, boxB->halfExtents);
    }
    return std::nullopt;
}

std::optional<Contact> circleToCircle(const Vector2D& posA, float radiusA,
                                      const Vector2D& posB, float radiusB) {
    const Vector2D diff = posA - posB;
    const float distance = diff.length();
    const float radii = radiusA + radiusB;
    if (distance >= radii) {
        return std::nullopt;
    }

    Contact contact;
    // Coincident centers have no separating direction; push straight up
    contact.normal = distance > 0.0f ? diff / distance : Vector2D(0.0f, 1.0f);
    contact.penetration = radii - distance;
    return contact;
}

std::optional<Contact> circleToBox(const Vector2D& circlePos, float radius,
                                   const Vector2D& boxPos, const Vector2D& halfExtents) {
    const AABB box(boxPos, halfExtents);
    const Vector2D closest = box.closestPoint(circlePos);
    const Vector2D diff = circlePos - closest;
    const float distance = diff.length();
    if (distance >= radius) {
        return std::nullopt;
    }

    Contact contact;
    if (distance > 0.0f) {
        contact.normal = diff / distance;
        contact.penetration = radius - distance;
        return contact;
    }

    // Center inside or on the box: leave through the nearest face
    const Vector2D local = circlePos - boxPos;
    const float toTop = halfExtents.getY() - local.getY();
    const float toBottom = halfExtents.getY() + local.getY();
    const float toRight = halfExtents.getX() - local.getX();
    const float toLeft = halfExtents.getX() + local.getX();

    float nearest = toTop;
    contact.normal = Vector2D(0.0f, 1.0f);
    if (toBottom < nearest) {
        nearest = toBottom;
        contact.normal = Vector2D(0.0f, -1.0f);
    }
    if (toRight < nearest) {
        nearest = toRight;
        contact.normal = Vector2D(1.0f, 0.0f);
    }
    if (toLeft < nearest) {
        nearest = toLeft;
        contact.normal = Vector2D(-1.0f, 0.0f);
    }
    contact.penetration = radius + nearest;
    return contact;
}

std::optional<Contact> boxToBox(const Vector2D& posA, const Vector2D& halfA,
                                const Vector2D& posB, const Vector2D& halfB) {
    const AABB a(posA, halfA);
    const AABB b(posB, halfB);
    if (!a.overlaps(b)) {
        return std::nullopt;
    }

    const float xSign = sideSign({{posA.getX(), posB.getX()},
                                  {posA.getY(), posB.getY()},
                                  {halfA.getX(), halfB.getX()},
                                  {halfA.getY(), halfB.getY()}});
    const float ySign = sideSign({{posA.getY(), posB.getY()},
                                  {posA.getX(), posB.getX()},
                                  {halfA.getY(), halfB.getY()},
                                  {halfA.getX(), halfB.getX()}});
    const bool aRight = xSign > 0.0f;
    const bool aAbove = ySign > 0.0f;
    const float xPen = aRight ? b.right() - a.left() : a.right() - b.left();
    const float yPen = aAbove ? b.top() - a.bottom() : a.top() - b.bottom();

    Contact contact;
    if (xPen < yPen) {
        contact.normal = Vector2D(xSign, 0.0f);
        contact.penetration = xPen;
    } else {
        // Equal overlap resolves along y
        contact.normal = Vector2D(0.0f, ySign);
        contact.penetration = yPen;
    }
    return contact;
}

} // namespace NarrowPhase
} // namespace DinerEngine
