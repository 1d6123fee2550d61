/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE NarrowPhaseTests
#include <boost/test/unit_test.hpp>

#include "collisions/NarrowPhase.hpp"
#include "entities/Entity.hpp"

using namespace DinerEngine;

namespace {

Entity makeCircle(const Vector2D& pos, float radius) {
    Entity e;
    e.position = pos;
    e.collider = Collider::circle(radius, CollisionMask::Player);
    return e;
}

Entity makeBox(const Vector2D& pos, const Vector2D& half) {
    Entity e;
    e.position = pos;
    e.collider = Collider::box(half, CollisionMask::Terrain);
    return e;
}

} // namespace

BOOST_AUTO_TEST_SUITE(CircleCircleTests)

BOOST_AUTO_TEST_CASE(TestOverlappingCircles) {
    // Two 128 wide circles whose centers are 100 apart
    Entity a = makeCircle(Vector2D(100.0f, 0.0f), 64.0f);
    Entity b = makeCircle(Vector2D(0.0f, 0.0f), 64.0f);

    auto contact = NarrowPhase::testCollision(a, b);
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_CLOSE(contact->penetration, 28.0f, 0.001f);
    BOOST_CHECK_CLOSE(contact->normal.getX(), 1.0f, 0.001f);
    BOOST_CHECK_SMALL(contact->normal.getY(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestTouchingCirclesDoNotCollide) {
    auto contact = NarrowPhase::circleToCircle(Vector2D(0.0f, 0.0f), 10.0f,
                                               Vector2D(20.0f, 0.0f), 10.0f);
    BOOST_CHECK(!contact.has_value());
}

BOOST_AUTO_TEST_CASE(TestCoincidentCirclesPushUp) {
    auto contact = NarrowPhase::circleToCircle(Vector2D(5.0f, 5.0f), 10.0f,
                                               Vector2D(5.0f, 5.0f), 6.0f);
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_EQUAL(contact->normal.getX(), 0.0f);
    BOOST_CHECK_EQUAL(contact->normal.getY(), 1.0f);
    BOOST_CHECK_CLOSE(contact->penetration, 16.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestMissingColliderNeverCollides) {
    Entity a = makeCircle(Vector2D(0.0f, 0.0f), 10.0f);
    Entity b;
    b.position = Vector2D(0.0f, 0.0f);
    BOOST_CHECK(!NarrowPhase::testCollision(a, b).has_value());
    BOOST_CHECK(!NarrowPhase::testCollision(b, a).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CircleBoxTests)

BOOST_AUTO_TEST_CASE(TestCircleAboveBox) {
    Entity circle = makeCircle(Vector2D(0.0f, 15.0f), 10.0f);
    Entity box = makeBox(Vector2D(0.0f, 0.0f), Vector2D(20.0f, 10.0f));

    auto contact = NarrowPhase::testCollision(circle, box);
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_SMALL(contact->normal.getX(), 0.0001f);
    BOOST_CHECK_CLOSE(contact->normal.getY(), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(contact->penetration, 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestBoxAgainstCircleFlipsNormal) {
    Entity circle = makeCircle(Vector2D(0.0f, 15.0f), 10.0f);
    Entity box = makeBox(Vector2D(0.0f, 0.0f), Vector2D(20.0f, 10.0f));

    auto contact = NarrowPhase::testCollision(box, circle);
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_CLOSE(contact->normal.getY(), -1.0f, 0.001f);
    BOOST_CHECK_CLOSE(contact->penetration, 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestCircleCenterInsideBoxUsesNearestFace) {
    // 2 units from the right face, 8 from the left
    auto contact = NarrowPhase::circleToBox(Vector2D(8.0f, 0.0f), 5.0f,
                                            Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_EQUAL(contact->normal.getX(), 1.0f);
    BOOST_CHECK_EQUAL(contact->normal.getY(), 0.0f);
    BOOST_CHECK_CLOSE(contact->penetration, 7.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestCircleNearCornerMisses) {
    // Inside the box's bounding square but outside the rounded corner
    auto contact = NarrowPhase::circleToBox(Vector2D(18.0f, 18.0f), 10.0f,
                                            Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_CHECK(!contact.has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BoxBoxTests)

BOOST_AUTO_TEST_CASE(TestShallowAxisWins) {
    auto contact = NarrowPhase::boxToBox(Vector2D(18.0f, 2.0f), Vector2D(10.0f, 10.0f),
                                         Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_EQUAL(contact->normal.getX(), 1.0f);
    BOOST_CHECK_EQUAL(contact->normal.getY(), 0.0f);
    BOOST_CHECK_CLOSE(contact->penetration, 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestEqualOverlapResolvesAlongY) {
    auto contact = NarrowPhase::boxToBox(Vector2D(-15.0f, -15.0f), Vector2D(10.0f, 10.0f),
                                         Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_EQUAL(contact->normal.getX(), 0.0f);
    BOOST_CHECK_EQUAL(contact->normal.getY(), -1.0f);
    BOOST_CHECK_CLOSE(contact->penetration, 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestEdgeContactIsACollision) {
    auto contact = NarrowPhase::boxToBox(Vector2D(20.0f, 0.0f), Vector2D(10.0f, 10.0f),
                                         Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_REQUIRE(contact.has_value());
    BOOST_CHECK_SMALL(contact->penetration, 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestSwappingBoxesFlipsNormal) {
    // Same y center: the x centers decide which side along y
    const Vector2D posA(5.0f, 0.0f);
    const Vector2D halfA(10.0f, 2.0f);
    const Vector2D posB(0.0f, 0.0f);
    const Vector2D halfB(10.0f, 10.0f);

    auto ab = NarrowPhase::boxToBox(posA, halfA, posB, halfB);
    auto ba = NarrowPhase::boxToBox(posB, halfB, posA, halfA);
    BOOST_REQUIRE(ab.has_value());
    BOOST_REQUIRE(ba.has_value());
    BOOST_CHECK_EQUAL(ab->normal.getX(), 0.0f);
    BOOST_CHECK_EQUAL(ab->normal.getY(), 1.0f);
    BOOST_CHECK_EQUAL(ba->normal.getX(), -ab->normal.getX());
    BOOST_CHECK_EQUAL(ba->normal.getY(), -ab->normal.getY());
    BOOST_CHECK_CLOSE(ab->penetration, 12.0f, 0.001f);
    BOOST_CHECK_CLOSE(ba->penetration, ab->penetration, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestConcentricBoxesUseHalfExtents) {
    auto ab = NarrowPhase::boxToBox(Vector2D(0.0f, 0.0f), Vector2D(10.0f, 2.0f),
                                    Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    auto ba = NarrowPhase::boxToBox(Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f),
                                    Vector2D(0.0f, 0.0f), Vector2D(10.0f, 2.0f));
    BOOST_REQUIRE(ab.has_value());
    BOOST_REQUIRE(ba.has_value());
    BOOST_CHECK_EQUAL(ab->normal.getY(), -1.0f);
    BOOST_CHECK_EQUAL(ba->normal.getY(), 1.0f);
    BOOST_CHECK_CLOSE(ab->penetration, 12.0f, 0.001f);
    BOOST_CHECK_CLOSE(ba->penetration, 12.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
