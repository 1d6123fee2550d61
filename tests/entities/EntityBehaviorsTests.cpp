/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE EntityBehaviorsTests
#include <boost/test/unit_test.hpp>

#include "WorldTestFixture.hpp"
#include "../mocks/MockRenderBackend.hpp"
#include "entities/EntityBehaviors.hpp"
#include "entities/behaviors/SeatBehavior.hpp"

using namespace DinerEngine;

struct BehaviorFixture : WorldTestFixture {
    // Draws whatever was queued and forgets it
    MockRenderBackend flush() {
        MockRenderBackend backend;
        world->getRenderQueue().drainTo(backend);
        world->getRenderQueue().reset();
        return backend;
    }
};

// ============================================================================
// Dispatch
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DispatchTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestPayloadMatchesKind) {
    Entity stove;
    stove.kind = EntityKind::Stove;
    BOOST_CHECK(!EntityBehaviors::hasPayload(stove));
    stove.stove = StoveData{};
    BOOST_CHECK(EntityBehaviors::hasPayload(stove));

    Entity prop;
    BOOST_CHECK(EntityBehaviors::hasPayload(prop));
}

BOOST_AUTO_TEST_CASE(TestMissingPayloadIsSkipped) {
    Entity broken;
    broken.kind = EntityKind::Customer;
    broken.shape = EntityShape::Circle;
    broken.size = Vector2D(10.0f, 10.0f);
    const EntityID id = world->getEntities().createEntity(broken);
    flush();

    EntityBehaviors::update(entity(id), *world, 0.1f);
    BOOST_CHECK(world->getEntities().isActive(id));
    BOOST_CHECK(world->getRenderQueue().empty());
}

BOOST_AUTO_TEST_CASE(TestInactiveSlotIsIgnored) {
    Entity& slot = world->getEntities().slot(MAX_ENTITIES - 1);
    BOOST_REQUIRE(!slot.active);
    flush();
    EntityBehaviors::update(slot, *world, 0.1f);
    BOOST_CHECK(world->getRenderQueue().empty());
}

BOOST_AUTO_TEST_CASE(TestDroppedEntityIsDestroyedOnExpiry) {
    const EntityID id = EntityFactory::createIngredient(*world, Vector2D(300.0f, 300.0f),
                                                        IngredientColor::Red);
    entity(id).droppedTimer = 0.05f;
    flush();

    EntityBehaviors::update(entity(id), *world, 0.1f);
    BOOST_CHECK(!world->getEntities().isActive(id));
    // Destroyed entities are not drawn
    BOOST_CHECK(world->getRenderQueue().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Drawing
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DrawTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestSpriteWinsOverShape) {
    Entity e;
    e.position = Vector2D(50.0f, 50.0f);
    e.size = Vector2D(20.0f, 20.0f);
    e.sprite = 9;
    e.shape = EntityShape::Rect;
    e.color = Colors::Red;
    flush();

    EntityBehaviors::draw(e, *world);
    MockRenderBackend backend = flush();
    BOOST_REQUIRE_EQUAL(backend.calls.size(), 1u);
    BOOST_CHECK(backend.calls[0].type == MockRenderBackend::CallType::TexturedQuad);
    BOOST_CHECK_EQUAL(backend.calls[0].texture, 9u);
}

BOOST_AUTO_TEST_CASE(TestDroppedShapeFades) {
    Entity e;
    e.size = Vector2D(20.0f, 20.0f);
    e.shape = EntityShape::Circle;
    e.color = Colors::Blue;
    e.droppedTimer = world->getTuning().droppedExpiration * 0.25f;
    flush();

    EntityBehaviors::draw(e, *world);
    MockRenderBackend backend = flush();
    BOOST_REQUIRE_EQUAL(backend.calls.size(), 1u);
    BOOST_CHECK(backend.calls[0].type == MockRenderBackend::CallType::FilledCircle);
    BOOST_CHECK_CLOSE(backend.calls[0].color.a, 0.25f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNothingToDraw) {
    Entity e;
    flush();
    EntityBehaviors::draw(e, *world);
    BOOST_CHECK(world->getRenderQueue().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Seats
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SeatTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestDishTargetIsOffsetFromSeat) {
    const EntityID id = EntityFactory::createSeat(*world, Vector2D(400.0f, 300.0f),
                                                  Vector2D(-32.0f, 0.0f));
    const Vector2D target = SeatBehavior::dishTarget(entity(id));
    BOOST_CHECK_EQUAL(target.getX(), 368.0f);
    BOOST_CHECK_EQUAL(target.getY(), 300.0f);
}

BOOST_AUTO_TEST_CASE(TestStaleReferencesAreCleared) {
    const EntityID seatId = EntityFactory::createSeat(*world, Vector2D(400.0f, 300.0f),
                                                      Vector2D(32.0f, 0.0f));
    const EntityID dishId = EntityFactory::createDish(*world, Vector2D(432.0f, 300.0f),
                                                      DishType::Soup);
    const EntityID customerId = EntityFactory::createCustomer(*world, seatId);
    BOOST_REQUIRE_NE(customerId, INVALID_ENTITY_ID);
    entity(seatId).seat->dish = dishId;

    BOOST_CHECK(world->getEntities().destroyEntity(dishId));
    BOOST_CHECK(world->getEntities().destroyEntity(customerId));

    SeatBehavior::update(entity(seatId), *world, 0.1f);
    const SeatData& seat = *entity(seatId).seat;
    BOOST_CHECK(!seat.dish.has_value());
    BOOST_CHECK(!seat.customer.has_value());
    BOOST_CHECK(!seat.occupied);
}

BOOST_AUTO_TEST_CASE(TestEmptyTargetIsMarkedWhileWaiting) {
    const EntityID seatId = EntityFactory::createSeat(*world, Vector2D(400.0f, 300.0f),
                                                      Vector2D(32.0f, 0.0f));
    flush();

    // Free seat shows nothing
    SeatBehavior::update(entity(seatId), *world, 0.1f);
    BOOST_CHECK(flush().calls.empty());

    BOOST_REQUIRE_NE(EntityFactory::createCustomer(*world, seatId), INVALID_ENTITY_ID);
    SeatBehavior::update(entity(seatId), *world, 0.1f);
    MockRenderBackend backend = flush();
    BOOST_REQUIRE_EQUAL(backend.calls.size(), 1u);
    BOOST_CHECK(backend.calls[0].type == MockRenderBackend::CallType::BorderedQuad);
}

BOOST_AUTO_TEST_SUITE_END()
