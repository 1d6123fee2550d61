/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CustomerBehaviorTests
#include <boost/test/unit_test.hpp>

#include "WorldTestFixture.hpp"
#include "entities/behaviors/CustomerBehavior.hpp"
#include <cmath>
#include <numbers>

using namespace DinerEngine;

namespace {
constexpr float DEG = std::numbers::pi_v<float> / 180.0f;

float angleOf(const Vector2D& v) {
    return std::atan2(v.getY(), v.getX());
}
}

BOOST_AUTO_TEST_SUITE(VolleyTests)

BOOST_AUTO_TEST_CASE(TestSniperAimsAtTarget) {
    CustomerData customer;
    customer.archetype = CustomerArchetype::Sniper;
    auto shots = CustomerBehavior::volley(customer, Vector2D(0.0f, -50.0f), GameTuning{});

    BOOST_REQUIRE_EQUAL(shots.size(), 1u);
    BOOST_CHECK_SMALL(shots[0].getX(), 0.0001f);
    BOOST_CHECK_CLOSE(shots[0].getY(), -1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSpreaderFansAroundTarget) {
    CustomerData customer;
    customer.archetype = CustomerArchetype::Spreader;
    auto shots = CustomerBehavior::volley(customer, Vector2D(100.0f, 0.0f), GameTuning{});

    BOOST_REQUIRE_EQUAL(shots.size(), 3u);
    BOOST_CHECK_CLOSE(angleOf(shots[0]), -15.0f * DEG, 0.01f);
    BOOST_CHECK_SMALL(angleOf(shots[1]), 0.0001f);
    BOOST_CHECK_CLOSE(angleOf(shots[2]), 15.0f * DEG, 0.01f);
    for (const auto& shot : shots) {
        BOOST_CHECK_CLOSE(shot.length(), 1.0f, 0.001f);
    }
}

BOOST_AUTO_TEST_CASE(TestBarragerRingRotates) {
    const GameTuning tuning;
    CustomerData customer;
    customer.archetype = CustomerArchetype::Barrager;

    auto first = CustomerBehavior::volley(customer, Vector2D(1.0f, 0.0f), tuning);
    BOOST_REQUIRE_EQUAL(first.size(), tuning.barrageCount);
    BOOST_CHECK_CLOSE(first[0].getX(), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(customer.barragePhase, tuning.barragePhaseStep, 0.001f);

    // Ring is evenly spaced
    const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(tuning.barrageCount);
    BOOST_CHECK_CLOSE(angleOf(first[1]), step, 0.01f);

    auto second = CustomerBehavior::volley(customer, Vector2D(1.0f, 0.0f), tuning);
    BOOST_CHECK_CLOSE(angleOf(second[0]), tuning.barragePhaseStep, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Mood machine
// ============================================================================

struct CustomerFixture : WorldTestFixture {
    CustomerFixture() {
        seatId = EntityFactory::createSeat(*world, Vector2D(700.0f, 360.0f), Vector2D(32.0f, 0.0f));
        customerId = EntityFactory::createCustomer(*world, seatId);
        BOOST_REQUIRE_NE(customerId, INVALID_ENTITY_ID);
    }

    CustomerData& customer() { return *entity(customerId).customer; }
    SeatData& seat() { return *entity(seatId).seat; }

    void update(float delta) {
        CustomerBehavior::update(entity(customerId), *world, delta);
    }

    EntityID serve(DishType type) {
        const EntityID dish = EntityFactory::createDish(*world, Vector2D(732.0f, 360.0f), type);
        seat().dish = dish;
        return dish;
    }

    static DishType wrongDishFor(DishType order) {
        return order == DishType::Salad ? DishType::Soup : DishType::Salad;
    }

    EntityID seatId{INVALID_ENTITY_ID};
    EntityID customerId{INVALID_ENTITY_ID};
};

BOOST_FIXTURE_TEST_SUITE(CustomerMoodTests, CustomerFixture)

BOOST_AUTO_TEST_CASE(TestSeatedCustomerOrders) {
    BOOST_CHECK(seat().occupied);
    BOOST_CHECK(seat().customer == customerId);
    BOOST_CHECK(customer().mood == CustomerMood::Ordering);
    BOOST_CHECK(customer().order != DishType::Burnt);
    BOOST_CHECK_EQUAL(customer().seat, seatId);
}

BOOST_AUTO_TEST_CASE(TestOccupiedSeatRejectsSecondCustomer) {
    BOOST_CHECK_EQUAL(EntityFactory::createCustomer(*world, seatId), INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(TestImpatienceTurnsAngry) {
    update(world->getTuning().waitTime + 0.1f);
    BOOST_CHECK(customer().mood == CustomerMood::Angry);
    BOOST_CHECK_CLOSE(customer().fireTimer, world->getTuning().fireTime, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRightDishIsEatenAndScored) {
    const DishType order = customer().order;
    const EntityID dish = serve(order);

    update(0.1f);
    BOOST_CHECK(customer().mood == CustomerMood::Eating);

    update(world->getTuning().eatTime + 0.1f);
    BOOST_CHECK(!world->getEntities().isActive(customerId));
    BOOST_CHECK(!world->getEntities().isActive(dish));
    BOOST_CHECK(!seat().occupied);
    BOOST_CHECK(!seat().customer.has_value());
    BOOST_CHECK(!seat().dish.has_value());
    BOOST_CHECK_EQUAL(world->getScore(), Recipes::dishValue(order));
}

BOOST_AUTO_TEST_CASE(TestWrongDishIsRejected) {
    const EntityID dish = serve(wrongDishFor(customer().order));

    update(0.1f);
    BOOST_CHECK(customer().mood == CustomerMood::Angry);
    BOOST_CHECK(!world->getEntities().isActive(dish));
    BOOST_CHECK(!seat().dish.has_value());
    BOOST_CHECK_EQUAL(world->getScore(), 0u);
}

BOOST_AUTO_TEST_CASE(TestAngryCustomerCanStillBeServed) {
    update(world->getTuning().waitTime + 0.1f);
    BOOST_REQUIRE(customer().mood == CustomerMood::Angry);

    serve(customer().order);
    update(0.1f);
    BOOST_CHECK(customer().mood == CustomerMood::Eating);
}

BOOST_AUTO_TEST_CASE(TestAngryCustomerFiresAtDistantPlayer) {
    update(world->getTuning().waitTime + 0.1f);
    BOOST_REQUIRE(customer().mood == CustomerMood::Angry);

    update(world->getTuning().fireTime);
    const size_t shots = world->getEntities().getActiveCount(EntityKind::Projectile);
    BOOST_CHECK_GE(shots, 1u);
    BOOST_CHECK_EQUAL(audio.countOf(SoundCue::Throw), 1u);

    for (EntityID id : world->getEntities().kindView(EntityKind::Projectile)) {
        BOOST_CHECK_EQUAL(entity(id).projectile->owner, customerId);
    }
    BOOST_CHECK_CLOSE(customer().fireTimer, world->getTuning().fireTime, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNoFireInsideSafeRadius) {
    player().position = entity(customerId).position + Vector2D(50.0f, 0.0f);
    update(world->getTuning().waitTime + 0.1f);
    update(world->getTuning().fireTime);

    BOOST_CHECK_EQUAL(world->getEntities().getActiveCount(EntityKind::Projectile), 0u);
    BOOST_CHECK_EQUAL(audio.countOf(SoundCue::Throw), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
