/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/EntityFactory.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include <array>
#include <string>

namespace DinerEngine {
namespace EntityFactory {

namespace {

// Level layout, world units with y up
constexpr float COUNTER_X = 200.0f;
constexpr float COUNTER_WIDTH = 80.0f;
constexpr float COUNTER_HEIGHT = 400.0f;
constexpr float COUNTER_COLLIDER_WIDTH = 75.0f;

constexpr float TABLE_X = 425.0f;
constexpr float TABLE_WIDTH = 100.0f;
constexpr float TABLE_HEIGHT = 300.0f;

constexpr float PILLAR_DIAMETER = 150.0f;

constexpr float WALL_THICKNESS = 120.0f;
constexpr float WALL_INSET = 50.0f;

constexpr float STOVE_SPACING = 76.0f;
constexpr float BIN_SIZE = 56.0f;
constexpr float BIN_SPACING = 70.0f;
constexpr float BIN_MARGIN = 60.0f;
constexpr float BIN_TOP_OFFSET = 80.0f;

Color archetypeColor(CustomerArchetype archetype) {
    switch (archetype) {
        case CustomerArchetype::Sniper:   return Colors::Yellow;
        case CustomerArchetype::Spreader: return Colors::Orange;
        case CustomerArchetype::Barrager: return Colors::Purple;
        default:                          return Colors::White;
    }
}

} // namespace

EntityID createPlayer(GameWorld& world) {
    const GameTuning& tuning = world.getTuning();

    Entity e;
    e.kind = EntityKind::Player;
    e.position = Vector2D(tuning.playerStartX, world.getHeight() / 2.0f);
    e.size = Vector2D::splat(tuning.playerSize);
    e.zIndex = Z_PLAYER;
    e.sprite = world.getSprites().player;
    e.shape = EntityShape::Circle;
    e.color = Colors::Yellow;
    e.acceleration = tuning.playerAcceleration;
    e.speed = tuning.playerSpeed;
    e.health = tuning.playerHealth;
    e.collider = Collider::circle(tuning.playerSize / 2.0f, CollisionMask::Player);
    e.player = PlayerData{e.position};

    const EntityID id = world.getEntities().createEntity(e);
    if (id == INVALID_ENTITY_ID) {
        FACTORY_ERROR("Failed to create player");
    }
    return id;
}

EntityID createBlock(GameWorld& world, const Vector2D& position, const Vector2D& size,
                     const Vector2D& colliderSize, const Color& color) {
    Entity e;
    e.kind = EntityKind::Generic;
    e.position = position;
    e.size = size;
    e.zIndex = Z_FLOOR;
    e.shape = EntityShape::Rect;
    e.color = color;
    e.collider = Collider::box(colliderSize * 0.5f, CollisionMask::Terrain);
    return world.getEntities().createEntity(e);
}

EntityID createPillar(GameWorld& world, const Vector2D& position, float diameter) {
    Entity e;
    e.kind = EntityKind::Generic;
    e.position = position;
    e.size = Vector2D::splat(diameter);
    e.zIndex = Z_FLOOR;
    e.shape = EntityShape::Circle;
    e.color = Colors::LightGrey;
    e.collider = Collider::circle(diameter / 2.0f, CollisionMask::Terrain);
    return world.getEntities().createEntity(e);
}

EntityID createSeat(GameWorld& world, const Vector2D& position, const Vector2D& dishTargetOffset) {
    const GameTuning& tuning = world.getTuning();

    Entity e;
    e.kind = EntityKind::Seat;
    e.position = position;
    e.size = Vector2D::splat(tuning.seatSize);
    e.zIndex = Z_SEAT;
    e.shape = EntityShape::Rect;
    e.color = Colors::LightGrey;
    e.seat = SeatData{false, std::nullopt, std::nullopt, dishTargetOffset};
    return world.getEntities().createEntity(e);
}

EntityID createTable(GameWorld& world, const Vector2D& position, const Vector2D& size) {
    const GameTuning& tuning = world.getTuning();

    const EntityID table = createBlock(world, position, size, size, Colors::Brown);
    if (table == INVALID_ENTITY_ID) {
        FACTORY_ERROR("Failed to create table");
        return table;
    }

    const float leftX = position.getX() - size.getX() / 2.0f - tuning.seatOffsetX;
    const float rightX = position.getX() + size.getX() / 2.0f + tuning.seatOffsetX;
    const float topY = position.getY() + size.getY() / 2.0f - tuning.seatOffsetY;
    const float bottomY = position.getY() - size.getY() / 2.0f + tuning.seatOffsetY;

    // Left seats put their dish toward +x, right seats toward -x
    const Vector2D leftTarget(tuning.seatDishTargetOffset, 0.0f);
    const Vector2D rightTarget(-tuning.seatDishTargetOffset, 0.0f);

    const std::array<std::pair<Vector2D, Vector2D>, 6> seats{{
        {Vector2D(leftX, topY), leftTarget},
        {Vector2D(leftX, position.getY()), leftTarget},
        {Vector2D(leftX, bottomY), leftTarget},
        {Vector2D(rightX, topY), rightTarget},
        {Vector2D(rightX, position.getY()), rightTarget},
        {Vector2D(rightX, bottomY), rightTarget},
    }};

    for (const auto& [seatPos, target] : seats) {
        if (createSeat(world, seatPos, target) == INVALID_ENTITY_ID) {
            FACTORY_ERROR("Failed to create seat");
        }
    }
    return table;
}

EntityID createIngredientBin(GameWorld& world, const Vector2D& position, IngredientColor color) {
    Entity e;
    e.kind = EntityKind::IngredientBin;
    e.position = position;
    e.size = Vector2D::splat(BIN_SIZE);
    e.zIndex = Z_STATION;
    e.shape = EntityShape::Rect;
    e.color = Recipes::ingredientColor(color);
    e.ingredientBin = IngredientBinData{color};
    return world.getEntities().createEntity(e);
}

EntityID createStove(GameWorld& world, const Vector2D& position) {
    Entity e;
    e.kind = EntityKind::Stove;
    e.position = position;
    e.size = Vector2D::splat(world.getTuning().stoveSize);
    e.zIndex = Z_STATION;
    e.sprite = world.getSprites().stove;
    e.shape = EntityShape::Rect;
    e.color = Colors::DarkGrey;
    e.stove = StoveData{};
    return world.getEntities().createEntity(e);
}

EntityID createCustomer(GameWorld& world, EntityID seatId) {
    EntityDataManager& entities = world.getEntities();
    Entity* seat = entities.get(seatId);
    if (!seat || !seat->seat) {
        FACTORY_WARN("createCustomer: " + std::to_string(seatId) + " is not a seat");
        return INVALID_ENTITY_ID;
    }
    if (seat->seat->occupied) {
        FACTORY_WARN("createCustomer: seat " + std::to_string(seatId) + " is occupied");
        return INVALID_ENTITY_ID;
    }

    const GameTuning& tuning = world.getTuning();
    RandomGenerator& rng = world.getRng();

    const auto archetype = static_cast<CustomerArchetype>(
        rng.rangeInt(0, static_cast<int>(CustomerArchetype::COUNT) - 1));
    const auto weights = Recipes::orderWeights();
    const auto order = static_cast<DishType>(rng.weightedIndex(weights.begin(), weights.end()));

    Entity e;
    e.kind = EntityKind::Customer;
    e.position = seat->position;
    e.size = Vector2D::splat(tuning.customerSize);
    e.zIndex = Z_CUSTOMER;
    e.sprite = world.getSprites().customer(archetype);
    e.shape = EntityShape::Circle;
    e.color = archetypeColor(archetype);

    CustomerData customer;
    customer.seat = seatId;
    customer.order = order;
    customer.mood = CustomerMood::Ordering;
    customer.archetype = archetype;
    customer.waitTimer = tuning.waitTime;
    customer.fireTimer = tuning.fireTime;
    e.customer = customer;

    const EntityID id = entities.createEntity(e);
    if (id == INVALID_ENTITY_ID) {
        return id;
    }

    // createEntity does not move slots, the seat pointer is still valid
    seat->seat->occupied = true;
    seat->seat->customer = id;

    FACTORY_DEBUG("Customer " + std::to_string(id) + " seated at " + std::to_string(seatId) +
                  ", orders " + Recipes::dishName(order));
    return id;
}

EntityID createIngredient(GameWorld& world, const Vector2D& position, IngredientColor color) {
    Entity e;
    e.kind = EntityKind::Ingredient;
    e.position = position;
    e.size = Vector2D::splat(world.getTuning().ingredientSize);
    e.zIndex = Z_ITEM;
    e.shape = EntityShape::Circle;
    e.color = Recipes::ingredientColor(color);
    e.ingredient = IngredientData{color};
    return world.getEntities().createEntity(e);
}

EntityID createDish(GameWorld& world, const Vector2D& position, DishType type) {
    Entity e;
    e.kind = EntityKind::Dish;
    e.position = position;
    e.size = Vector2D::splat(world.getTuning().dishSize);
    e.zIndex = Z_ITEM;
    e.sprite = world.getSprites().dish(type);
    e.shape = EntityShape::Circle;
    e.color = Recipes::dishColor(type);
    e.dish = DishData{type};
    return world.getEntities().createEntity(e);
}

EntityID createProjectile(GameWorld& world, const Vector2D& position,
                          const Vector2D& direction, EntityID owner) {
    const GameTuning& tuning = world.getTuning();

    Entity e;
    e.kind = EntityKind::Projectile;
    e.position = position;
    e.size = Vector2D::splat(tuning.projectileSize);
    e.zIndex = Z_PROJECTILE;
    e.shape = EntityShape::Circle;
    e.color = Colors::Red;
    e.velocity = direction.normalized() * tuning.projectileSpeed;
    e.speed = tuning.projectileSpeed;
    e.collider = Collider::circle(tuning.projectileSize / 2.0f, CollisionMask::Projectile);
    e.projectile = ProjectileData{owner, 0.0f};
    return world.getEntities().createEntity(e);
}

EntityID buildLevel(GameWorld& world) {
    const float w = world.getWidth();
    const float h = world.getHeight();

    const EntityID player = createPlayer(world);

    // Counter with the stoves on top of it
    createBlock(world, Vector2D(COUNTER_X, h / 2.0f), Vector2D(COUNTER_WIDTH, COUNTER_HEIGHT),
                Vector2D(COUNTER_COLLIDER_WIDTH, COUNTER_HEIGHT), Colors::Brown);
    for (size_t i = 0; i < MAX_STOVES; ++i) {
        const float offset = (static_cast<float>(i) - static_cast<float>(MAX_STOVES - 1) / 2.0f) *
                             STOVE_SPACING;
        createStove(world, Vector2D(COUNTER_X, h / 2.0f + offset));
    }

    // One bin per ingredient color along the top left
    for (size_t i = 0; i < INGREDIENT_COLOR_COUNT; ++i) {
        createIngredientBin(world,
                            Vector2D(BIN_MARGIN + static_cast<float>(i) * BIN_SPACING,
                                     h - BIN_TOP_OFFSET),
                            static_cast<IngredientColor>(i));
    }

    createTable(world, Vector2D(TABLE_X, h / 2.0f), Vector2D(TABLE_WIDTH, TABLE_HEIGHT));

    createPillar(world, Vector2D(900.0f, 175.0f), PILLAR_DIAMETER);
    createPillar(world, Vector2D(900.0f, h - 175.0f), PILLAR_DIAMETER);
    createPillar(world, Vector2D(670.0f, h / 2.0f), PILLAR_DIAMETER);

    // Walls sit mostly outside the playfield
    createBlock(world, Vector2D(-WALL_INSET, h / 2.0f), Vector2D(WALL_THICKNESS, h),
                Vector2D(WALL_THICKNESS, h), Colors::DarkGrey);
    createBlock(world, Vector2D(w + WALL_INSET, h / 2.0f), Vector2D(WALL_THICKNESS, h),
                Vector2D(WALL_THICKNESS, h), Colors::DarkGrey);
    createBlock(world, Vector2D(w / 2.0f, -WALL_INSET), Vector2D(w, WALL_THICKNESS),
                Vector2D(w, WALL_THICKNESS), Colors::DarkGrey);
    createBlock(world, Vector2D(w / 2.0f, h + WALL_INSET), Vector2D(w, WALL_THICKNESS),
                Vector2D(w, WALL_THICKNESS), Colors::DarkGrey);

    return player;
}

EntityID spawnCustomers(GameWorld& world, float delta) {
    const float timer = world.getCustomerSpawnTimer() - delta;
    if (timer > 0.0f) {
        world.setCustomerSpawnTimer(timer);
        return INVALID_ENTITY_ID;
    }
    world.setCustomerSpawnTimer(world.getTuning().customerSpawnTime);

    EntityDataManager& entities = world.getEntities();
    std::array<EntityID, MAX_ENTITIES> freeSeats{};
    size_t freeCount = 0;
    for (EntityID id : entities.kindView(EntityKind::Seat)) {
        const Entity* seat = entities.get(id);
        if (seat && seat->seat && !seat->seat->occupied) {
            freeSeats[freeCount++] = id;
        }
    }

    if (freeCount == 0) {
        FACTORY_DEBUG("No free seat for a new customer");
        return INVALID_ENTITY_ID;
    }

    const auto pick = static_cast<size_t>(world.getRng().rangeInt(0, static_cast<int>(freeCount) - 1));
    return createCustomer(world, freeSeats[pick]);
}

} // namespace EntityFactory
} // namespace DinerEngine
