/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FrameDriver.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/EntityBehaviors.hpp"
#include "entities/EntityFactory.hpp"
#include "render/HudRenderer.hpp"
#include "render/IRenderBackend.hpp"
#include <algorithm>
#include <string>

namespace DinerEngine {

FrameDriver::FrameDriver(IRenderBackend& backend, ITextureLoader* textureLoader,
                         IAudioSink* audioSink, const GameTuning& tuning)
    : m_backend(backend),
      mp_textureLoader(textureLoader),
      mp_audioSink(audioSink),
      m_tuning(tuning) {}

FrameDriver::~FrameDriver() = default;

bool FrameDriver::init(int width, int height, uint32_t seed) {
    if (width <= 0 || height <= 0) {
        GAMELOOP_ERROR("Invalid playfield size " + std::to_string(width) + "x" +
                       std::to_string(height));
        return false;
    }

    mp_world = std::make_unique<GameWorld>(static_cast<float>(width), static_cast<float>(height),
                                           seed, m_tuning, mp_textureLoader, mp_audioSink);
    m_runCount = 1;
    GAMELOOP_INFO("Initialized " + std::to_string(width) + "x" + std::to_string(height) +
                  ", seed " + std::to_string(seed));
    return true;
}

float FrameDriver::computeDelta(std::optional<int64_t> previousMs, int64_t nowMs, float maxDelta) {
    if (!previousMs) {
        return 0.0f;
    }
    const float delta = static_cast<float>(nowMs - *previousMs) / 1000.0f;
    return std::clamp(delta, 0.0f, maxDelta);
}

void FrameDriver::onFrame(int64_t timestampMs) {
    if (!mp_world) {
        GAMELOOP_WARN("onFrame before init");
        return;
    }
    GameWorld& world = *mp_world;

    const float delta = computeDelta(world.getPreviousTimestamp(), timestampMs, m_tuning.maxFrameDelta);
    world.setPreviousTimestamp(timestampMs);

    world.getInput().update();
    m_backend.clearFrame();

    EntityDataManager& entities = world.getEntities();
    if (!world.isPaused() && !world.isGameOver()) {
        world.advanceTime(delta);
        EntityFactory::spawnCustomers(world, delta);
        for (size_t i = 0; i < EntityDataManager::getCapacity(); ++i) {
            EntityBehaviors::update(entities.slot(i), world, delta);
        }
    } else {
        for (size_t i = 0; i < EntityDataManager::getCapacity(); ++i) {
            const Entity& entity = entities.slot(i);
            if (entity.active) {
                EntityBehaviors::draw(entity, world);
            }
        }
    }

    RenderQueue& queue = world.getRenderQueue();
    if (queue.getDroppedCount() > 0) {
        GAMELOOP_WARN(std::to_string(queue.getDroppedCount()) + " draw calls dropped this frame");
    }
    queue.drainTo(m_backend);
    HudRenderer::drawHud(world, m_backend);
    queue.reset();
}

void FrameDriver::onInputEvent(InputEventType type, KeyCode code) {
    if (!mp_world) {
        GAMELOOP_WARN("Input event before init");
        return;
    }
    GameWorld& world = *mp_world;

    if (type == InputEventType::ButtonDown) {
        if (world.isGameOver() && code == KeyCode::MouseLeft) {
            replay();
            return;
        }
        if (code == KeyCode::Pause && !world.isGameOver()) {
            world.setPaused(!world.isPaused());
            GAMELOOP_INFO(world.isPaused() ? "Paused" : "Resumed");
        }
    }

    world.getInput().onButtonEvent(type, code);
}

void FrameDriver::onMouseDelta(float dx, float dy) {
    if (!mp_world) {
        return;
    }
    mp_world->getInput().onMouseDelta(dx, dy);
}

void FrameDriver::replay() {
    if (!mp_world) {
        GAMELOOP_WARN("replay before init");
        return;
    }

    const uint32_t seed = static_cast<uint32_t>(mp_world->getRng().engine()());
    GAMELOOP_INFO("Starting run " + std::to_string(m_runCount + 1) + ", final score was " +
                  std::to_string(mp_world->getScore()));
    mp_world->reset(seed);
    ++m_runCount;
}

uint32_t FrameDriver::getScore() const {
    return mp_world ? mp_world->getScore() : 0;
}

} // namespace DinerEngine
