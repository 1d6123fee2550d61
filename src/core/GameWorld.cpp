/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "render/IRenderBackend.hpp"
#include <string>

namespace DinerEngine {

GameWorld::GameWorld(float width, float height, uint32_t seed, const GameTuning& tuning,
                     ITextureLoader* textureLoader, IAudioSink* audioSink)
    : m_tuning(tuning),
      m_width(width),
      m_height(height),
      m_input(tuning.clickLatchFrames, tuning.mouseMovingFrames),
      m_rng(seed),
      mp_textureLoader(textureLoader),
      mp_audioSink(audioSink) {
    reset(seed);
}

void GameWorld::reset(uint32_t seed) {
    WORLD_INFO("Resetting world, seed " + std::to_string(seed));

    m_entities.clean();
    m_renderQueue.reset();
    m_input.reset();
    m_rng.reseed(seed);

    if (!m_spritesLoaded && mp_textureLoader) {
        m_sprites.load(*mp_textureLoader);
        m_spritesLoaded = true;
    }

    m_score = 0;
    m_elapsedTime = 0.0f;
    m_customerSpawnTimer = 0.0f;   // First customer arrives on the first frame
    m_paused = false;
    m_gameOver = false;
    m_previousTimestamp.reset();

    m_playerId = EntityFactory::buildLevel(*this);
    if (m_playerId == INVALID_ENTITY_ID) {
        WORLD_CRITICAL("Level built without a player");
    }

    WORLD_INFO("Level built with " + std::to_string(m_entities.getActiveCount()) + " entities");
}

void GameWorld::playSound(SoundCue cue) {
    if (mp_audioSink) {
        mp_audioSink->play(cue);
    }
}

} // namespace DinerEngine
