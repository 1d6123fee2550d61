/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_WORLD_HPP
#define GAME_WORLD_HPP

/**
 * @file GameWorld.hpp
 * @brief Aggregate root of one game run
 *
 * Owns every piece of simulation state: input snapshot, entity slots,
 * collider registries, sprite table, RNG, score and timers, and the frame
 * render queue. There is exactly one instance per run and it is passed by
 * reference to everything that needs it; reset() rebuilds it in place for
 * replay.
 *
 * The texture loader and audio sink are borrowed and must outlive the
 * world. Either may be null, in which case sprites stay unloaded and sound
 * cues are discarded.
 */

#include "core/GameTuning.hpp"
#include "entities/EntityKind.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/IAudioSink.hpp"
#include "managers/InputManager.hpp"
#include "render/RenderQueue.hpp"
#include "render/SpriteTable.hpp"
#include "utils/RandomGenerator.hpp"
#include <cstdint>
#include <optional>

namespace DinerEngine {

class ITextureLoader;
struct Entity;

class GameWorld {
public:
    GameWorld(float width, float height, uint32_t seed,
              const GameTuning& tuning = GameTuning{},
              ITextureLoader* textureLoader = nullptr,
              IAudioSink* audioSink = nullptr);

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;

    /**
     * @brief Clears all entities and state and builds a fresh level
     *
     * Textures are loaded on the first reset only.
     */
    void reset(uint32_t seed);

    // Subsystems
    InputManager& getInput() { return m_input; }
    EntityDataManager& getEntities() { return m_entities; }
    const EntityDataManager& getEntities() const { return m_entities; }
    CollisionManager& getCollisions() { return m_collisions; }
    const CollisionManager& getCollisions() const { return m_collisions; }
    RenderQueue& getRenderQueue() { return m_renderQueue; }
    RandomGenerator& getRng() { return m_rng; }
    const SpriteTable& getSprites() const { return m_sprites; }
    const GameTuning& getTuning() const { return m_tuning; }

    float getWidth() const { return m_width; }
    float getHeight() const { return m_height; }

    EntityID getPlayerId() const { return m_playerId; }
    Entity* getPlayer() { return m_entities.get(m_playerId); }
    const Entity* getPlayer() const { return m_entities.get(m_playerId); }

    uint32_t getScore() const { return m_score; }
    void addScore(uint32_t points) { m_score += points; }

    float getElapsedTime() const { return m_elapsedTime; }
    void advanceTime(float delta) { m_elapsedTime += delta; }

    float getCustomerSpawnTimer() const { return m_customerSpawnTimer; }
    void setCustomerSpawnTimer(float seconds) { m_customerSpawnTimer = seconds; }

    bool isPaused() const { return m_paused; }
    void setPaused(bool paused) { m_paused = paused; }
    bool isGameOver() const { return m_gameOver; }
    void setGameOver(bool gameOver) { m_gameOver = gameOver; }

    // Timestamp of the previous frame in milliseconds, empty before the first
    std::optional<int64_t> getPreviousTimestamp() const { return m_previousTimestamp; }
    void setPreviousTimestamp(int64_t ms) { m_previousTimestamp = ms; }

    // Queues a draw call for this frame
    void draw(const RenderCommand& command) { m_renderQueue.push(command); }
    void playSound(SoundCue cue);

private:
    GameTuning m_tuning;
    float m_width;
    float m_height;

    CollisionManager m_collisions;
    EntityDataManager m_entities{m_collisions};
    InputManager m_input;
    RenderQueue m_renderQueue;
    RandomGenerator m_rng;
    SpriteTable m_sprites;

    ITextureLoader* mp_textureLoader;
    IAudioSink* mp_audioSink;
    bool m_spritesLoaded{false};

    EntityID m_playerId{INVALID_ENTITY_ID};
    uint32_t m_score{0};
    float m_elapsedTime{0.0f};
    float m_customerSpawnTimer{0.0f};
    bool m_paused{false};
    bool m_gameOver{false};
    std::optional<int64_t> m_previousTimestamp;
};

} // namespace DinerEngine

#endif // GAME_WORLD_HPP
