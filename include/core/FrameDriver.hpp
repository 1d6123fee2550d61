/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_DRIVER_HPP
#define FRAME_DRIVER_HPP

#include "core/GameTuning.hpp"
#include "managers/InputManager.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace DinerEngine {

class GameWorld;
class IAudioSink;
class IRenderBackend;
class ITextureLoader;

/**
 * FrameDriver is the entry point the platform layer calls into.
 *
 * It is driven from outside, once per display frame, with a millisecond
 * timestamp. Each frame:
 * - delta time is derived from the previous timestamp (0 on the first
 *   frame, capped at maxFrameDelta)
 * - input latches are decremented and the backend is cleared
 * - unless paused or game over, customers spawn and every entity slot is
 *   updated in index order; otherwise the frozen scene is only drawn
 * - the queued commands are drained into the backend, the HUD is drawn on
 *   top, and the frame arena is released
 *
 * Input events arrive between frames. The pause key toggles pause; a left
 * click after game over starts a new run.
 */
class FrameDriver {
public:
    /**
     * @param backend Draw target, must outlive the driver
     * @param textureLoader Optional, sprites fall back to shapes without it
     * @param audioSink Optional, cues are dropped without it
     */
    explicit FrameDriver(IRenderBackend& backend,
                         ITextureLoader* textureLoader = nullptr,
                         IAudioSink* audioSink = nullptr,
                         const GameTuning& tuning = GameTuning{});
    ~FrameDriver();

    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    /**
     * Builds the world for a playfield of the given size.
     * @return false if the size is not positive
     */
    bool init(int width, int height, uint32_t seed);

    void onFrame(int64_t timestampMs);
    void onInputEvent(InputEventType type, KeyCode code);
    void onMouseDelta(float dx, float dy);

    // Rebuilds the world with a fresh seed derived from the current run
    void replay();

    bool isInitialized() const { return mp_world != nullptr; }
    GameWorld* getWorld() { return mp_world.get(); }
    const GameWorld* getWorld() const { return mp_world.get(); }
    uint32_t getScore() const;
    uint32_t getRunCount() const { return m_runCount; }

    // Seconds between two timestamps, 0 without a previous one, capped
    static float computeDelta(std::optional<int64_t> previousMs, int64_t nowMs, float maxDelta);

private:
    IRenderBackend& m_backend;
    ITextureLoader* mp_textureLoader;
    IAudioSink* mp_audioSink;
    GameTuning m_tuning;

    std::unique_ptr<GameWorld> mp_world;
    uint32_t m_runCount{0};
};

} // namespace DinerEngine

#endif // FRAME_DRIVER_HPP
