/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include "utils/Vector2D.hpp"
#include <array>
#include <cstdint>

namespace DinerEngine {

struct Entity;

enum class InputEventType : uint8_t {
    ButtonDown = 0,
    ButtonUp = 1
};

enum class KeyCode : uint8_t {
    W = 0,
    A = 1,
    S = 2,
    D = 3,
    MouseLeft = 4,
    MouseRight = 5,
    Pause = 6,
    COUNT
};

const char* keyCodeToString(KeyCode code);

/**
 * @brief Platform-independent input snapshot
 *
 * The platform layer forwards button transitions and relative mouse motion;
 * the simulation reads held state, consumes click latches and reads the
 * world-space cursor. A click stays "pending" for a few frames so a press
 * arriving between two updates is not lost; wasLeftClicked() consumes it.
 */
class InputManager {
public:
    explicit InputManager(uint8_t clickLatchFrames = 5, uint8_t mouseMovingFrames = 5);

    // Event intake
    void onButtonEvent(InputEventType type, KeyCode code);
    // Relative motion in screen space; y is flipped into world space
    void onMouseDelta(float dx, float dy);

    // Decrements latches, call once at the start of every frame
    void update();
    // Clears all held state, latches and the cursor
    void reset();

    // Keyboard / buttons
    bool isKeyDown(KeyCode code) const;
    bool wasKeyPressed(KeyCode code);   // True once per press

    // Consumes the pending click, if any
    bool wasLeftClicked();
    bool wasRightClicked();
    bool isMouseMoving() const { return m_mouseMovingFrames > 0; }

    // Unit-less direction from WASD: x = D - A, y = W - S
    Vector2D getMovementAxis() const;

    // Cursor in world space
    const Vector2D& getCursor() const { return m_cursor; }
    void setCursor(const Vector2D& cursor) { m_cursor = cursor; }

    // Hover tests use strict inequalities, matching the render footprint
    bool isHoveringCircle(const Vector2D& center, float diameter) const;
    bool isHoveringEntity(const Entity& entity) const;

private:
    static constexpr size_t KEY_COUNT = static_cast<size_t>(KeyCode::COUNT);

    std::array<bool, KEY_COUNT> m_keyStates{};
    std::array<bool, KEY_COUNT> m_pressedThisFrame{};

    Vector2D m_cursor{0.0f, 0.0f};

    uint8_t m_clickLatchFrames;
    uint8_t m_mouseMovingLatchFrames;
    uint8_t m_leftClickFrames{0};
    uint8_t m_rightClickFrames{0};
    uint8_t m_mouseMovingFrames{0};
};

} // namespace DinerEngine

#endif  // INPUT_MANAGER_HPP
