/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "collisions/AABB.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <string>

namespace DinerEngine {

const char* keyCodeToString(KeyCode code) {
    switch (code) {
        case KeyCode::W:          return "W";
        case KeyCode::A:          return "A";
        case KeyCode::S:          return "S";
        case KeyCode::D:          return "D";
        case KeyCode::MouseLeft:  return "MouseLeft";
        case KeyCode::MouseRight: return "MouseRight";
        case KeyCode::Pause:      return "Pause";
        default:                  return "Unknown";
    }
}

InputManager::InputManager(uint8_t clickLatchFrames, uint8_t mouseMovingFrames)
    : m_clickLatchFrames(clickLatchFrames),
      m_mouseMovingLatchFrames(mouseMovingFrames) {}

void InputManager::onButtonEvent(InputEventType type, KeyCode code) {
    const auto index = static_cast<size_t>(code);
    if (index >= KEY_COUNT) {
        INPUT_WARN(std::string("Ignoring unknown key code ") + std::to_string(index));
        return;
    }

    const bool down = (type == InputEventType::ButtonDown);
    if (down && !m_keyStates[index]) {
        m_pressedThisFrame[index] = true;
    }
    m_keyStates[index] = down;

    if (down) {
        if (code == KeyCode::MouseLeft) {
            m_leftClickFrames = m_clickLatchFrames;
        } else if (code == KeyCode::MouseRight) {
            m_rightClickFrames = m_clickLatchFrames;
        }
    }

    INPUT_DEBUG(std::string(keyCodeToString(code)) + (down ? " down" : " up"));
}

void InputManager::onMouseDelta(float dx, float dy) {
    m_mouseMovingFrames = m_mouseMovingLatchFrames;
    m_cursor += Vector2D(dx, -dy);
}

void InputManager::update() {
    if (m_leftClickFrames > 0) {
        --m_leftClickFrames;
    }
    if (m_rightClickFrames > 0) {
        --m_rightClickFrames;
    }
    if (m_mouseMovingFrames > 0) {
        --m_mouseMovingFrames;
    }
}

void InputManager::reset() {
    m_keyStates.fill(false);
    m_pressedThisFrame.fill(false);
    m_cursor = Vector2D(0.0f, 0.0f);
    m_leftClickFrames = 0;
    m_rightClickFrames = 0;
    m_mouseMovingFrames = 0;
}

bool InputManager::isKeyDown(KeyCode code) const {
    const auto index = static_cast<size_t>(code);
    return index < KEY_COUNT && m_keyStates[index];
}

bool InputManager::wasKeyPressed(KeyCode code) {
    const auto index = static_cast<size_t>(code);
    if (index >= KEY_COUNT || !m_pressedThisFrame[index]) {
        return false;
    }
    m_pressedThisFrame[index] = false;
    return true;
}

bool InputManager::wasLeftClicked() {
    if (m_leftClickFrames > 0) {
        m_leftClickFrames = 0;
        return true;
    }
    return false;
}

bool InputManager::wasRightClicked() {
    if (m_rightClickFrames > 0) {
        m_rightClickFrames = 0;
        return true;
    }
    return false;
}

Vector2D InputManager::getMovementAxis() const {
    float x = 0.0f;
    float y = 0.0f;
    if (isKeyDown(KeyCode::D)) x += 1.0f;
    if (isKeyDown(KeyCode::A)) x -= 1.0f;
    if (isKeyDown(KeyCode::W)) y += 1.0f;
    if (isKeyDown(KeyCode::S)) y -= 1.0f;
    return Vector2D(x, y);
}

bool InputManager::isHoveringCircle(const Vector2D& center, float diameter) const {
    return Vector2D::distance(center, m_cursor) < diameter * 0.5f;
}

bool InputManager::isHoveringEntity(const Entity& entity) const {
    if (!entity.shape) {
        return false;
    }

    switch (*entity.shape) {
        case EntityShape::Circle:
            return isHoveringCircle(entity.position, entity.size.getX());
        case EntityShape::Rect:
            return AABB::fromSize(entity.position, entity.size).containsStrict(m_cursor);
    }
    return false;
}

} // namespace DinerEngine
