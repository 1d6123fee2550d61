/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace DinerEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (capacity exhaustion, broken invariants)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

/**
 * @brief Fire-and-forget log channel for the simulation core.
 *
 * The core is single threaded, so unlike a threaded engine logger there is
 * no mutex here. Logging never feeds back into control flow.
 */
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  /**
   * @brief Silences all output (used by test executables and benchmarks)
   */
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    printf("DinerRush - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

inline std::atomic<bool> Logger::s_quietMode{false};

#define DINER_CRITICAL(system, msg)                                            \
  DinerEngine::Logger::Log(DinerEngine::LogLevel::CRITICAL, system, msg)
#define DINER_ERROR(system, msg)                                               \
  DinerEngine::Logger::Log(DinerEngine::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
// Debug builds - full functionality
#define DINER_WARN(system, msg)                                                \
  DinerEngine::Logger::Log(DinerEngine::LogLevel::WARNING, system, msg)
#define DINER_INFO(system, msg)                                                \
  DinerEngine::Logger::Log(DinerEngine::LogLevel::INFO, system, msg)
#define DINER_DEBUG(system, msg)                                               \
  DinerEngine::Logger::Log(DinerEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - warnings and below compile out
#define DINER_WARN(system, msg) ((void)0)  // Zero overhead
#define DINER_INFO(system, msg) ((void)0)  // Zero overhead
#define DINER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each core system

#define GAMELOOP_CRITICAL(msg) DINER_CRITICAL("FrameDriver", msg)
#define GAMELOOP_ERROR(msg) DINER_ERROR("FrameDriver", msg)
#define GAMELOOP_WARN(msg) DINER_WARN("FrameDriver", msg)
#define GAMELOOP_INFO(msg) DINER_INFO("FrameDriver", msg)
#define GAMELOOP_DEBUG(msg) DINER_DEBUG("FrameDriver", msg)

#define WORLD_CRITICAL(msg) DINER_CRITICAL("GameWorld", msg)
#define WORLD_ERROR(msg) DINER_ERROR("GameWorld", msg)
#define WORLD_WARN(msg) DINER_WARN("GameWorld", msg)
#define WORLD_INFO(msg) DINER_INFO("GameWorld", msg)
#define WORLD_DEBUG(msg) DINER_DEBUG("GameWorld", msg)

#define RENDER_CRITICAL(msg) DINER_CRITICAL("RenderQueue", msg)
#define RENDER_ERROR(msg) DINER_ERROR("RenderQueue", msg)
#define RENDER_WARN(msg) DINER_WARN("RenderQueue", msg)
#define RENDER_INFO(msg) DINER_INFO("RenderQueue", msg)
#define RENDER_DEBUG(msg) DINER_DEBUG("RenderQueue", msg)

#define TEXTURE_CRITICAL(msg) DINER_CRITICAL("TextureLoader", msg)
#define TEXTURE_ERROR(msg) DINER_ERROR("TextureLoader", msg)
#define TEXTURE_WARN(msg) DINER_WARN("TextureLoader", msg)
#define TEXTURE_INFO(msg) DINER_INFO("TextureLoader", msg)
#define TEXTURE_DEBUG(msg) DINER_DEBUG("TextureLoader", msg)

#define SOUND_CRITICAL(msg) DINER_CRITICAL("SoundManager", msg)
#define SOUND_ERROR(msg) DINER_ERROR("SoundManager", msg)
#define SOUND_WARN(msg) DINER_WARN("SoundManager", msg)
#define SOUND_INFO(msg) DINER_INFO("SoundManager", msg)
#define SOUND_DEBUG(msg) DINER_DEBUG("SoundManager", msg)

#define INPUT_CRITICAL(msg) DINER_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) DINER_ERROR("InputManager", msg)
#define INPUT_WARN(msg) DINER_WARN("InputManager", msg)
#define INPUT_INFO(msg) DINER_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) DINER_DEBUG("InputManager", msg)

#define SETTINGS_CRITICAL(msg) DINER_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) DINER_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) DINER_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) DINER_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) DINER_DEBUG("SettingsManager", msg)

// Entity Systems
#define ENTITY_CRITICAL(msg) DINER_CRITICAL("EntityDataManager", msg)
#define ENTITY_ERROR(msg) DINER_ERROR("EntityDataManager", msg)
#define ENTITY_WARN(msg) DINER_WARN("EntityDataManager", msg)
#define ENTITY_INFO(msg) DINER_INFO("EntityDataManager", msg)
#define ENTITY_DEBUG(msg) DINER_DEBUG("EntityDataManager", msg)

#define FACTORY_ERROR(msg) DINER_ERROR("EntityFactory", msg)
#define FACTORY_WARN(msg) DINER_WARN("EntityFactory", msg)
#define FACTORY_DEBUG(msg) DINER_DEBUG("EntityFactory", msg)

#define PLAYER_ERROR(msg) DINER_ERROR("Player", msg)
#define PLAYER_WARN(msg) DINER_WARN("Player", msg)
#define PLAYER_INFO(msg) DINER_INFO("Player", msg)
#define PLAYER_DEBUG(msg) DINER_DEBUG("Player", msg)

#define STOVE_ERROR(msg) DINER_ERROR("Stove", msg)
#define STOVE_WARN(msg) DINER_WARN("Stove", msg)
#define STOVE_INFO(msg) DINER_INFO("Stove", msg)
#define STOVE_DEBUG(msg) DINER_DEBUG("Stove", msg)

#define CUSTOMER_ERROR(msg) DINER_ERROR("Customer", msg)
#define CUSTOMER_WARN(msg) DINER_WARN("Customer", msg)
#define CUSTOMER_INFO(msg) DINER_INFO("Customer", msg)
#define CUSTOMER_DEBUG(msg) DINER_DEBUG("Customer", msg)

#define SEAT_WARN(msg) DINER_WARN("Seat", msg)
#define SEAT_DEBUG(msg) DINER_DEBUG("Seat", msg)

#define PROJECTILE_WARN(msg) DINER_WARN("Projectile", msg)
#define PROJECTILE_DEBUG(msg) DINER_DEBUG("Projectile", msg)

// Collision
#define COLLISION_CRITICAL(msg) DINER_CRITICAL("CollisionManager", msg)
#define COLLISION_ERROR(msg) DINER_ERROR("CollisionManager", msg)
#define COLLISION_WARN(msg) DINER_WARN("CollisionManager", msg)
#define COLLISION_INFO(msg) DINER_INFO("CollisionManager", msg)
#define COLLISION_DEBUG(msg) DINER_DEBUG("CollisionManager", msg)

// Quiet mode convenience macros
#define DINER_ENABLE_QUIET_MODE() DinerEngine::Logger::SetQuietMode(true)
#define DINER_DISABLE_QUIET_MODE() DinerEngine::Logger::SetQuietMode(false)

} // namespace DinerEngine

#endif // LOGGER_HPP
