/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef IAUDIO_SINK_HPP
#define IAUDIO_SINK_HPP

#include <cstdint>

namespace DinerEngine {

enum class SoundCue : uint8_t {
    Pickup = 0,
    Drop = 1,
    CookDone = 2,
    Serve = 3,
    Hit = 4,
    Throw = 5,
    COUNT
};

constexpr const char* soundCueToString(SoundCue cue) noexcept {
    switch (cue) {
        case SoundCue::Pickup:   return "pickup";
        case SoundCue::Drop:     return "drop";
        case SoundCue::CookDone: return "cook_done";
        case SoundCue::Serve:    return "serve";
        case SoundCue::Hit:      return "hit";
        case SoundCue::Throw:    return "throw";
        default:                 return "unknown";
    }
}

// Fire-and-forget sound output. Implementations must not throw.
class IAudioSink {
public:
    virtual ~IAudioSink() = default;
    virtual void play(SoundCue cue) = 0;
};

class NullAudioSink final : public IAudioSink {
public:
    void play(SoundCue) override {}
};

} // namespace DinerEngine

#endif // IAUDIO_SINK_HPP
