/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SDL_SOUND_SINK_HPP
#define SDL_SOUND_SINK_HPP

#include "managers/IAudioSink.hpp"
#include <SDL3_mixer/SDL_mixer.h>
#include <array>
#include <string>

namespace DinerEngine {

/**
 * @brief SDL3_mixer output for the simulation's sound cues
 *
 * Every cue owns one track with its audio preloaded, so replaying a cue
 * restarts it instead of layering copies. Missing files leave that cue
 * silent.
 */
class SDLSoundSink final : public IAudioSink {
public:
    SDLSoundSink() = default;
    ~SDLSoundSink() override;

    SDLSoundSink(const SDLSoundSink&) = delete;
    SDLSoundSink& operator=(const SDLSoundSink&) = delete;

    // Loads <directory>/<cue>.wav for every cue
    bool init(const std::string& directory);
    void clean();

    void play(SoundCue cue) override;

private:
    static constexpr size_t CUE_COUNT = static_cast<size_t>(SoundCue::COUNT);

    MIX_Mixer* mp_mixer{nullptr};
    std::array<MIX_Audio*, CUE_COUNT> m_audio{};
    std::array<MIX_Track*, CUE_COUNT> m_tracks{};
    bool m_initialized{false};
};

} // namespace DinerEngine

#endif // SDL_SOUND_SINK_HPP
