/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "platform/SDLSoundSink.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>

namespace DinerEngine {

SDLSoundSink::~SDLSoundSink() {
    if (m_initialized) {
        clean();
    }
}

bool SDLSoundSink::init(const std::string& directory) {
    if (m_initialized) {
        SOUND_WARN("Already initialized");
        return true;
    }

    if (!SDL_WasInit(SDL_INIT_AUDIO)) {
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            SOUND_ERROR(std::string("Failed to initialize SDL audio subsystem: ") + SDL_GetError());
            return false;
        }
    }

    if (!MIX_Init()) {
        SOUND_ERROR(std::string("Failed to initialize SDL3_mixer library: ") + SDL_GetError());
        return false;
    }

    mp_mixer = MIX_CreateMixerDevice(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, nullptr);
    if (!mp_mixer) {
        SOUND_ERROR(std::string("Failed to create SDL3_mixer instance: ") + SDL_GetError());
        MIX_Quit();
        return false;
    }

    size_t loaded = 0;
    for (size_t i = 0; i < CUE_COUNT; ++i) {
        const std::string path = directory + "/" + soundCueToString(static_cast<SoundCue>(i)) + ".wav";
        MIX_Audio* audio = MIX_LoadAudio(mp_mixer, path.c_str(), true);
        if (!audio) {
            SOUND_WARN("Failed to load sound effect: " + path + " - " + SDL_GetError());
            continue;
        }

        MIX_Track* track = MIX_CreateTrack(mp_mixer);
        if (!track || !MIX_SetTrackAudio(track, audio)) {
            SOUND_ERROR("Failed to create track for: " + path);
            if (track) {
                MIX_DestroyTrack(track);
            }
            MIX_DestroyAudio(audio);
            continue;
        }

        m_audio[i] = audio;
        m_tracks[i] = track;
        ++loaded;
    }

    m_initialized = true;
    SOUND_INFO("Loaded " + std::to_string(loaded) + " of " + std::to_string(CUE_COUNT) + " sound cues");
    return true;
}

void SDLSoundSink::clean() {
    for (auto& track : m_tracks) {
        if (track) {
            MIX_DestroyTrack(track);
            track = nullptr;
        }
    }
    for (auto& audio : m_audio) {
        if (audio) {
            MIX_DestroyAudio(audio);
            audio = nullptr;
        }
    }
    if (mp_mixer) {
        MIX_DestroyMixer(mp_mixer);
        mp_mixer = nullptr;
    }
    MIX_Quit();
    m_initialized = false;
    SOUND_INFO("SoundSink resources cleaned!");
}

void SDLSoundSink::play(SoundCue cue) {
    const auto index = static_cast<size_t>(cue);
    if (!m_initialized || index >= CUE_COUNT || !m_tracks[index]) {
        return;
    }

    if (!MIX_PlayTrack(m_tracks[index], 0)) {
        SOUND_WARN(std::string("Failed to play ") + soundCueToString(cue) + ": " + SDL_GetError());
    }
}

} // namespace DinerEngine
