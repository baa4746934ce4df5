/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace CurveLights {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFrameTime(1.0f / std::max(targetFPS, 1.0f))
    , m_fixedTimestep(std::max(fixedTimestep, 0.0001f))
{
    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::startFrame() {
    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = now;
        // Tick once on the very first frame so the first render has fresh state
        m_accumulator = m_fixedTimestep;
        return;
    }

    double deltaSeconds = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaSeconds * 1000.0);

    if (m_usingSoftwareFrameLimiting) {
        // Frames are paced to the timestep, exactly one update each
        m_accumulator = m_fixedTimestep;
    } else {
        m_accumulator += std::min(deltaSeconds, MAX_ACCUMULATOR);
    }

    updateFPS(deltaSeconds);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    limitFrameRate();
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;

    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::updateFPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }

    float instantFPS = std::clamp(static_cast<float>(1.0 / deltaSeconds), 0.1f, 1000.0f);
    if (m_currentFPS <= 0.0f) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}

void TimestepManager::limitFrameRate() const {
    // VSync paces the frame inside SDL_RenderPresent()
    if (!m_usingSoftwareFrameLimiting) {
        return;
    }

    auto targetEnd = m_frameStart + std::chrono::nanoseconds(static_cast<int64_t>(m_targetFrameTime * 1e9));
    auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEnd - std::chrono::steady_clock::now());

    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

} // namespace CurveLights
