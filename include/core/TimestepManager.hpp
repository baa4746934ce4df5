/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace CurveLights {

/**
 * TimestepManager drives the light show at a fixed tick rate.
 *
 * Each fixed update is one particle tick, independent of the display rate.
 * Rendering happens once per frame. With VSync the accumulator absorbs
 * refresh-rate differences; without it, frames are paced in software.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Target frames per second for rendering
     * @param fixedTimestep Fixed timestep for updates in seconds
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true while a fixed update is due. May return true several
     * times per frame to catch up.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call this at the end of each frame; paces the frame when software
     * limiting is active.
     */
    void endFrame();

    float getCurrentFPS() const { return m_currentFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    void setSoftwareFrameLimiting(bool useSoftwareLimiting) { m_usingSoftwareFrameLimiting = useSoftwareLimiting; }
    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

private:
    void updateFPS(double deltaSeconds);
    void limitFrameRate() const;

    float m_targetFrameTime;
    float m_fixedTimestep;

    std::chrono::steady_clock::time_point m_frameStart;
    std::chrono::steady_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25; // Avoids a catch-up spiral after stalls

    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};
    bool m_firstFrame{true};
    bool m_usingSoftwareFrameLimiting{false};
};

} // namespace CurveLights

#endif // TIMESTEP_MANAGER_HPP
