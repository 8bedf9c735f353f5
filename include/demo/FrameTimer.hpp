/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_TIMER_HPP
#define FRAME_TIMER_HPP

#include <chrono>
#include <cstdint>

namespace PyroForge {

/**
 * @brief Variable-delta frame pacing for the demo loop
 *
 * Measures the real delta between frames and, when software limiting is on,
 * sleeps the rest of the frame with SDL_DelayPrecise. The simulation does its
 * own fixed stepping, so only the raw delta is handed out.
 */
class FrameTimer {
public:
    static constexpr double MAX_DELTA_SECONDS = 0.25;

    explicit FrameTimer(float targetFPS = 60.0f);

    /**
     * @brief Marks the start of a frame and measures the delta since the last
     */
    void startFrame();

    /**
     * @brief Sleeps out the rest of the frame when limiting is enabled
     */
    void endFrame() const;

    // Seconds since the previous frame, clamped to MAX_DELTA_SECONDS
    float getDeltaTime() const { return static_cast<float>(m_lastDeltaSeconds); }

    // EMA smoothed frames per second
    float getCurrentFPS() const { return m_currentFPS; }

    float getTargetFPS() const { return m_targetFPS; }
    void setTargetFPS(float fps);

    void setFrameLimiting(bool enabled) { m_limitFrameRate = enabled; }
    bool isFrameLimiting() const { return m_limitFrameRate; }

    void reset();

private:
    void updateFPS(double rawDeltaSeconds);

    float m_targetFPS;
    float m_targetFrameTime;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_lastDeltaSeconds{0.0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f}; // 0.05 = stable, 0.1 = responsive
    bool m_firstFrame{true};
    bool m_limitFrameRate{true};
};

} // namespace PyroForge

#endif // FRAME_TIMER_HPP
