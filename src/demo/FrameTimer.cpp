/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "demo/FrameTimer.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace PyroForge {

FrameTimer::FrameTimer(float targetFPS)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
{
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void FrameTimer::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        m_lastDeltaSeconds = 0.0;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    double deltaTime = static_cast<double>(deltaTimeNs.count()) / 1e9;
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    updateFPS(deltaTime);

    // A debugger break or window drag must not dump seconds into the simulation
    m_lastDeltaSeconds = std::min(deltaTime, MAX_DELTA_SECONDS);
}

void FrameTimer::endFrame() const {
    if (!m_limitFrameRate) {
        return;
    }

    int64_t targetFrameNs = static_cast<int64_t>(m_targetFrameTime * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

void FrameTimer::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void FrameTimer::reset() {
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_lastDeltaSeconds = 0.0;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void FrameTimer::updateFPS(double rawDeltaSeconds) {
    if (rawDeltaSeconds > 0.0) {
        float instantFPS = static_cast<float>(1.0 / rawDeltaSeconds);
        instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

} // namespace PyroForge
