/**
 * ************************************************************************
 *
 * @file FrameLoopEngine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-11
 * @version 0.1
 * @brief 帧循环播放引擎
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "FrameLoopEngine.h"
#include <cmath>
#include "PropertySampler.h"
#include "Timing.h"
#include "src/utils/Logger.h"

namespace animator::engine
{
using utils::Logger;

FrameLoopEngine::FrameLoopEngine(model::NormalizedDocument document,
                                 std::shared_ptr<IPlatformAdapter> adapter,
                                 std::shared_ptr<IFrameScheduler> scheduler,
                                 AnimatorCallbacks callbacks)
    : m_config(std::move(document.config)),
      m_totalDurationMs(m_config.totalDurationMs()),
      m_adapter(std::move(adapter)),
      m_scheduler(std::move(scheduler)),
      m_callbacks(std::move(callbacks))
{
    for (auto& binding : document.bindings)
    {
        const auto entity = m_registry.create();
        m_registry.emplace<TargetComponent>(entity, std::move(binding.targetId));
        m_registry.emplace<TrackComponent>(entity, std::move(binding.animation));
    }

    if (m_config.frameRateCapHz && *m_config.frameRateCapHz > 0.0)
    {
        m_minFrameIntervalMs = 1000.0 / *m_config.frameRateCapHz;
    }

    m_state.accumulatedMs = initialTimeFromDelay(m_config.delayMs, m_config.durationMs);
    if (m_config.delayMs != 0.0)
    {
        renderFrame(currentTime());
    }
}

FrameLoopEngine::~FrameLoopEngine()
{
    cancelPendingFrame();
}

std::size_t FrameLoopEngine::bindingCount() const
{
    return m_registry.view<const TargetComponent>().size();
}

// ---------------- 时间 ----------------

double FrameLoopEngine::currentTime() const
{
    double running = 0.0;
    if (m_state.runStartWallClock)
    {
        running = (m_scheduler->now() - *m_state.runStartWallClock) * m_state.playbackRate;
    }
    return clampToTimeline(m_state.accumulatedMs + running, m_totalDurationMs);
}

bool FrameLoopEngine::isActive() const
{
    if (m_destroyed || !m_state.isPlaying || !m_adapter->isConnected())
    {
        return false;
    }
    return !std::isfinite(m_totalDurationMs) || currentTime() < m_totalDurationMs;
}

bool FrameLoopEngine::isPlaying() const
{
    return isActive();
}

std::optional<double> FrameLoopEngine::getCurrentTime() const
{
    if (m_destroyed)
    {
        return std::nullopt;
    }
    return currentTime();
}

// ---------------- 渲染 ----------------

void FrameLoopEngine::renderFrame(double timeMs)
{
    const double progress =
        computeEffectiveProgress(timeMs, m_config.durationMs, m_config.iterations, m_config.direction);
    const double sampleTime = progress * m_config.durationMs;

    m_registry.view<const TargetComponent, const TrackComponent>().each(
        [this, sampleTime](const TargetComponent& target, const TrackComponent& track)
        {
            for (const auto& write : sampleAnimation(track.animation, sampleTime))
            {
                m_adapter->setAttribute(target.id, write.name, write.value);
            }
        });
}

void FrameLoopEngine::tick()
{
    // 渲染面已卸载：隐式暂停，不触发 onPause
    if (!m_adapter->isConnected())
    {
        stopRun(false);
        return;
    }

    const double time = currentTime();

    if (std::isfinite(m_totalDurationMs) && time >= m_totalDurationMs)
    {
        renderFrame(m_totalDurationMs);
        stopRun(false);
        if (!m_state.finishSignaled)
        {
            m_state.finishSignaled = true;
            invokeCallback(m_callbacks.onFinish);
        }
        return;
    }

    if (m_minFrameIntervalMs > 0.0)
    {
        const double wallClock = m_scheduler->now();
        if (m_lastRenderWallClock && wallClock - *m_lastRenderWallClock < m_minFrameIntervalMs)
        {
            return;
        }
        m_lastRenderWallClock = wallClock;
    }

    renderFrame(time);
}

void FrameLoopEngine::loop(bool first)
{
    cancelPendingFrame();
    if (!first && !isActive())
    {
        return;
    }

    m_pendingFrame = m_scheduler->requestFrame(
        [this]()
        {
            m_pendingFrame.reset();
            tick();
            loop(false);
        });
}

void FrameLoopEngine::cancelPendingFrame()
{
    if (m_pendingFrame)
    {
        m_scheduler->cancelFrame(*m_pendingFrame);
        m_pendingFrame.reset();
    }
}

void FrameLoopEngine::stopRun(bool render)
{
    if (!m_state.isPlaying)
    {
        return;
    }
    m_state.accumulatedMs = currentTime();
    m_state.runStartWallClock.reset();
    m_state.isPlaying = false;
    cancelPendingFrame();
    if (render)
    {
        renderFrame(m_state.accumulatedMs);
    }
}

// ---------------- 控制 ----------------

void FrameLoopEngine::play()
{
    if (m_destroyed) return;

    if (!m_state.isPlaying)
    {
        m_state.isPlaying = true;
        m_state.runStartWallClock = m_scheduler->now();
        m_lastRenderWallClock.reset();
        loop(true);
    }
    invokeCallback(m_callbacks.onPlay);
}

void FrameLoopEngine::pause()
{
    if (m_destroyed) return;

    stopRun(true);
    invokeCallback(m_callbacks.onPause);
}

void FrameLoopEngine::cancel()
{
    if (m_destroyed) return;

    stopRun(false);
    m_state.accumulatedMs = 0.0;
    m_state.runStartWallClock.reset();
    m_state.finishSignaled = false;
    renderFrame(0.0);
    invokeCallback(m_callbacks.onCancel);
}

void FrameLoopEngine::finish()
{
    if (m_destroyed) return;

    // 无限循环没有终点，停在当前时间
    const double target = std::isfinite(m_totalDurationMs) ? m_totalDurationMs : currentTime();
    m_state.accumulatedMs = target;
    m_state.runStartWallClock.reset();
    m_state.isPlaying = false;
    cancelPendingFrame();
    renderFrame(target);

    if (!m_state.finishSignaled)
    {
        m_state.finishSignaled = true;
        invokeCallback(m_callbacks.onFinish);
    }
}

void FrameLoopEngine::setPlaybackRate(double rate)
{
    if (m_destroyed) return;

    if (!std::isfinite(rate) || rate == 0.0)
    {
        Logger::warn("setPlaybackRate: invalid rate {}, expected a finite non-zero number", rate);
        return;
    }

    const double time = currentTime();
    m_state.playbackRate = rate;
    m_state.accumulatedMs = time;
    if (m_state.isPlaying)
    {
        m_state.runStartWallClock = m_scheduler->now();
    }
}

void FrameLoopEngine::setCurrentTime(double timeMs)
{
    if (m_destroyed) return;

    m_state.accumulatedMs = clampToTimeline(timeMs, m_totalDurationMs);
    if (m_state.isPlaying)
    {
        m_state.runStartWallClock = m_scheduler->now();
    }
    renderFrame(currentTime());
}

void FrameLoopEngine::destroy()
{
    if (m_destroyed) return;

    cancel();
    cancelPendingFrame();
    m_registry.clear();
    m_destroyed = true;
}

} // namespace animator::engine
