/**
 * ************************************************************************
 *
 * @file FrameLoopEngine.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-11
 * @version 0.1
 * @brief 帧循环播放引擎
    由墙钟时间驱动，每帧采样全部绑定并通过适配器写出属性
    状态：Idle -> Playing <-> Paused -> Finished，cancel 回到 Idle
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <entt/entt.hpp>
#include <memory>
#include <optional>
#include "Components.h"
#include "IAnimationEngine.h"
#include "IFrameScheduler.h"
#include "IPlatformAdapter.h"
#include "src/model/Document.h"

namespace animator::engine
{

/**
 * @brief 播放状态，只由所属引擎修改
 */
struct PlaybackState
{
    double accumulatedMs = 0.0;               // 当前运行段之前累积的时间
    std::optional<double> runStartWallClock;  // 当前运行段开始的墙钟时间
    double playbackRate = 1.0;
    bool isPlaying = false;
    bool finishSignaled = false;
};

class FrameLoopEngine final : public IAnimationEngine
{
public:
    FrameLoopEngine(model::NormalizedDocument document,
                    std::shared_ptr<IPlatformAdapter> adapter,
                    std::shared_ptr<IFrameScheduler> scheduler,
                    AnimatorCallbacks callbacks = {});
    ~FrameLoopEngine() override;

    [[nodiscard]] bool isReady() const override { return !m_destroyed; }
    [[nodiscard]] bool isPlaying() const override;

    void play() override;
    void pause() override;
    void cancel() override;
    void finish() override;
    void setPlaybackRate(double rate) override;
    [[nodiscard]] std::optional<double> getCurrentTime() const override;
    void setCurrentTime(double timeMs) override;
    void destroy() override;

    [[nodiscard]] const PlaybackState& state() const { return m_state; }
    [[nodiscard]] const model::PlaybackConfig& config() const { return m_config; }
    [[nodiscard]] std::size_t bindingCount() const;

private:
    [[nodiscard]] double currentTime() const;
    [[nodiscard]] bool isActive() const;

    void renderFrame(double timeMs);
    void tick();
    void loop(bool first);
    void cancelPendingFrame();

    /**
     * @brief 停止当前运行段，时间累积到 accumulatedMs
     * @param render 是否在停止后渲染一帧
     */
    void stopRun(bool render);

    model::PlaybackConfig m_config;
    double m_totalDurationMs;
    double m_minFrameIntervalMs = 0.0;
    std::optional<double> m_lastRenderWallClock;

    std::shared_ptr<IPlatformAdapter> m_adapter;
    std::shared_ptr<IFrameScheduler> m_scheduler;
    AnimatorCallbacks m_callbacks;

    entt::registry m_registry;
    PlaybackState m_state;
    std::optional<FrameHandle> m_pendingFrame;
    bool m_destroyed = false;
};

} // namespace animator::engine
