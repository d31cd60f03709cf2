/**
 * ************************************************************************
 *
 * @file FakeTimelinePlatform.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-20
 * @version 0.1
 * @brief 模拟原生时间线（用于单元测试）
    动画只记录状态，不推进时间，由测试调用 complete() 模拟自然结束
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once
#include "src/engine/NativeTimeline.h"
#include <cmath>
#include <set>
#include <string>
#include <vector>

class FakeTimelineAnimation : public animator::engine::ITimelineAnimation
{
public:
    FakeTimelineAnimation(std::string targetId,
                          animator::engine::TimelineEffect effect,
                          const animator::engine::TimingOptions& timing)
        : m_targetId(std::move(targetId)), m_effect(std::move(effect)), m_timing(timing)
    {
    }

    void play() override
    {
        if (m_state != animator::engine::PlayState::Running && m_state != animator::engine::PlayState::Paused)
        {
            m_time = 0.0;
        }
        m_state = animator::engine::PlayState::Running;
    }

    void pause() override { m_state = animator::engine::PlayState::Paused; }

    void cancel() override
    {
        m_state = animator::engine::PlayState::Idle;
        m_time = 0.0;
    }

    void finish() override
    {
        if (std::isinf(m_timing.iterations)) return;
        m_time = m_timing.delayMs + (m_timing.durationMs * m_timing.iterations);
        complete();
    }

    void setCurrentTime(double timeMs) override { m_time = timeMs; }
    [[nodiscard]] std::optional<double> currentTime() const override { return m_time; }
    void setPlaybackRate(double rate) override { m_rate = rate; }
    [[nodiscard]] animator::engine::PlayState playState() const override { return m_state; }
    void setOnFinish(std::function<void()> handler) override { m_onFinish = std::move(handler); }

    // 测试辅助方法
    void complete()
    {
        m_state = animator::engine::PlayState::Finished;
        if (m_onFinish) m_onFinish();
    }

    [[nodiscard]] const std::string& targetId() const { return m_targetId; }
    [[nodiscard]] const animator::engine::TimelineEffect& effect() const { return m_effect; }
    [[nodiscard]] const animator::engine::TimingOptions& timing() const { return m_timing; }
    [[nodiscard]] double rate() const { return m_rate; }

private:
    std::string m_targetId;
    animator::engine::TimelineEffect m_effect;
    animator::engine::TimingOptions m_timing;
    animator::engine::PlayState m_state = animator::engine::PlayState::Idle;
    double m_time = 0.0;
    double m_rate = 1.0;
    std::function<void()> m_onFinish;
};

class FakeTimelinePlatform : public animator::engine::ITimelinePlatform
{
public:
    [[nodiscard]] bool supports(const std::string& property, const std::string& value) const override
    {
        return !value.empty() && !m_unsupported.contains(property);
    }

    [[nodiscard]] std::unique_ptr<animator::engine::ITimelineAnimation> animate(
        const std::string& targetId,
        animator::engine::TimelineEffect effect,
        const animator::engine::TimingOptions& timing) override
    {
        if (m_missingTargets.contains(targetId)) return nullptr;
        auto animation = std::make_unique<FakeTimelineAnimation>(targetId, std::move(effect), timing);
        m_created.push_back(animation.get());
        return animation;
    }

    // 测试辅助方法
    void markUnsupported(const std::string& property) { m_unsupported.insert(property); }
    void markMissing(const std::string& targetId) { m_missingTargets.insert(targetId); }

    /**
     * @brief 已创建的动画，只在所属引擎存活期间有效
     */
    [[nodiscard]] const std::vector<FakeTimelineAnimation*>& created() const { return m_created; }

private:
    std::set<std::string> m_unsupported;
    std::set<std::string> m_missingTargets;
    std::vector<FakeTimelineAnimation*> m_created;
};
