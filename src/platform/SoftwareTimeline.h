/**
 * ************************************************************************
 *
 * @file SoftwareTimeline.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-13
 * @version 0.1
 * @brief 进程内的合成器时间线
    按 Web Animations 的计时模型（开始时间/保持时间、速率、延迟、迭代、方向、填充）驱动关键帧，
    CSS 值字符串按数字模板插值，结果通过适配器写出
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "src/engine/IFrameScheduler.h"
#include "src/engine/IPlatformAdapter.h"
#include "src/engine/NativeTimeline.h"

namespace animator::platform
{

/**
 * @brief 数字模板：文本片段与数值交替，texts.size() == numbers.size() + 1
 */
struct NumericTemplate
{
    std::vector<std::string> texts;
    std::vector<double> numbers;
};

[[nodiscard]] NumericTemplate parseNumericTemplate(std::string_view value);

/**
 * @brief 插值两个 CSS 值字符串
 * 模板一致时逐个数值插值，否则按 0.5 处离散切换
 */
[[nodiscard]] std::string interpolateCssValue(std::string_view from, std::string_view to, double t);

/**
 * @brief 解析 "cubic-bezier(...)" 或关键字缓动，无法识别时返回 std::nullopt（线性）
 */
[[nodiscard]] std::optional<CubicBezierPoints> parseCssEasing(std::string_view easing);

class SoftwareTimelineAnimation final : public engine::ITimelineAnimation
{
public:
    SoftwareTimelineAnimation(std::string targetId,
                              engine::TimelineEffect effect,
                              const engine::TimingOptions& timing,
                              std::shared_ptr<engine::IPlatformAdapter> adapter,
                              std::shared_ptr<engine::IFrameScheduler> scheduler);
    ~SoftwareTimelineAnimation() override;

    void play() override;
    void pause() override;
    void cancel() override;
    void finish() override;
    void setCurrentTime(double timeMs) override;
    [[nodiscard]] std::optional<double> currentTime() const override;
    void setPlaybackRate(double rate) override;
    [[nodiscard]] engine::PlayState playState() const override { return m_playState; }
    void setOnFinish(std::function<void()> handler) override { m_onFinish = std::move(handler); }

    /**
     * @brief 给定本地时间的属性值，处于无效果区间（延迟前/结束后且未填充）时返回 std::nullopt
     */
    [[nodiscard]] std::optional<std::string> sample(double localTimeMs) const;

    [[nodiscard]] double endTime() const;

private:
    /**
     * @brief 计算迭代进度（已应用方向），无效果时返回 std::nullopt
     */
    [[nodiscard]] std::optional<double> iterationProgress(double localTimeMs) const;
    [[nodiscard]] std::string valueAtProgress(double progress) const;

    void apply();
    void write(const std::string& value);
    void tick();
    void schedule();
    void cancelFrame();
    void settle(double holdTime);

    std::string m_targetId;
    engine::TimelineEffect m_effect;
    engine::TimingOptions m_timing;
    std::shared_ptr<engine::IPlatformAdapter> m_adapter;
    std::shared_ptr<engine::IFrameScheduler> m_scheduler;

    std::optional<double> m_startTime;
    std::optional<double> m_holdTime;
    double m_playbackRate = 1.0;
    engine::PlayState m_playState = engine::PlayState::Idle;
    std::optional<engine::FrameHandle> m_pendingFrame;
    std::function<void()> m_onFinish;
};

struct SoftwareTimelineOptions
{
    std::set<std::string> unsupportedProperties{"d"};
    std::function<bool(const std::string&)> hasTarget; // 为空时认为所有目标都存在
};

class SoftwareTimelinePlatform final : public engine::ITimelinePlatform
{
public:
    SoftwareTimelinePlatform(std::shared_ptr<engine::IPlatformAdapter> adapter,
                             std::shared_ptr<engine::IFrameScheduler> scheduler,
                             SoftwareTimelineOptions options = {});

    [[nodiscard]] bool supports(const std::string& property, const std::string& value) const override;

    [[nodiscard]] std::unique_ptr<engine::ITimelineAnimation> animate(const std::string& targetId,
                                                                      engine::TimelineEffect effect,
                                                                      const engine::TimingOptions& timing) override;

private:
    std::shared_ptr<engine::IPlatformAdapter> m_adapter;
    std::shared_ptr<engine::IFrameScheduler> m_scheduler;
    SoftwareTimelineOptions m_options;
};

} // namespace animator::platform
