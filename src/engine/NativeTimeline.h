/**
 * ************************************************************************
 *
 * @file NativeTimeline.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-12
 * @version 0.1
 * @brief 原生时间线原语
    平台提供的关键帧动画能力：给定目标、关键帧和计时参数，返回可控制的动画对象
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "src/model/Document.h"

namespace animator::engine
{

struct TimelineKeyframe
{
    double offset = 0.0;               // [0, 1]
    std::optional<std::string> easing; // "cubic-bezier(a,b,c,d)"，作用于到下一关键帧的区间
    std::string value;

    bool operator==(const TimelineKeyframe&) const = default;
};

/**
 * @brief 单个属性的关键帧效果
 */
struct TimelineEffect
{
    std::string property;
    std::vector<TimelineKeyframe> keyframes;
};

struct TimingOptions
{
    double durationMs = model::DEFAULT_DURATION_MS;
    double delayMs = 0.0; // 只接受非负延迟
    model::FillMode fill = model::FillMode::None;
    model::Direction direction = model::Direction::Normal;
    double iterations = 1.0;
};

enum class PlayState : std::uint8_t
{
    Idle,
    Running,
    Paused,
    Finished
};

class ITimelineAnimation
{
public:
    ITimelineAnimation() = default;
    ITimelineAnimation(const ITimelineAnimation&) = delete;
    ITimelineAnimation& operator=(const ITimelineAnimation&) = delete;
    ITimelineAnimation(ITimelineAnimation&&) = delete;
    ITimelineAnimation& operator=(ITimelineAnimation&&) = delete;
    virtual ~ITimelineAnimation() = default;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void cancel() = 0;
    virtual void finish() = 0;
    virtual void setCurrentTime(double timeMs) = 0;
    [[nodiscard]] virtual std::optional<double> currentTime() const = 0;
    virtual void setPlaybackRate(double rate) = 0;
    [[nodiscard]] virtual PlayState playState() const = 0;

    /**
     * @brief 动画自然结束或调用 finish() 时触发
     */
    virtual void setOnFinish(std::function<void()> handler) = 0;
};

class ITimelinePlatform
{
public:
    ITimelinePlatform() = default;
    ITimelinePlatform(const ITimelinePlatform&) = delete;
    ITimelinePlatform& operator=(const ITimelinePlatform&) = delete;
    ITimelinePlatform(ITimelinePlatform&&) = delete;
    ITimelinePlatform& operator=(ITimelinePlatform&&) = delete;
    virtual ~ITimelinePlatform() = default;

    /**
     * @brief 能力探测：该属性值能否交给原生时间线
     */
    [[nodiscard]] virtual bool supports(const std::string& property, const std::string& value) const = 0;

    /**
     * @brief 创建并开始托管一个动画，创建后处于 Idle 状态
     * @return 目标不存在时返回 nullptr
     */
    [[nodiscard]] virtual std::unique_ptr<ITimelineAnimation> animate(const std::string& targetId,
                                                                      TimelineEffect effect,
                                                                      const TimingOptions& timing) = 0;
};

} // namespace animator::engine
