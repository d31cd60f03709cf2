/**
 * ************************************************************************
 *
 * @file NativeTimelineEngine.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-12
 * @version 0.1
 * @brief 原生时间线播放引擎
    把规范化后的绑定翻译为时间线关键帧，交给平台合成器执行
    存在平台不支持的属性时返回 nullptr，由外观层回退到帧循环
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <entt/entt.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "Components.h"
#include "IAnimationEngine.h"
#include "NativeTimeline.h"
#include "src/model/Document.h"

namespace animator::engine
{

/**
 * @brief 翻译结果
 */
struct TimelineTranslation
{
    std::vector<TimelineEffect> effects;
    std::set<std::string> unsupported; // 平台无法处理的属性
};

/**
 * @brief 把一个动画定义翻译为时间线效果
 * 偏移量 = t / duration 并约束到 [0, 1]；变换函数合并到同一个 transform 效果；d 属性始终不支持
 * @param platform 为空时跳过能力探测
 */
[[nodiscard]] TimelineTranslation translateAnimation(const model::AnimationDefinition& animation,
                                                     double durationMs,
                                                     const ITimelinePlatform* platform);

/**
 * @brief 缓动控制点转为 "cubic-bezier(a,b,c,d)"
 */
[[nodiscard]] std::string toCubicBezierString(const CubicBezierPoints& points);

class NativeTimelineEngine final : public IAnimationEngine
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief 创建引擎
     * @param forceUnsupported 为 true 时丢弃不支持的效果继续创建
     * @return 存在不支持的属性且未强制时返回 nullptr
     */
    [[nodiscard]] static std::unique_ptr<NativeTimelineEngine> create(const model::NormalizedDocument& document,
                                                                      std::shared_ptr<ITimelinePlatform> platform,
                                                                      AnimatorCallbacks callbacks,
                                                                      bool forceUnsupported);

    /**
     * @brief 仅供 create 使用
     */
    NativeTimelineEngine(PrivateTag tag,
                         const model::PlaybackConfig& config,
                         std::shared_ptr<ITimelinePlatform> platform,
                         AnimatorCallbacks callbacks);
    ~NativeTimelineEngine() override;

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

    [[nodiscard]] std::size_t animationCount() const { return m_order.size(); }

private:
    void addAnimation(const std::string& targetId, TimelineEffect effect, const TimingOptions& timing);
    void onAnimationFinished(entt::entity entity);

    [[nodiscard]] ITimelineAnimation* primary() const;
    [[nodiscard]] double positiveDelay() const;

    template <typename Func>
    void forEachAnimation(Func&& func)
    {
        m_registry.view<TimelineComponent>().each([&func](TimelineComponent& timeline) { func(*timeline.animation); });
    }

    model::PlaybackConfig m_config;
    std::shared_ptr<ITimelinePlatform> m_platform;
    AnimatorCallbacks m_callbacks;

    entt::registry m_registry;
    std::vector<entt::entity> m_order; // 创建顺序，首个动画作为时间基准
    bool m_finishSignaled = false;
    bool m_destroyed = false;
};

} // namespace animator::engine
