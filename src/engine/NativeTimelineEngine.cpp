/**
 * ************************************************************************
 *
 * @file NativeTimelineEngine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-12
 * @version 0.1
 * @brief 原生时间线播放引擎
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "NativeTimelineEngine.h"
#include <algorithm>
#include <cmath>
#include <fmt/ranges.h>
#include "PropertySampler.h"
#include "Timing.h"
#include "src/common/AttributeNames.h"
#include "src/interpolation/ColorCodec.h"
#include "src/interpolation/Interpolate.h"
#include "src/utils/Logger.h"

namespace animator::engine
{
using interpolation::formatNumber;
using utils::Logger;

namespace
{

std::string formatValue(std::string_view property, const Value& value)
{
    if (const auto* text = std::get_if<std::string>(&value))
    {
        return *text;
    }
    if (std::holds_alternative<std::monostate>(value))
    {
        return {};
    }
    if (isColorProperty(property))
    {
        return interpolation::toRgbaString(valueAsColor(value));
    }
    if (const auto* vec = std::get_if<std::vector<double>>(&value))
    {
        return joinNumbers(*vec, " ");
    }
    const double number = valueAsNumber(value, 0.0);
    return isPercentProperty(property) ? formatNumber(number * 100.0) + "%" : formatNumber(number);
}

double toOffset(double timeMs, double durationMs)
{
    return interpolation::clamp(timeMs / (durationMs > 0.0 ? durationMs : 1.0), 0.0, 1.0);
}

std::optional<std::string> easingString(const model::Keyframe& keyframe)
{
    return keyframe.easing ? std::optional(toCubicBezierString(*keyframe.easing)) : std::nullopt;
}

/**
 * @brief 各变换函数的关键帧时间与缓动是否逐个相同
 */
bool sharesKeyframes(const std::vector<const model::PropertyAnimation*>& transforms)
{
    const auto& reference = transforms.front()->keyframes;
    return std::ranges::all_of(transforms,
                               [&reference](const model::PropertyAnimation* transform)
                               {
                                   const auto& keyframes = transform->keyframes;
                                   if (keyframes.size() != reference.size()) return false;
                                   for (size_t i = 0; i < keyframes.size(); ++i)
                                   {
                                       if (keyframes[i].t != reference[i].t || keyframes[i].easing != reference[i].easing)
                                       {
                                           return false;
                                       }
                                   }
                                   return true;
                               });
}

/**
 * @brief 多个变换函数按关键帧时间的并集逐点采样合成
 * 并集之间各分量都是线性的，合成结果与逐帧采样一致；
 * 带缓动且关键帧不对齐时无法用单条时间线表达，返回 std::nullopt
 */
std::optional<TimelineEffect> composeTransforms(const std::vector<const model::PropertyAnimation*>& transforms,
                                                double durationMs)
{
    TimelineEffect effect{.property = "transform", .keyframes = {}};

    const bool aligned = sharesKeyframes(transforms);
    const bool eased = std::ranges::any_of(transforms,
                                           [](const model::PropertyAnimation* transform)
                                           {
                                               return std::ranges::any_of(transform->keyframes,
                                                                          [](const model::Keyframe& keyframe)
                                                                          { return keyframe.easing.has_value(); });
                                           });
    if (eased && !aligned)
    {
        return std::nullopt;
    }

    if (aligned)
    {
        const auto& reference = transforms.front()->keyframes;
        for (size_t i = 0; i < reference.size(); ++i)
        {
            std::vector<std::string> parts;
            parts.reserve(transforms.size());
            for (const auto* transform : transforms)
            {
                parts.push_back(formatTransform(transform->property, transform->keyframes[i].v));
            }
            effect.keyframes.push_back({
                .offset = toOffset(reference[i].t, durationMs),
                .easing = easingString(reference[i]),
                .value = fmt::format("{}", fmt::join(parts, " ")),
            });
        }
        return effect;
    }

    std::vector<double> times;
    for (const auto* transform : transforms)
    {
        for (const auto& keyframe : transform->keyframes)
        {
            times.push_back(keyframe.t);
        }
    }
    std::ranges::sort(times);
    times.erase(std::unique(times.begin(), times.end()), times.end());

    for (double time : times)
    {
        std::vector<std::string> parts;
        parts.reserve(transforms.size());
        for (const auto* transform : transforms)
        {
            parts.push_back(formatTransform(transform->property, sampleProperty(*transform, time)));
        }
        effect.keyframes.push_back({
            .offset = toOffset(time, durationMs),
            .easing = std::nullopt,
            .value = fmt::format("{}", fmt::join(parts, " ")),
        });
    }
    return effect;
}

} // namespace

std::string toCubicBezierString(const CubicBezierPoints& points)
{
    return "cubic-bezier(" + joinNumbers(std::vector<double>(points.begin(), points.end()), ",") + ")";
}

TimelineTranslation translateAnimation(const model::AnimationDefinition& animation,
                                       double durationMs,
                                       const ITimelinePlatform* platform)
{
    TimelineTranslation result;
    std::vector<const model::PropertyAnimation*> transforms;
    std::optional<std::size_t> transformSlot;

    for (const auto& property : animation)
    {
        if (property.keyframes.empty())
        {
            continue;
        }
        if (property.property == "d")
        {
            result.unsupported.insert("d");
            continue;
        }
        if (isTransformFunction(property.property))
        {
            if (!transformSlot)
            {
                transformSlot = result.effects.size();
                result.effects.push_back({});
            }
            transforms.push_back(&property);
            continue;
        }

        TimelineEffect effect{.property = toAttributeName(property.property), .keyframes = {}};
        for (const auto& keyframe : property.keyframes)
        {
            effect.keyframes.push_back({
                .offset = toOffset(keyframe.t, durationMs),
                .easing = easingString(keyframe),
                .value = formatValue(property.property, keyframe.v),
            });
        }
        result.effects.push_back(std::move(effect));
    }

    if (transformSlot)
    {
        auto composed = composeTransforms(transforms, durationMs);
        if (composed)
        {
            result.effects[*transformSlot] = std::move(*composed);
        }
        else
        {
            result.effects[*transformSlot].property = "transform";
            result.unsupported.insert("transform");
        }
    }

    if (platform != nullptr)
    {
        for (const auto& effect : result.effects)
        {
            const bool supported = std::ranges::all_of(effect.keyframes,
                                                       [&](const TimelineKeyframe& keyframe)
                                                       { return platform->supports(effect.property, keyframe.value); });
            if (!supported)
            {
                result.unsupported.insert(effect.property);
            }
        }
    }
    return result;
}

// ---------------- 引擎 ----------------

NativeTimelineEngine::NativeTimelineEngine(PrivateTag /*tag*/,
                                           const model::PlaybackConfig& config,
                                           std::shared_ptr<ITimelinePlatform> platform,
                                           AnimatorCallbacks callbacks)
    : m_config(config), m_platform(std::move(platform)), m_callbacks(std::move(callbacks))
{
}

NativeTimelineEngine::~NativeTimelineEngine() = default;

std::unique_ptr<NativeTimelineEngine> NativeTimelineEngine::create(const model::NormalizedDocument& document,
                                                                   std::shared_ptr<ITimelinePlatform> platform,
                                                                   AnimatorCallbacks callbacks,
                                                                   bool forceUnsupported)
{
    if (platform == nullptr)
    {
        return nullptr;
    }

    const auto& config = document.config;
    if (document.bindings.empty())
    {
        Logger::warn("NativeTimelineEngine: no animation bindings defined");
    }

    std::vector<std::pair<std::string, TimelineTranslation>> translations;
    std::set<std::string> unsupported;
    for (const auto& binding : document.bindings)
    {
        auto translation = translateAnimation(binding.animation, config.durationMs, platform.get());
        unsupported.insert(translation.unsupported.begin(), translation.unsupported.end());
        translations.emplace_back(binding.targetId, std::move(translation));
    }

    if (!unsupported.empty())
    {
        if (!forceUnsupported)
        {
            Logger::warn("NativeTimelineEngine: unsupported attributes: {}", fmt::join(unsupported, ", "));
            return nullptr;
        }
        Logger::warn("NativeTimelineEngine: dropping unsupported attributes: {}", fmt::join(unsupported, ", "));
    }

    auto engine = std::make_unique<NativeTimelineEngine>(PrivateTag{}, config, std::move(platform), std::move(callbacks));

    const TimingOptions timing{
        .durationMs = config.durationMs,
        .delayMs = config.delayMs > 0.0 ? config.delayMs : 0.0,
        .fill = config.fillMode,
        .direction = config.direction,
        .iterations = config.iterations,
    };

    for (auto& [targetId, translation] : translations)
    {
        for (auto& effect : translation.effects)
        {
            if (translation.unsupported.contains(effect.property) || effect.keyframes.empty())
            {
                continue;
            }
            engine->addAnimation(targetId, std::move(effect), timing);
        }
    }

    // 负延迟：构造后直接跳转到 (-delay) mod duration
    if (config.delayMs < 0.0)
    {
        const double seek = initialTimeFromDelay(config.delayMs, config.durationMs);
        engine->forEachAnimation([seek](ITimelineAnimation& animation) { animation.setCurrentTime(seek); });
    }
    return engine;
}

void NativeTimelineEngine::addAnimation(const std::string& targetId, TimelineEffect effect, const TimingOptions& timing)
{
    auto animation = m_platform->animate(targetId, std::move(effect), timing);
    if (animation == nullptr)
    {
        Logger::warn("NativeTimelineEngine: no element found for id \"{}\"", targetId);
        return;
    }

    const auto entity = m_registry.create();
    animation->setOnFinish([this, entity]() { onAnimationFinished(entity); });
    m_registry.emplace<TargetComponent>(entity, targetId);
    m_registry.emplace<TimelineComponent>(entity, std::move(animation), false);
    m_order.push_back(entity);
}

void NativeTimelineEngine::onAnimationFinished(entt::entity entity)
{
    if (m_destroyed || !m_registry.valid(entity))
    {
        return;
    }
    m_registry.get<TimelineComponent>(entity).finished = true;

    const bool allFinished = std::ranges::all_of(
        m_order, [this](entt::entity each) { return m_registry.get<TimelineComponent>(each).finished; });
    if (allFinished && !m_finishSignaled)
    {
        m_finishSignaled = true;
        invokeCallback(m_callbacks.onFinish);
    }
}

ITimelineAnimation* NativeTimelineEngine::primary() const
{
    if (m_order.empty())
    {
        return nullptr;
    }
    return m_registry.get<TimelineComponent>(m_order.front()).animation.get();
}

bool NativeTimelineEngine::isPlaying() const
{
    const auto* animation = primary();
    return !m_destroyed && animation != nullptr && animation->playState() == PlayState::Running;
}

void NativeTimelineEngine::play()
{
    if (m_destroyed) return;

    forEachAnimation([](ITimelineAnimation& animation) { animation.play(); });
    invokeCallback(m_callbacks.onPlay);
}

void NativeTimelineEngine::pause()
{
    if (m_destroyed) return;

    forEachAnimation([](ITimelineAnimation& animation) { animation.pause(); });
    invokeCallback(m_callbacks.onPause);
}

void NativeTimelineEngine::cancel()
{
    if (m_destroyed) return;

    forEachAnimation([](ITimelineAnimation& animation) { animation.cancel(); });
    m_registry.view<TimelineComponent>().each([](TimelineComponent& timeline) { timeline.finished = false; });
    m_finishSignaled = false;
    invokeCallback(m_callbacks.onCancel);
}

void NativeTimelineEngine::finish()
{
    if (m_destroyed) return;

    // onFinish 由各动画的结束通知汇总后触发
    forEachAnimation([](ITimelineAnimation& animation) { animation.finish(); });
}

void NativeTimelineEngine::setPlaybackRate(double rate)
{
    if (m_destroyed) return;

    if (!std::isfinite(rate) || rate == 0.0)
    {
        Logger::warn("setPlaybackRate: invalid rate {}, expected a finite non-zero number", rate);
        return;
    }
    forEachAnimation([rate](ITimelineAnimation& animation) { animation.setPlaybackRate(rate); });
}

std::optional<double> NativeTimelineEngine::getCurrentTime() const
{
    const auto* animation = primary();
    if (m_destroyed || animation == nullptr)
    {
        return std::nullopt;
    }
    const auto time = animation->currentTime();
    if (!time)
    {
        return std::nullopt;
    }
    // 平台时间包含正延迟，并且可能在两次刷新之间越过终点
    return clampToTimeline(*time - positiveDelay(), m_config.totalDurationMs());
}

void NativeTimelineEngine::setCurrentTime(double timeMs)
{
    if (m_destroyed) return;

    const double time = clampToTimeline(timeMs, m_config.totalDurationMs()) + positiveDelay();
    forEachAnimation([time](ITimelineAnimation& animation) { animation.setCurrentTime(time); });
}

double NativeTimelineEngine::positiveDelay() const
{
    return m_config.delayMs > 0.0 ? m_config.delayMs : 0.0;
}

void NativeTimelineEngine::destroy()
{
    if (m_destroyed) return;

    cancel();
    m_destroyed = true;
    m_order.clear();
    m_registry.clear();
}

} // namespace animator::engine
