/**
 * ************************************************************************
 *
 * @file SoftwareTimeline.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-13
 * @version 0.1
 * @brief 进程内的合成器时间线
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "SoftwareTimeline.h"
#include <cctype>
#include <charconv>
#include <cmath>
#include "src/engine/Timing.h"
#include "src/interpolation/CubicBezier.h"
#include "src/interpolation/Interpolate.h"
#include "src/utils/Logger.h"

namespace animator::platform
{
using engine::PlayState;
using utils::Logger;
using namespace animator::interpolation;

namespace
{

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief 数值起点：数字、.数字、符号后接数字，且不处于标识符或十六进制颜色内部
 */
bool startsNumber(std::string_view text, std::size_t pos)
{
    if (pos > 0)
    {
        const char prev = text[pos - 1];
        if (std::isalnum(static_cast<unsigned char>(prev)) != 0 || prev == '#' || prev == '_')
        {
            return false;
        }
    }

    const char c = text[pos];
    if (isDigit(c))
    {
        return true;
    }
    const auto digitAt = [&](std::size_t i) { return i < text.size() && isDigit(text[i]); };
    if (c == '.')
    {
        return digitAt(pos + 1);
    }
    if (c == '-' || c == '+')
    {
        return digitAt(pos + 1) || (pos + 1 < text.size() && text[pos + 1] == '.' && digitAt(pos + 2));
    }
    return false;
}

} // namespace

NumericTemplate parseNumericTemplate(std::string_view value)
{
    NumericTemplate result;
    std::string text;
    std::size_t pos = 0;

    while (pos < value.size())
    {
        if (startsNumber(value, pos))
        {
            std::size_t begin = pos;
            if (value[begin] == '+')
            {
                ++begin;
            }
            double number = 0.0;
            const auto [ptr, ec] = std::from_chars(value.data() + begin, value.data() + value.size(), number);
            if (ec == std::errc{})
            {
                result.texts.push_back(std::move(text));
                text.clear();
                result.numbers.push_back(number);
                pos = static_cast<std::size_t>(ptr - value.data());
                continue;
            }
        }
        text.push_back(value[pos]);
        ++pos;
    }
    result.texts.push_back(std::move(text));
    return result;
}

std::string interpolateCssValue(std::string_view from, std::string_view to, double t)
{
    const auto a = parseNumericTemplate(from);
    const auto b = parseNumericTemplate(to);

    if (a.texts != b.texts || a.numbers.empty())
    {
        return std::string(t < 0.5 ? from : to);
    }

    std::string result = a.texts.front();
    for (std::size_t i = 0; i < a.numbers.size(); ++i)
    {
        result += formatNumber(interpolateScalar(a.numbers[i], b.numbers[i], t));
        result += a.texts[i + 1];
    }
    return result;
}

std::optional<CubicBezierPoints> parseCssEasing(std::string_view easing)
{
    if (easing.starts_with("cubic-bezier("))
    {
        const auto parsed = parseNumericTemplate(easing);
        if (parsed.numbers.size() == 4)
        {
            return CubicBezierPoints{parsed.numbers[0], parsed.numbers[1], parsed.numbers[2], parsed.numbers[3]};
        }
        return std::nullopt;
    }
    return namedEasing(easing);
}

// ---------------- SoftwareTimelineAnimation ----------------

SoftwareTimelineAnimation::SoftwareTimelineAnimation(std::string targetId,
                                                     engine::TimelineEffect effect,
                                                     const engine::TimingOptions& timing,
                                                     std::shared_ptr<engine::IPlatformAdapter> adapter,
                                                     std::shared_ptr<engine::IFrameScheduler> scheduler)
    : m_targetId(std::move(targetId)),
      m_effect(std::move(effect)),
      m_timing(timing),
      m_adapter(std::move(adapter)),
      m_scheduler(std::move(scheduler))
{
}

SoftwareTimelineAnimation::~SoftwareTimelineAnimation()
{
    cancelFrame();
}

double SoftwareTimelineAnimation::endTime() const
{
    return m_timing.delayMs + m_timing.durationMs * m_timing.iterations;
}

std::optional<double> SoftwareTimelineAnimation::currentTime() const
{
    if (m_holdTime)
    {
        return m_holdTime;
    }
    if (m_startTime)
    {
        return (m_scheduler->now() - *m_startTime) * m_playbackRate;
    }
    return std::nullopt;
}

std::optional<double> SoftwareTimelineAnimation::iterationProgress(double localTimeMs) const
{
    using model::FillMode;

    const double duration = m_timing.durationMs;
    const double activeDuration = duration * m_timing.iterations;
    const bool fillBackwards = m_timing.fill == FillMode::Backwards || m_timing.fill == FillMode::Both;
    const bool fillForwards = m_timing.fill == FillMode::Forwards || m_timing.fill == FillMode::Both;

    double activeTime = 0.0;
    if (localTimeMs < m_timing.delayMs)
    {
        if (!fillBackwards)
        {
            return std::nullopt;
        }
    }
    else if (std::isfinite(activeDuration) && localTimeMs >= m_timing.delayMs + activeDuration)
    {
        if (!fillForwards)
        {
            return std::nullopt;
        }
        activeTime = activeDuration;
    }
    else
    {
        activeTime = localTimeMs - m_timing.delayMs;
    }

    if (duration <= 0.0)
    {
        return std::nullopt;
    }

    const double overall = activeTime / duration;
    double index = std::floor(overall);
    double simple = overall - index;
    // 活动区间末尾停在最后一次迭代的 1.0 处
    if (simple == 0.0 && activeTime > 0.0 && activeTime == activeDuration)
    {
        simple = 1.0;
        index -= 1.0;
    }

    const bool odd = std::fmod(index, 2.0) == 1.0;
    switch (m_timing.direction)
    {
        case model::Direction::Normal:
            return simple;
        case model::Direction::Reverse:
            return 1.0 - simple;
        case model::Direction::Alternate:
            return odd ? 1.0 - simple : simple;
        case model::Direction::AlternateReverse:
            return odd ? simple : 1.0 - simple;
    }
    return simple;
}

std::string SoftwareTimelineAnimation::valueAtProgress(double progress) const
{
    const auto& keyframes = m_effect.keyframes;
    if (keyframes.empty())
    {
        return {};
    }
    if (progress <= keyframes.front().offset)
    {
        return keyframes.front().value;
    }
    if (progress >= keyframes.back().offset)
    {
        return keyframes.back().value;
    }

    for (std::size_t i = 0; i + 1 < keyframes.size(); ++i)
    {
        const auto& from = keyframes[i];
        const auto& to = keyframes[i + 1];
        if (progress < from.offset || progress > to.offset)
        {
            continue;
        }
        double local = to.offset > from.offset ? (progress - from.offset) / (to.offset - from.offset) : 1.0;
        if (from.easing)
        {
            if (const auto points = parseCssEasing(*from.easing))
            {
                local = solveCubicBezierEasing(*points, local);
            }
        }
        return interpolateCssValue(from.value, to.value, local);
    }
    return keyframes.back().value;
}

std::optional<std::string> SoftwareTimelineAnimation::sample(double localTimeMs) const
{
    const auto progress = iterationProgress(localTimeMs);
    if (!progress)
    {
        return std::nullopt;
    }
    return valueAtProgress(*progress);
}

void SoftwareTimelineAnimation::write(const std::string& value)
{
    if (m_adapter != nullptr)
    {
        m_adapter->setAttribute(m_targetId, m_effect.property, value);
    }
}

void SoftwareTimelineAnimation::apply()
{
    const auto time = currentTime();
    if (!time)
    {
        return;
    }
    if (auto value = sample(*time))
    {
        write(*value);
    }
}

void SoftwareTimelineAnimation::schedule()
{
    cancelFrame();
    m_pendingFrame = m_scheduler->requestFrame(
        [this]()
        {
            m_pendingFrame.reset();
            tick();
        });
}

void SoftwareTimelineAnimation::cancelFrame()
{
    if (m_pendingFrame)
    {
        m_scheduler->cancelFrame(*m_pendingFrame);
        m_pendingFrame.reset();
    }
}

void SoftwareTimelineAnimation::settle(double holdTime)
{
    m_holdTime = holdTime;
    m_startTime.reset();
    m_playState = PlayState::Finished;
    cancelFrame();
    apply();
    if (m_onFinish)
    {
        m_onFinish();
    }
}

void SoftwareTimelineAnimation::tick()
{
    const auto time = currentTime();
    if (!time || m_playState != PlayState::Running)
    {
        return;
    }

    const double end = endTime();
    if (m_playbackRate > 0.0 && std::isfinite(end) && *time >= end)
    {
        settle(end);
        return;
    }
    if (m_playbackRate < 0.0 && *time <= 0.0)
    {
        settle(0.0);
        return;
    }

    apply();
    schedule();
}

void SoftwareTimelineAnimation::play()
{
    const auto time = currentTime();
    const double end = endTime();

    double seek = time.value_or(0.0);
    if (m_playbackRate > 0.0 && (!time || *time < 0.0 || (std::isfinite(end) && *time >= end)))
    {
        seek = 0.0;
    }
    else if (m_playbackRate < 0.0 && (!time || *time <= 0.0 || *time > end))
    {
        if (!std::isfinite(end))
        {
            Logger::warn("SoftwareTimeline: cannot play an infinite animation in reverse from its end");
            return;
        }
        seek = end;
    }

    m_holdTime.reset();
    m_startTime = m_scheduler->now() - seek / m_playbackRate;
    m_playState = PlayState::Running;
    apply();
    schedule();
}

void SoftwareTimelineAnimation::pause()
{
    const auto time = currentTime();
    m_holdTime = time.value_or(m_playbackRate < 0.0 && std::isfinite(endTime()) ? endTime() : 0.0);
    m_startTime.reset();
    m_playState = PlayState::Paused;
    cancelFrame();
    apply();
}

void SoftwareTimelineAnimation::cancel()
{
    m_holdTime.reset();
    m_startTime.reset();
    m_playState = PlayState::Idle;
    cancelFrame();

    // 恢复到时间 0 对应的关键帧值
    const double progress = engine::computeEffectiveProgress(
        0.0, m_timing.durationMs, m_timing.iterations, m_timing.direction);
    if (!m_effect.keyframes.empty())
    {
        write(valueAtProgress(progress));
    }
}

void SoftwareTimelineAnimation::finish()
{
    const double end = endTime();
    if (m_playbackRate > 0.0 && !std::isfinite(end))
    {
        Logger::warn("SoftwareTimeline: cannot finish an animation with infinite iterations");
        return;
    }
    settle(m_playbackRate > 0.0 ? end : 0.0);
}

void SoftwareTimelineAnimation::setCurrentTime(double timeMs)
{
    if (m_playState == PlayState::Running && m_startTime)
    {
        m_startTime = m_scheduler->now() - timeMs / m_playbackRate;
    }
    else
    {
        m_holdTime = timeMs;
        m_startTime.reset();
        if (m_playState == PlayState::Idle || m_playState == PlayState::Finished)
        {
            m_playState = PlayState::Paused;
        }
    }
    apply();
}

void SoftwareTimelineAnimation::setPlaybackRate(double rate)
{
    const auto time = currentTime();
    m_playbackRate = rate;
    if (m_startTime && time)
    {
        m_startTime = m_scheduler->now() - *time / rate;
    }
}

// ---------------- SoftwareTimelinePlatform ----------------

SoftwareTimelinePlatform::SoftwareTimelinePlatform(std::shared_ptr<engine::IPlatformAdapter> adapter,
                                                   std::shared_ptr<engine::IFrameScheduler> scheduler,
                                                   SoftwareTimelineOptions options)
    : m_adapter(std::move(adapter)), m_scheduler(std::move(scheduler)), m_options(std::move(options))
{
}

bool SoftwareTimelinePlatform::supports(const std::string& property, const std::string& value) const
{
    return !value.empty() && !m_options.unsupportedProperties.contains(property);
}

std::unique_ptr<engine::ITimelineAnimation> SoftwareTimelinePlatform::animate(const std::string& targetId,
                                                                              engine::TimelineEffect effect,
                                                                              const engine::TimingOptions& timing)
{
    if (m_options.hasTarget && !m_options.hasTarget(targetId))
    {
        return nullptr;
    }
    return std::make_unique<SoftwareTimelineAnimation>(targetId, std::move(effect), timing, m_adapter, m_scheduler);
}

} // namespace animator::platform
