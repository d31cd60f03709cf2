/**
 * ************************************************************************
 *
 * @file Timing.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-10
 * @version 0.1
 * @brief 迭代与方向计算
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Timing.h"
#include <algorithm>
#include <cmath>
#include "src/interpolation/Interpolate.h"

namespace animator::engine
{
using interpolation::clamp;

IterationProgress computeProgress(double currentTimeMs,
                                  double durationMs,
                                  double iterations,
                                  model::Direction direction)
{
    IterationProgress result;
    if (durationMs <= 0.0)
    {
        return result;
    }

    const double time = std::max(currentTimeMs, 0.0);
    result.iteration = clamp(std::ceil(time / durationMs) - 1.0, 0.0, std::max(iterations - 1.0, 0.0));
    result.rawProgress = clamp((time - result.iteration * durationMs) / durationMs, 0.0, 1.0);

    const bool oddIteration = std::fmod(result.iteration, 2.0) == 1.0;
    switch (direction)
    {
        case model::Direction::Normal:
            result.effectiveProgress = result.rawProgress;
            break;
        case model::Direction::Reverse:
            result.effectiveProgress = 1.0 - result.rawProgress;
            break;
        case model::Direction::Alternate:
            result.effectiveProgress = oddIteration ? 1.0 - result.rawProgress : result.rawProgress;
            break;
        case model::Direction::AlternateReverse:
            result.effectiveProgress = oddIteration ? result.rawProgress : 1.0 - result.rawProgress;
            break;
    }
    return result;
}

double computeEffectiveProgress(double currentTimeMs, double durationMs, double iterations, model::Direction direction)
{
    return computeProgress(currentTimeMs, durationMs, iterations, direction).effectiveProgress;
}

double initialTimeFromDelay(double delayMs, double durationMs)
{
    if (delayMs > 0.0)
    {
        return -delayMs;
    }
    if (delayMs < 0.0 && durationMs > 0.0)
    {
        return std::fmod(-delayMs, durationMs);
    }
    return 0.0;
}

double clampToTimeline(double timeMs, double totalDurationMs)
{
    if (std::isnan(timeMs) || timeMs < 0.0)
    {
        return 0.0;
    }
    if (std::isfinite(totalDurationMs) && timeMs > totalDurationMs)
    {
        return totalDurationMs;
    }
    return timeMs;
}

} // namespace animator::engine
