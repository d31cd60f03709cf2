/**
 * ************************************************************************
 *
 * @file Timing.h
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
#pragma once

#include "src/model/Document.h"

namespace animator::engine
{

struct IterationProgress
{
    double iteration = 0.0;         // 当前迭代序号，从 0 开始
    double rawProgress = 0.0;       // 迭代内进度 [0, 1]
    double effectiveProgress = 0.0; // 应用播放方向之后的进度 [0, 1]
};

/**
 * @brief 由当前时间计算迭代序号与有效进度
 * iteration = clamp(ceil(t / d) - 1, 0, iterations - 1)
 * 迭代边界上取上一次迭代的末尾，因此有限次播放结束时停在最终帧
 */
[[nodiscard]] IterationProgress computeProgress(double currentTimeMs,
                                                double durationMs,
                                                double iterations,
                                                model::Direction direction);

[[nodiscard]] double computeEffectiveProgress(double currentTimeMs,
                                              double durationMs,
                                              double iterations,
                                              model::Direction direction);

/**
 * @brief 由延迟得到起始累积时间
 * 正延迟返回 -delay（开始前保持第 0 帧），负延迟返回 (-delay) mod duration
 */
[[nodiscard]] double initialTimeFromDelay(double delayMs, double durationMs);

/**
 * @brief 把时间约束到 [0, 总时长]，无限循环时只约束下界
 */
[[nodiscard]] double clampToTimeline(double timeMs, double totalDurationMs);

} // namespace animator::engine
