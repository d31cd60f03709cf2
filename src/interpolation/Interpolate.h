/**
 * ************************************************************************
 *
 * @file Interpolate.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 值插值函数库
    纯函数，无共享状态，与后端无关
    - 标量、向量（长度不等时缺失分量按 0 处理）
    - 颜色（缺失 alpha 按 1 处理）
    - 贝塞尔路径（按顶点下标逐一插值）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <vector>
#include "src/common/Types.h"

namespace animator::interpolation
{

[[nodiscard]] double clamp(double value, double min, double max);

/**
 * @brief 将 value 从 [inMin, inMax] 映射到 [outMin, outMax]，输入区间为空时返回 outMin
 */
[[nodiscard]] double remap(double value, double inMin, double inMax, double outMin, double outMax);

[[nodiscard]] double interpolateScalar(double a, double b, double t);

[[nodiscard]] std::vector<double> interpolateVector(const std::vector<double>& a, const std::vector<double>& b, double t);

[[nodiscard]] ColorVec interpolateColor(const ColorVec& a, const ColorVec& b, double t);

/**
 * @brief 由 3 或 4 分量数组构造颜色，缺失分量补 0，缺失 alpha 补 1
 */
[[nodiscard]] ColorVec colorFromComponents(const std::vector<double>& components);

/**
 * @brief 单条路径插值
 * 顶点数取两者最小值；闭合标志优先取起始路径
 */
[[nodiscard]] BezierPath interpolatePath(const BezierPath& a, const BezierPath& b, double t);

/**
 * @brief 路径集合插值，一侧缺失的子路径直接取另一侧
 */
[[nodiscard]] PathSet interpolatePathSet(const PathSet& a, const PathSet& b, double t);

/**
 * @brief 数值格式化为最短往返表示，与 ECMAScript Number#toString 的常见输出一致
 * 150.0 -> "150", 0.5 -> "0.5", -0.0 -> "0"
 */
[[nodiscard]] std::string formatNumber(double value);

} // namespace animator::interpolation
