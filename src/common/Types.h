/**
 * ************************************************************************
 *
 * @file Types.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 动画值的核心类型定义
 *
 * 使用 Eigen 向量类型表示点和颜色，提供关键帧值的统一类型。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <Eigen/Core>
#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace animator
{

// ===================== 基础向量类型 =====================

/**
 * @brief 2D 点类型（路径顶点和控制柄，绝对坐标）
 */
using Vec2 = Eigen::Vector2d;

/**
 * @brief 归一化颜色 [r, g, b, a]，各分量范围 0.0-1.0
 */
using ColorVec = Eigen::Vector4d;

/**
 * @brief 三次贝塞尔缓动控制点 [x1, y1, x2, y2]
 */
using CubicBezierPoints = std::array<double, 4>;

// ===================== 路径类型 =====================

/**
 * @brief 矢量路径：顶点 + 入/出控制柄（绝对坐标）+ 闭合标志
 * 控制柄数组可以比顶点数组短，缺失的控制柄视为与顶点重合（直线段）
 */
struct BezierPath
{
    std::vector<Vec2> vertices;
    std::vector<Vec2> inHandles;
    std::vector<Vec2> outHandles;
    std::optional<bool> closed;

    [[nodiscard]] bool empty() const { return vertices.empty(); }
};

/**
 * @brief 一个 d 属性可以包含多条子路径
 */
using PathSet = std::vector<BezierPath>;

// ===================== 关键帧值 =====================

/**
 * @brief 关键帧值
 *  - monostate: 缺失
 *  - double: 数值属性
 *  - vector<double>: 向量属性 (translate/scale/stroke-dasharray 等)
 *  - ColorVec: 颜色属性
 *  - PathSet: 路径属性 (d)
 *  - string: 其它（数值字符串在采样时转换）
 */
using Value = std::variant<std::monostate, double, std::vector<double>, ColorVec, PathSet, std::string>;

} // namespace animator
