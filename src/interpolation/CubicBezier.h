/**
 * ************************************************************************
 *
 * @file CubicBezier.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 三次贝塞尔缓动求解器
    与 CSS cubic-bezier() 时间函数的曲线形状一致
    - 先用 Newton-Raphson 迭代（最多 8 次）
    - 导数过小 (|dx/dt| < 1e-6) 时退化为二分查找
    - 误差 |x - sampled| < 1e-6 时结束
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <optional>
#include <string_view>
#include "src/common/Types.h"

namespace animator::interpolation
{

class CubicBezierEasing
{
public:
    explicit CubicBezierEasing(const CubicBezierPoints& points);

    /**
     * @brief 计算缓动值
     * @param x 输入进度，<=0 返回 y(0)，>=1 返回 y(1)
     * @return 缓动后的进度（可能超出 [0,1]，例如回弹曲线）
     */
    [[nodiscard]] double operator()(double x) const;

    [[nodiscard]] const CubicBezierPoints& points() const { return m_points; }

private:
    [[nodiscard]] double sampleCurveX(double t) const { return ((m_ax * t + m_bx) * t + m_cx) * t; }
    [[nodiscard]] double sampleCurveY(double t) const { return ((m_ay * t + m_by) * t + m_cy) * t; }
    [[nodiscard]] double sampleCurveDerivativeX(double t) const { return (3.0 * m_ax * t + 2.0 * m_bx) * t + m_cx; }
    [[nodiscard]] double solveCurveX(double x) const;

    CubicBezierPoints m_points;
    double m_ax;
    double m_bx;
    double m_cx;
    double m_ay;
    double m_by;
    double m_cy;
};

/**
 * @brief 便捷函数：一次性求解
 */
[[nodiscard]] double solveCubicBezierEasing(const CubicBezierPoints& points, double x);

/**
 * @brief CSS 关键字缓动 (linear/ease/ease-in/ease-out/ease-in-out，也接受驼峰写法)
 */
[[nodiscard]] std::optional<CubicBezierPoints> namedEasing(std::string_view name);

} // namespace animator::interpolation
