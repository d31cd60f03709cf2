/**
 * ************************************************************************
 *
 * @file CubicBezier.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 三次贝塞尔缓动求解器实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "CubicBezier.h"
#include <cmath>
#include <string>
#include <unordered_map>

namespace animator::interpolation
{
namespace
{
constexpr int NEWTON_ITERATIONS = 8;
constexpr int BISECTION_ITERATIONS = 64;
constexpr double EPSILON = 1e-6;
} // namespace

CubicBezierEasing::CubicBezierEasing(const CubicBezierPoints& points) : m_points(points)
{
    const auto [p1x, p1y, p2x, p2y] = points;

    m_cx = 3.0 * p1x;
    m_bx = 3.0 * (p2x - p1x) - m_cx;
    m_ax = 1.0 - m_cx - m_bx;
    m_cy = 3.0 * p1y;
    m_by = 3.0 * (p2y - p1y) - m_cy;
    m_ay = 1.0 - m_cy - m_by;
}

double CubicBezierEasing::solveCurveX(double x) const
{
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    // 1. Newton-Raphson
    double t2 = x;
    for (int i = 0; i < NEWTON_ITERATIONS; ++i)
    {
        const double x2 = sampleCurveX(t2) - x;
        if (std::abs(x2) < EPSILON) return t2;

        const double d2 = sampleCurveDerivativeX(t2);
        if (std::abs(d2) < EPSILON) break; // 导数过小，改用二分

        t2 -= x2 / d2;
    }

    // 2. 二分查找，例如 [0, 0, 0, 1] 这类曲线
    double t0 = 0.0;
    double t1 = 1.0;
    t2 = x;
    for (int i = 0; i < BISECTION_ITERATIONS && t0 < t1; ++i)
    {
        const double x2 = sampleCurveX(t2);
        if (std::abs(x2 - x) < EPSILON) return t2;
        if (x > x2)
        {
            t0 = t2;
        }
        else
        {
            t1 = t2;
        }
        t2 = (t1 + t0) / 2.0;
    }

    return t2;
}

double CubicBezierEasing::operator()(double x) const
{
    return sampleCurveY(solveCurveX(x));
}

double solveCubicBezierEasing(const CubicBezierPoints& points, double x)
{
    return CubicBezierEasing(points)(x);
}

std::optional<CubicBezierPoints> namedEasing(std::string_view name)
{
    static const std::unordered_map<std::string, CubicBezierPoints> NAMED = {
        {"linear", {0.0, 0.0, 1.0, 1.0}},
        {"ease", {0.25, 0.1, 0.25, 1.0}},
        {"ease-in", {0.42, 0.0, 1.0, 1.0}},
        {"easeIn", {0.42, 0.0, 1.0, 1.0}},
        {"ease-out", {0.0, 0.0, 0.58, 1.0}},
        {"easeOut", {0.0, 0.0, 0.58, 1.0}},
        {"ease-in-out", {0.42, 0.0, 0.58, 1.0}},
        {"easeInOut", {0.42, 0.0, 0.58, 1.0}},
    };

    auto it = NAMED.find(std::string(name));
    if (it == NAMED.end()) return std::nullopt;
    return it->second;
}

} // namespace animator::interpolation
