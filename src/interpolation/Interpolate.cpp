/**
 * ************************************************************************
 *
 * @file Interpolate.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-04
 * @version 0.1
 * @brief 值插值函数库实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "Interpolate.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace animator::interpolation
{
namespace
{
// 控制柄缺失时默认与顶点重合
const Vec2& handleOrVertex(const std::vector<Vec2>& handles, const std::vector<Vec2>& vertices, size_t idx)
{
    return idx < handles.size() ? handles[idx] : vertices[idx];
}

Vec2 lerp(const Vec2& a, const Vec2& b, double t)
{
    return a + ((b - a) * t);
}
} // namespace

double clamp(double value, double min, double max)
{
    return std::max(min, std::min(value, max));
}

double remap(double value, double inMin, double inMax, double outMin, double outMax)
{
    if (inMax == inMin) return outMin; // 避免除零
    const double t = (value - inMin) / (inMax - inMin);
    return outMin + (t * (outMax - outMin));
}

double interpolateScalar(double a, double b, double t)
{
    return a + ((b - a) * t);
}

std::vector<double> interpolateVector(const std::vector<double>& a, const std::vector<double>& b, double t)
{
    const size_t count = std::max(a.size(), b.size());
    std::vector<double> result(count, 0.0);
    for (size_t i = 0; i < count; ++i)
    {
        const double from = i < a.size() ? a[i] : 0.0;
        const double to = i < b.size() ? b[i] : 0.0;
        result[i] = interpolateScalar(from, to, t);
    }
    return result;
}

ColorVec interpolateColor(const ColorVec& a, const ColorVec& b, double t)
{
    return a + ((b - a) * t);
}

ColorVec colorFromComponents(const std::vector<double>& components)
{
    auto at = [&components](size_t idx, double fallback)
    { return idx < components.size() ? components[idx] : fallback; };
    return {at(0, 0.0), at(1, 0.0), at(2, 0.0), at(3, 1.0)};
}

BezierPath interpolatePath(const BezierPath& a, const BezierPath& b, double t)
{
    const double progress = clamp(t, 0.0, 1.0);
    const size_t len = std::min(a.vertices.size(), b.vertices.size());

    BezierPath result;
    result.vertices.reserve(len);
    result.inHandles.reserve(len);
    result.outHandles.reserve(len);

    for (size_t idx = 0; idx < len; ++idx)
    {
        result.vertices.push_back(lerp(a.vertices[idx], b.vertices[idx], progress));
        result.inHandles.push_back(lerp(handleOrVertex(a.inHandles, a.vertices, idx),
                                        handleOrVertex(b.inHandles, b.vertices, idx),
                                        progress));
        result.outHandles.push_back(lerp(handleOrVertex(a.outHandles, a.vertices, idx),
                                         handleOrVertex(b.outHandles, b.vertices, idx),
                                         progress));
    }

    result.closed = a.closed.has_value() ? a.closed : b.closed;
    return result;
}

PathSet interpolatePathSet(const PathSet& a, const PathSet& b, double t)
{
    const size_t count = std::max(a.size(), b.size());
    PathSet result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        if (i >= a.size())
        {
            result.push_back(b[i]);
        }
        else if (i >= b.size())
        {
            result.push_back(a[i]);
        }
        else
        {
            result.push_back(interpolatePath(a[i], b[i], t));
        }
    }
    return result;
}

std::string formatNumber(double value)
{
    if (value == 0.0 || !std::isfinite(value))
    {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
        return "0";
    }
    return fmt::format("{}", value);
}

} // namespace animator::interpolation
