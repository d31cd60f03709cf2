/**
 * ************************************************************************
 *
 * @file PropertySampler.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-10
 * @version 0.1
 * @brief 关键帧采样
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "PropertySampler.h"
#include <charconv>
#include <optional>
#include <string_view>
#include "src/common/AttributeNames.h"
#include "src/interpolation/ColorCodec.h"
#include "src/interpolation/CubicBezier.h"
#include "src/interpolation/Interpolate.h"
#include "src/interpolation/PathCodec.h"

namespace animator::engine
{
namespace
{
using namespace animator::interpolation;

const std::vector<double> ZERO_PAIR{0.0, 0.0};
const std::vector<double> UNIT_PAIR{1.0, 1.0};

bool isDasharray(std::string_view property)
{
    return property == "stroke-dasharray" || property == "strokeDasharray";
}

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/**
 * @brief 整串解析为数值，允许首尾空白
 */
std::optional<double> parseNumber(std::string_view text)
{
    text = trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }
    if (text.front() == '+')
    {
        text.remove_prefix(1);
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief 解析以空白或逗号分隔的数值列表，任一项失败时返回 std::nullopt
 */
std::optional<std::vector<double>> parseNumberList(std::string_view text)
{
    std::vector<double> result;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto start = text.find_first_not_of(" \t\r\n,", pos);
        if (start == std::string_view::npos)
        {
            break;
        }
        auto stop = text.find_first_of(" \t\r\n,", start);
        if (stop == std::string_view::npos)
        {
            stop = text.size();
        }
        const auto number = parseNumber(text.substr(start, stop - start));
        if (!number)
        {
            return std::nullopt;
        }
        result.push_back(*number);
        pos = stop;
    }
    return result;
}

bool isNonNumericString(const Value& value)
{
    const auto* text = std::get_if<std::string>(&value);
    return text != nullptr && !parseNumber(*text).has_value();
}

std::vector<double> transformDefault(std::string_view property)
{
    return property == "scale" ? UNIT_PAIR : ZERO_PAIR;
}

} // namespace

// ---------------- Value 访问 ----------------

std::string formatTransform(std::string_view property, const Value& value)
{
    if (property == "rotate")
    {
        return "rotate(" + formatNumber(valueAsNumber(value, 0.0)) + ")";
    }
    if (property == "skew")
    {
        const auto skew = valueAsVector(value, ZERO_PAIR);
        const double x = skew.empty() ? 0.0 : skew[0];
        const double y = skew.size() > 1 ? skew[1] : 0.0;
        return "skewX(" + formatNumber(x) + ") skewY(" + formatNumber(y) + ")";
    }
    const auto vec = valueAsVector(value, transformDefault(property));
    return std::string(property) + "(" + joinNumbers(vec, ",") + ")";
}

double valueAsNumber(const Value& value, double fallback)
{
    if (const auto* number = std::get_if<double>(&value))
    {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        return parseNumber(*text).value_or(fallback);
    }
    if (const auto* vec = std::get_if<std::vector<double>>(&value); vec != nullptr && !vec->empty())
    {
        return vec->front();
    }
    return fallback;
}

std::vector<double> valueAsVector(const Value& value, const std::vector<double>& fallback)
{
    if (const auto* vec = std::get_if<std::vector<double>>(&value))
    {
        return *vec;
    }
    if (const auto* number = std::get_if<double>(&value))
    {
        return {*number};
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        return parseNumberList(*text).value_or(fallback);
    }
    if (const auto* color = std::get_if<ColorVec>(&value))
    {
        return {(*color)[0], (*color)[1], (*color)[2], (*color)[3]};
    }
    return fallback;
}

ColorVec valueAsColor(const Value& value)
{
    if (const auto* color = std::get_if<ColorVec>(&value))
    {
        return *color;
    }
    if (const auto* vec = std::get_if<std::vector<double>>(&value))
    {
        return colorFromComponents(*vec);
    }
    if (const auto* text = std::get_if<std::string>(&value))
    {
        if (auto parsed = parseColor(*text))
        {
            return *parsed;
        }
    }
    return ColorVec(0.0, 0.0, 0.0, 1.0);
}

PathSet valueAsPaths(const Value& value)
{
    if (const auto* paths = std::get_if<PathSet>(&value))
    {
        return *paths;
    }
    return {};
}

std::string joinNumbers(const std::vector<double>& values, std::string_view separator)
{
    std::string result;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
        {
            result += separator;
        }
        result += formatNumber(values[i]);
    }
    return result;
}

// ---------------- 采样 ----------------

KeyframeSegment findSegment(const std::vector<model::Keyframe>& keyframes, double timeMs)
{
    if (keyframes.empty())
    {
        return {};
    }

    for (std::size_t i = 0; i + 1 < keyframes.size(); ++i)
    {
        const auto& from = keyframes[i];
        const auto& to = keyframes[i + 1];
        if (from.t <= timeMs && timeMs <= to.t)
        {
            return {.from = &from, .to = &to};
        }
    }
    return {.from = &keyframes.front(), .to = &keyframes.back()};
}

double segmentProgress(const KeyframeSegment& segment, double timeMs)
{
    if (segment.from == nullptr || segment.from == segment.to)
    {
        return 0.0;
    }

    double local = clamp(remap(timeMs, segment.from->t, segment.to->t, 0.0, 1.0), 0.0, 1.0);
    if (segment.from->easing)
    {
        local = solveCubicBezierEasing(*segment.from->easing, local);
    }
    return local;
}

Value sampleProperty(const model::PropertyAnimation& animation, double timeMs)
{
    const auto segment = findSegment(animation.keyframes, timeMs);
    if (segment.from == nullptr)
    {
        return std::monostate{};
    }

    const Value& a = segment.from->v;
    const Value& b = segment.to->v;
    const double t = segmentProgress(segment, timeMs);
    const std::string_view property = animation.property;

    if (property == "d")
    {
        return interpolatePathSet(valueAsPaths(a), valueAsPaths(b), t);
    }
    if (isColorProperty(property))
    {
        return interpolateColor(valueAsColor(a), valueAsColor(b), t);
    }
    if (isTransformFunction(property) && property != "rotate")
    {
        const auto fallback = property == "scale" ? UNIT_PAIR : ZERO_PAIR;
        return interpolateVector(valueAsVector(a, fallback), valueAsVector(b, fallback), t);
    }
    if (isDasharray(property) || std::holds_alternative<std::vector<double>>(a) ||
        std::holds_alternative<std::vector<double>>(b))
    {
        return interpolateVector(valueAsVector(a, {}), valueAsVector(b, {}), t);
    }
    // 两端都不是数值字符串时离散切换
    if (isNonNumericString(a) || isNonNumericString(b))
    {
        return t < 1.0 ? a : b;
    }
    return interpolateScalar(valueAsNumber(a, 0.0), valueAsNumber(b, 0.0), t);
}

std::vector<AttributeWrite> sampleAnimation(const model::AnimationDefinition& animation, double timeMs)
{
    std::vector<AttributeWrite> writes;
    writes.reserve(animation.size());
    std::optional<std::size_t> transformSlot;

    for (const auto& property : animation)
    {
        const Value value = sampleProperty(property, timeMs);
        const std::string_view name = property.property;

        if (isTransformFunction(name))
        {
            const auto part = formatTransform(name, value);
            if (!transformSlot)
            {
                transformSlot = writes.size();
                writes.push_back({.name = "transform", .value = part});
            }
            else
            {
                writes[*transformSlot].value += " " + part;
            }
            continue;
        }

        if (name == "d")
        {
            writes.push_back({.name = "d", .value = toSvgPathData(valueAsPaths(value))});
        }
        else if (isColorProperty(name))
        {
            writes.push_back({.name = toAttributeName(name), .value = toRgbaString(valueAsColor(value))});
        }
        else if (isDasharray(name))
        {
            writes.push_back({.name = std::string(name), .value = joinNumbers(valueAsVector(value, {}), " ")});
        }
        else if (const auto* vec = std::get_if<std::vector<double>>(&value))
        {
            writes.push_back({.name = toAttributeName(name), .value = joinNumbers(*vec, " ")});
        }
        else if (const auto* text = std::get_if<std::string>(&value))
        {
            writes.push_back({.name = toAttributeName(name), .value = *text});
        }
        else
        {
            const double number = valueAsNumber(value, 0.0);
            auto formatted = isPercentProperty(name) ? formatNumber(number * 100.0) + "%" : formatNumber(number);
            writes.push_back({.name = toAttributeName(name), .value = std::move(formatted)});
        }
    }
    return writes;
}

} // namespace animator::engine
