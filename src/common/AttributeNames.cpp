/**
 * ************************************************************************
 *
 * @file AttributeNames.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 属性名分类与命名转换实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "AttributeNames.h"
#include <cctype>
#include <string>
#include <unordered_set>

namespace animator
{
namespace
{
bool isLower(char ch)
{
    return std::islower(static_cast<unsigned char>(ch)) != 0;
}

bool isUpper(char ch)
{
    return std::isupper(static_cast<unsigned char>(ch)) != 0;
}

const std::unordered_set<std::string_view>& svgCamelCaseAttributes()
{
    static const std::unordered_set<std::string_view> NAMES = {
        // 坐标系
        "viewBox",
        "preserveAspectRatio",
        // 渐变
        "gradientUnits",
        "gradientTransform",
        "spreadMethod",
        // 图案
        "patternUnits",
        "patternContentUnits",
        "patternTransform",
        // 裁剪/遮罩
        "clipPathUnits",
        "maskUnits",
        "maskContentUnits",
        // 文本
        "textLength",
        "lengthAdjust",
        "startOffset",
        // 滤镜
        "filterUnits",
        "primitiveUnits",
        "stdDeviation",
        "baseFrequency",
        "numOctaves",
        "surfaceScale",
        "diffuseConstant",
        "specularConstant",
        "specularExponent",
        "kernelMatrix",
        "kernelUnitLength",
        "edgeMode",
        "preserveAlpha",
        "targetX",
        "targetY",
        // SMIL
        "attributeName",
        "attributeType",
        "calcMode",
        "keyTimes",
        "keySplines",
        "repeatCount",
        "repeatDur",
        // 作为属性使用的表现属性
        "clipPath",
        "fillOpacity",
        "strokeOpacity",
        "strokeWidth",
        "strokeLinecap",
        "strokeLinejoin",
        "strokeMiterlimit",
        "strokeDasharray",
        "strokeDashoffset",
        "fontFamily",
        "fontSize",
        "fontStyle",
        "fontVariant",
        "fontWeight",
        "textAnchor",
        "textDecoration",
    };
    return NAMES;
}
} // namespace

bool isColorProperty(std::string_view name)
{
    return name == "color" || name == "fill" || name == "flood-color" || name == "lighting-color" ||
           name == "stop-color" || name == "stroke";
}

bool isTransformFunction(std::string_view name)
{
    return name == "translate" || name == "rotate" || name == "scale" || name == "skew";
}

bool isPercentProperty(std::string_view name)
{
    return name == "offset-distance" || name == "offsetDistance";
}

bool isCamelCaseWord(std::string_view word)
{
    if (word.find('-') != std::string_view::npos) return false;
    for (size_t i = 1; i < word.size(); ++i)
    {
        if (isLower(word[i - 1]) && isUpper(word[i])) return true;
    }
    return false;
}

std::string toAttributeName(std::string_view name)
{
    if (!isCamelCaseWord(name) || svgCamelCaseAttributes().contains(name)) return std::string(name);

    std::string result;
    result.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i)
    {
        const char ch = name[i];
        if (i > 0 && isUpper(ch) && (isLower(name[i - 1]) || std::isdigit(static_cast<unsigned char>(name[i - 1])) != 0))
        {
            result.push_back('-');
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return result;
}

std::string kebabToCamelCase(std::string_view name)
{
    std::string result;
    result.reserve(name.size());
    bool upperNext = false;
    for (const char ch : name)
    {
        if (ch == '-')
        {
            upperNext = true;
            continue;
        }
        if (upperNext && isLower(ch))
        {
            result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
        }
        else
        {
            if (upperNext) result.push_back('-');
            result.push_back(ch);
        }
        upperNext = false;
    }
    return result;
}

} // namespace animator
