/**
 * ************************************************************************
 *
 * @file AttributeNames.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 属性名分类与命名转换
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <string_view>

namespace animator
{

/**
 * @brief 颜色属性 (color/fill/flood-color/lighting-color/stop-color/stroke)
 */
[[nodiscard]] bool isColorProperty(std::string_view name);

/**
 * @brief 变换函数属性 (translate/rotate/scale/skew)，写入同一个 transform
 */
[[nodiscard]] bool isTransformFunction(std::string_view name);

/**
 * @brief 以百分比输出的属性 (offset-distance)
 */
[[nodiscard]] bool isPercentProperty(std::string_view name);

[[nodiscard]] bool isCamelCaseWord(std::string_view word);

/**
 * @brief 驼峰转短横线，SVG 自身的驼峰属性 (viewBox/stdDeviation/...) 保持不变
 */
[[nodiscard]] std::string toAttributeName(std::string_view name);

/**
 * @brief 短横线转驼峰 (stroke-width -> strokeWidth)
 */
[[nodiscard]] std::string kebabToCamelCase(std::string_view name);

} // namespace animator
