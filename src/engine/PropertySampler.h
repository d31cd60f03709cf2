/**
 * ************************************************************************
 *
 * @file PropertySampler.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-10
 * @version 0.1
 * @brief 关键帧采样
    在给定时间点计算每个属性的值，并转换为可直接写出的属性字符串
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "src/model/Document.h"

namespace animator::engine
{

struct AttributeWrite
{
    std::string name;
    std::string value;

    bool operator==(const AttributeWrite&) const = default;
};

struct KeyframeSegment
{
    const model::Keyframe* from = nullptr;
    const model::Keyframe* to = nullptr;
};

/**
 * @brief 找到包围 timeMs 的关键帧对
 * 没有包围区间时退化为 (首帧, 末帧)，单个关键帧时两端相同
 */
[[nodiscard]] KeyframeSegment findSegment(const std::vector<model::Keyframe>& keyframes, double timeMs);

/**
 * @brief 区间内局部进度，已约束到 [0, 1] 并应用起始关键帧的缓动
 */
[[nodiscard]] double segmentProgress(const KeyframeSegment& segment, double timeMs);

/**
 * @brief 采样一个属性，返回插值后的值
 */
[[nodiscard]] Value sampleProperty(const model::PropertyAnimation& animation, double timeMs);

/**
 * @brief 采样整段动画定义
 * translate/rotate/scale/skew 按出现顺序合成到同一个 transform 属性上
 */
[[nodiscard]] std::vector<AttributeWrite> sampleAnimation(const model::AnimationDefinition& animation, double timeMs);

// ---------------- Value 访问 ----------------

/**
 * @brief 单个变换函数的属性字符串，例如 "translate(10,20)"、"rotate(45)"、"skewX(a) skewY(b)"
 */
[[nodiscard]] std::string formatTransform(std::string_view property, const Value& value);

[[nodiscard]] double valueAsNumber(const Value& value, double fallback);
[[nodiscard]] std::vector<double> valueAsVector(const Value& value, const std::vector<double>& fallback);
[[nodiscard]] ColorVec valueAsColor(const Value& value);
[[nodiscard]] PathSet valueAsPaths(const Value& value);

/**
 * @brief 数组按分隔符拼接，元素经 formatNumber 格式化
 */
[[nodiscard]] std::string joinNumbers(const std::vector<double>& values, std::string_view separator);

} // namespace animator::engine
