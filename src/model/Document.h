/**
 * ************************************************************************
 *
 * @file Document.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-06
 * @version 0.1
 * @brief 动画文档数据模型
    - 文档原始结构: 节点树 + 播放配置 + 定义表 + 绑定列表
    - 规范化结果: 合并后的播放配置 + 扁平的 (目标 id -> 动画定义) 绑定
    JSON 交换格式使用 nlohmann::ordered_json，保留属性声明顺序
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "src/common/Types.h"

namespace animator::model
{
using Json = nlohmann::ordered_json;

constexpr double DEFAULT_DURATION_MS = 1000.0;
constexpr double INFINITE_ITERATIONS = std::numeric_limits<double>::infinity();

// ===================== 播放配置 =====================

enum class EngineHint : std::uint8_t
{
    Auto,     // 优先原生时间轴，不支持时回退到帧循环
    Native,   // 强制原生时间轴，不支持的属性直接丢弃
    FrameLoop // 强制帧循环
};

enum class FillMode : std::uint8_t
{
    None,
    Forwards,
    Backwards,
    Both
};

enum class Direction : std::uint8_t
{
    Normal,
    Reverse,
    Alternate,
    AlternateReverse
};

enum class StartOn : std::uint8_t
{
    Load,
    MouseOver,
    Click,
    ScrollIntoView,
    Programmatic
};

enum class OutAction : std::uint8_t
{
    Continue,
    Pause,
    Reset,
    Reverse
};

struct Trigger
{
    StartOn startOn = StartOn::Load;
    std::optional<OutAction> outAction;
    std::optional<double> scrollIntoViewThreshold; // 0-1，仅 scrollIntoView 使用
};

/**
 * @brief 全局播放配置
 * iterations 为 INFINITE_ITERATIONS 时表示无限循环
 */
struct PlaybackConfig
{
    EngineHint engineHint = EngineHint::Auto;
    double durationMs = DEFAULT_DURATION_MS; // 单次迭代时长，> 0
    double delayMs = 0.0;                    // 负值表示起始时已经前进
    double iterations = 1.0;                 // >= 1
    FillMode fillMode = FillMode::None;
    Direction direction = Direction::Normal;
    std::optional<double> frameRateCapHz;
    std::optional<Trigger> trigger;
    std::string debugInstName;

    [[nodiscard]] bool isInfinite() const { return iterations == INFINITE_ITERATIONS; }

    /**
     * @brief 总时长 = 单次时长 * 迭代次数，无限循环时为 +inf
     */
    [[nodiscard]] double totalDurationMs() const
    {
        return isInfinite() ? INFINITE_ITERATIONS : durationMs * iterations;
    }
};

/**
 * @brief 调用方覆盖项，已定义的字段覆盖文档中的值
 */
struct PlaybackOverrides
{
    std::optional<EngineHint> engineHint;
    std::optional<double> durationMs;
    std::optional<double> delayMs;
    std::optional<double> iterations;
    std::optional<FillMode> fillMode;
    std::optional<Direction> direction;
    std::optional<double> frameRateCapHz;
    std::optional<Trigger> trigger;
    std::optional<std::string> debugInstName;
};

// ===================== 文档原始结构 =====================

/**
 * @brief 缓动：命名引用或 [x1, y1, x2, y2]
 */
using EasingRef = std::variant<std::string, CubicBezierPoints>;

struct KeyframeSpec
{
    double timeMs = 0.0;
    Json value; // 未转换的原始值，规范化时按属性类型转换
    std::optional<EasingRef> easing;
};

struct PropertyAnimationSpec
{
    std::vector<KeyframeSpec> keyframes;
};

/**
 * @brief 属性名 -> 属性动画，保持声明顺序
 */
using AnimationDefinitionSpec = std::vector<std::pair<std::string, PropertyAnimationSpec>>;

/**
 * @brief 动画引用：定义表中的名字或内联定义
 */
using AnimationRef = std::variant<std::string, AnimationDefinitionSpec>;

/**
 * @brief 元素动画：一个或多个引用，按顺序合并，后者覆盖前者的同名属性
 */
using ElementAnimation = std::vector<AnimationRef>;

struct Definitions
{
    std::map<std::string, CubicBezierPoints> easings;
    std::map<std::string, AnimationDefinitionSpec> animations;
    Json styles = Json::object();
};

struct BindingSpec
{
    std::string targetId;
    ElementAnimation animate;
};

struct Node
{
    std::string type;
    std::optional<std::string> id;
    Json attributes = Json::object(); // 除 type/id/children/animate 之外的全部字段
    std::vector<Node> children;
    std::optional<ElementAnimation> animate;
};

struct AnimatedDocument
{
    Node root;
    PlaybackConfig config;
    Definitions defs;
    std::vector<BindingSpec> bindings;
    std::vector<std::string> diagnostics; // 解析阶段的非致命问题
};

// ===================== 规范化结果 =====================

struct Keyframe
{
    double t = 0.0; // 毫秒
    Value v;
    std::optional<CubicBezierPoints> easing;
};

struct PropertyAnimation
{
    std::string property;
    std::vector<Keyframe> keyframes; // 按 t 升序
};

/**
 * @brief 规范化后的动画定义，属性按首次出现的顺序排列
 */
using AnimationDefinition = std::vector<PropertyAnimation>;

struct Binding
{
    std::string targetId;
    AnimationDefinition animation;
};

struct NormalizedDocument
{
    PlaybackConfig config;
    std::vector<Binding> bindings;
    Node root; // 重新生成 id 之后的节点树副本
    std::vector<std::string> diagnostics;
};

} // namespace animator::model
