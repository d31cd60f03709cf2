/**
 * ************************************************************************
 *
 * @file Normalizer.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-08
 * @version 0.1
 * @brief 文档规范化
    原始文档 + 调用方覆盖项 -> 规范配置 + 扁平绑定列表
    - 覆盖项逐字段合并，已定义的字段优先
    - 非自动播放时 trigger.startOn 固定为 programmatic，由调用方完全控制
    - 在副本上重新生成元素 id，输入文档不会被修改
    - 解析缓动和动画的命名引用，找不到的引用跳过并记录诊断
    - 路径字符串转换为贝塞尔路径，颜色字符串转换为归一化颜色
    - 定点时间通过 delayMs = -seekTimeMs 实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Document.h"
#include "src/utils/IdGenerator.h"

namespace animator::model
{

struct NormalizeOptions
{
    bool autoplay = false;
    std::optional<double> seekTimeMs; // 固定到某一时刻开始
    utils::IdGenerator idGenerator;   // 为空时使用 GenerateUniqueId
    bool regenerateIds = true;
};

/**
 * @brief 合并覆盖项，并把 duration / iterations 约束到合法范围
 */
[[nodiscard]] PlaybackConfig mergeOverrides(PlaybackConfig config, const PlaybackOverrides& overrides);

/**
 * @brief 文档规范化入口，每次创建引擎实例调用一次
 */
[[nodiscard]] NormalizedDocument normalize(const AnimatedDocument& document,
                                           const PlaybackOverrides& overrides = {},
                                           const NormalizeOptions& options = {});

/**
 * @brief 把 d 属性的各种写法转换为路径集合
 * 支持 "path(M...)"、"M..."、字符串数组、{paths: [...]}、{v, i, o, c} 对象
 * @param diagnostics 遇到不支持的路径命令时追加说明，可为空
 * @return 无法识别时返回 std::nullopt
 */
[[nodiscard]] std::optional<PathSet> toPathSet(const Json& value, std::vector<std::string>* diagnostics = nullptr);

/**
 * @brief 按属性类型把关键帧原始值转换为 Value
 */
[[nodiscard]] Value toValue(std::string_view property, const Json& value, std::vector<std::string>& diagnostics);

} // namespace animator::model
