/**
 * ************************************************************************
 *
 * @file PathCodec.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief SVG 路径数据与贝塞尔路径之间的转换
    - 解析: 支持 M/L/C/Z 命令（大小写均按绝对坐标处理），其它命令忽略
    - 序列化: 控制柄与顶点重合的段输出 L，否则输出 C，闭合路径以 z 结尾
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
#include "src/common/Types.h"

namespace animator::interpolation
{

struct PathParseResult
{
    PathSet paths;
    std::vector<char> ignoredCommands; // 未支持的命令字符
};

/**
 * @brief 解析路径数据（"M0,0 L10,0 C..."）
 */
[[nodiscard]] PathParseResult parseSvgPathData(std::string_view data);

/**
 * @brief 从 "path(M...)" 或裸路径 "M..." 中提取路径数据
 * @return 不是路径字符串时返回 std::nullopt
 */
[[nodiscard]] std::optional<std::string_view> extractPathData(std::string_view text);

[[nodiscard]] std::string toSvgPathData(const BezierPath& path);

/**
 * @brief 多条子路径依次拼接
 */
[[nodiscard]] std::string toSvgPathData(const PathSet& paths);

} // namespace animator::interpolation
