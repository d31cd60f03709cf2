/**
 * ************************************************************************
 *
 * @file DocumentParser.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-06
 * @version 0.1
 * @brief 动画文档解析
    宽松解析：不合法的字段跳过并记录诊断信息，不抛异常
    同一概念的多种写法在这里统一:
    - 配置: animator / meta.animator / animation / meta.animation
    - 定义表: defs / meta.defs
    - 绑定: bindings / meta.bindings
    - 关键帧字段: time/t, value/v, easing/e, keyframes/kfs
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>
#include "Document.h"

namespace animator::model
{

enum class DocumentError : std::uint8_t
{
    FileNotFound,       // 文件不存在
    ReadFailed,         // 打开或读取失败
    ParseFailed,        // 不是合法 JSON
    NotAnimatedDocument // 根节点不是 svg
};

[[nodiscard]] std::string_view toString(DocumentError error);

/**
 * @brief 判断 JSON 是否是动画文档（对象且 type 或 tagName 为 "svg"）
 */
[[nodiscard]] bool isAnimatedDocument(const Json& json);

/**
 * @brief 解析动画文档
 */
[[nodiscard]] AnimatedDocument parseDocument(const Json& json);

/**
 * @brief 从文件加载文档 JSON
 */
[[nodiscard]] std::expected<Json, DocumentError> loadDocumentFile(const std::filesystem::path& path);

// 枚举与交换格式字符串之间的转换
[[nodiscard]] std::optional<EngineHint> parseEngineHint(std::string_view text);
[[nodiscard]] std::optional<FillMode> parseFillMode(std::string_view text);
[[nodiscard]] std::optional<Direction> parseDirection(std::string_view text);
[[nodiscard]] std::optional<StartOn> parseStartOn(std::string_view text);
[[nodiscard]] std::optional<OutAction> parseOutAction(std::string_view text);

[[nodiscard]] std::string_view toString(FillMode mode);
[[nodiscard]] std::string_view toString(Direction direction);

} // namespace animator::model
