/**
 * ************************************************************************
 *
 * @file DocumentValidator.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 动画文档深度校验
    按交换格式的类型定义逐字段检查，错误信息带完整路径，例如
    "root.animator.direction: invalid PlaybackDirection \"up\", ..."
    校验结果仅供参考，解析本身是宽松的
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <vector>
#include "Document.h"

namespace animator::model
{

struct ValidationResult
{
    bool valid = true;
    std::vector<std::string> errors;
};

[[nodiscard]] ValidationResult validateDocument(const Json& json);

} // namespace animator::model
