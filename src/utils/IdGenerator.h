/**
 * ************************************************************************
 *
 * @file IdGenerator.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-03
 * @version 0.1
 * @brief 元素 ID 生成器
  - 生成全局唯一的元素标识符: 前缀 + 时间戳(36进制) + 计数器(36进制) + 随机后缀
  - 计数器为进程级原子变量，同一进程内多实例不会重复
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace animator::utils
{
/**
 * @brief ID 生成函数类型，可由调用方注入（测试时使用确定性序列）
 */
using IdGenerator = std::function<std::string()>;

/**
 * @brief 生成一个全局唯一的元素 ID，形如 "_anim_lx3k9a2f1q"
 */
std::string GenerateUniqueId();

/**
 * @brief 无符号整数转 36 进制字符串
 */
std::string ToBase36(uint64_t value);

} // namespace animator::utils
