/**
 * ************************************************************************
 *
 * @file ColorCodec.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief 颜色字符串编解码
    支持 #RGB、#RGBA、#RRGGBB、#RRGGBBAA、rgb()、rgba()
    解码结果统一为归一化的 [r, g, b, a]
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include "src/common/Types.h"

namespace animator::interpolation
{

enum class ColorError : std::uint8_t
{
    Empty,             // 空字符串
    UnsupportedFormat, // 既不是 # 也不是 rgb 开头
    InvalidHex,        // 十六进制位数或字符不合法
    InvalidRgb         // rgb()/rgba() 格式不合法
};

/**
 * @brief 解析颜色字符串
 * @return 成功返回归一化颜色，失败返回错误码
 */
[[nodiscard]] std::expected<ColorVec, ColorError> parseColor(std::string_view text);

/**
 * @brief 序列化为 "rgba(R,G,B,a)"，RGB 取整到 0-255，alpha 保持 0-1
 */
[[nodiscard]] std::string toRgbaString(const ColorVec& color);

/**
 * @brief 序列化为 "#RRGGBBAA"（alpha 为 1 时输出 "#RRGGBB"）
 */
[[nodiscard]] std::string toHexString(const ColorVec& color);

[[nodiscard]] std::string_view toString(ColorError error);

} // namespace animator::interpolation
