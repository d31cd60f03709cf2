/**
 * ************************************************************************
 *
 * @file ColorCodec.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief 颜色字符串编解码实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "ColorCodec.h"
#include "Interpolate.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <fmt/format.h>
#include <vector>

namespace animator::interpolation
{
namespace
{
constexpr double CHANNEL_MAX = 255.0;

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) text.remove_suffix(1);
    return text;
}

std::optional<int> hexPair(char high, char low)
{
    // from_chars 接受前导负号，先逐字符检查
    if (std::isxdigit(static_cast<unsigned char>(high)) == 0 || std::isxdigit(static_cast<unsigned char>(low)) == 0)
    {
        return std::nullopt;
    }
    int value = 0;
    const char digits[2] = {high, low};
    auto [ptr, ec] = std::from_chars(digits, digits + 2, value, 16);
    if (ec != std::errc{} || ptr != digits + 2) return std::nullopt;
    return value;
}

std::expected<ColorVec, ColorError> parseHex(std::string_view hex)
{
    const size_t len = hex.size();
    if (len != 3 && len != 4 && len != 6 && len != 8)
    {
        return std::unexpected(ColorError::InvalidHex);
    }

    const bool isShort = len <= 4;
    auto channel = [&](size_t index) -> std::optional<int>
    {
        if (isShort) return hexPair(hex[index], hex[index]);
        return hexPair(hex[index * 2], hex[(index * 2) + 1]);
    };

    const size_t channelCount = (len == 4 || len == 8) ? 4 : 3;
    ColorVec result{0.0, 0.0, 0.0, 1.0};
    for (size_t i = 0; i < channelCount; ++i)
    {
        auto value = channel(i);
        if (!value) return std::unexpected(ColorError::InvalidHex);
        result[static_cast<Eigen::Index>(i)] = static_cast<double>(*value) / CHANNEL_MAX;
    }
    return result;
}

std::expected<ColorVec, ColorError> parseRgb(std::string_view text)
{
    const auto open = text.find('(');
    const auto close = text.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close <= open)
    {
        return std::unexpected(ColorError::InvalidRgb);
    }

    std::vector<double> parts;
    std::string_view inner = text.substr(open + 1, close - open - 1);
    while (!inner.empty())
    {
        const auto comma = inner.find(',');
        std::string_view token = trim(inner.substr(0, comma));
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size())
        {
            return std::unexpected(ColorError::InvalidRgb);
        }
        parts.push_back(value);
        if (comma == std::string_view::npos) break;
        inner.remove_prefix(comma + 1);
    }

    if (parts.size() < 3 || parts.size() > 4) return std::unexpected(ColorError::InvalidRgb);

    return ColorVec{parts[0] / CHANNEL_MAX,
                    parts[1] / CHANNEL_MAX,
                    parts[2] / CHANNEL_MAX,
                    parts.size() == 4 ? parts[3] : 1.0};
}

int toChannel(double value)
{
    return static_cast<int>(std::floor((value * CHANNEL_MAX) + 0.5));
}
} // namespace

std::expected<ColorVec, ColorError> parseColor(std::string_view text)
{
    text = trim(text);
    if (text.empty()) return std::unexpected(ColorError::Empty);

    if (text.front() == '#') return parseHex(text.substr(1));
    if (text.starts_with("rgb")) return parseRgb(text);

    return std::unexpected(ColorError::UnsupportedFormat);
}

std::string toRgbaString(const ColorVec& color)
{
    return fmt::format("rgba({},{},{},{})",
                       toChannel(color[0]),
                       toChannel(color[1]),
                       toChannel(color[2]),
                       formatNumber(color[3]));
}

std::string toHexString(const ColorVec& color)
{
    auto byte = [](double value) { return std::clamp(toChannel(value), 0, 255); };
    if (color[3] >= 1.0)
    {
        return fmt::format("#{:02x}{:02x}{:02x}", byte(color[0]), byte(color[1]), byte(color[2]));
    }
    return fmt::format(
        "#{:02x}{:02x}{:02x}{:02x}", byte(color[0]), byte(color[1]), byte(color[2]), byte(color[3]));
}

std::string_view toString(ColorError error)
{
    switch (error)
    {
        case ColorError::Empty:
            return "empty color string";
        case ColorError::UnsupportedFormat:
            return "unsupported color format";
        case ColorError::InvalidHex:
            return "invalid hex color";
        case ColorError::InvalidRgb:
            return "invalid rgb/rgba color";
    }
    return "unknown color error";
}

} // namespace animator::interpolation
