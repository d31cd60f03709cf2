/**
 * ************************************************************************
 *
 * @file PathCodec.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-05
 * @version 0.1
 * @brief SVG 路径数据编解码实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "PathCodec.h"
#include "Interpolate.h"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace animator::interpolation
{
namespace
{
struct PathCommand
{
    char type;
    std::vector<double> values;
};

bool isCommandChar(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 && ch != 'e' && ch != 'E';
}

bool isSupportedCommand(char ch)
{
    switch (ch)
    {
        case 'M':
        case 'm':
        case 'L':
        case 'l':
        case 'C':
        case 'c':
        case 'Z':
        case 'z':
            return true;
        default:
            return false;
    }
}

std::vector<PathCommand> tokenize(std::string_view data, std::vector<char>& ignored)
{
    std::vector<PathCommand> commands;
    bool skipping = false; // 当前命令不支持时，丢弃后续数值

    size_t pos = 0;
    while (pos < data.size())
    {
        const char ch = data[pos];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == ',')
        {
            ++pos;
            continue;
        }

        if (isCommandChar(ch))
        {
            if (isSupportedCommand(ch))
            {
                commands.push_back(PathCommand{.type = ch, .values = {}});
                skipping = false;
            }
            else
            {
                ignored.push_back(ch);
                skipping = true;
            }
            ++pos;
            continue;
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(data.data() + pos, data.data() + data.size(), value);
        if (ec != std::errc{} || ptr == data.data() + pos)
        {
            // 非法字符按 0 处理并跳过
            value = 0.0;
            ++pos;
        }
        else
        {
            pos = static_cast<size_t>(ptr - data.data());
        }

        if (!skipping && !commands.empty())
        {
            commands.back().values.push_back(value);
        }
    }
    return commands;
}

double valueAt(const std::vector<double>& values, size_t index)
{
    return index < values.size() ? values[index] : 0.0;
}

void addVertex(BezierPath& path, const Vec2& point)
{
    path.vertices.push_back(point);
    path.inHandles.push_back(point);
    path.outHandles.push_back(point);
}

BezierPath startPath(const Vec2& origin)
{
    BezierPath path;
    path.closed = false;
    addVertex(path, origin);
    return path;
}

bool isStraight(const Vec2& from, const Vec2& fromOut, const Vec2& toIn, const Vec2& to)
{
    return fromOut == from && toIn == to;
}

std::string point(const Vec2& p)
{
    return formatNumber(p.x()) + "," + formatNumber(p.y());
}
} // namespace

PathParseResult parseSvgPathData(std::string_view data)
{
    PathParseResult result;
    auto commands = tokenize(data, result.ignoredCommands);

    // paths 可能扩容，用下标记录当前路径；M 之前的命令隐式从 [0,0] 开始
    std::optional<size_t> currentIndex;
    auto current = [&]() -> BezierPath&
    {
        if (!currentIndex)
        {
            result.paths.push_back(startPath(Vec2{0.0, 0.0}));
            currentIndex = result.paths.size() - 1;
        }
        return result.paths[*currentIndex];
    };

    for (const auto& command : commands)
    {
        const auto& values = command.values;
        switch (command.type)
        {
            case 'M':
            case 'm':
            {
                BezierPath path = startPath(Vec2{valueAt(values, 0), valueAt(values, 1)});
                // M 后的多余坐标对按 L 处理
                for (size_t i = 2; i + 1 < values.size(); i += 2)
                {
                    addVertex(path, Vec2{values[i], values[i + 1]});
                }
                result.paths.push_back(std::move(path));
                currentIndex = result.paths.size() - 1;
                break;
            }
            case 'L':
            case 'l':
            {
                BezierPath& path = current();
                if (values.size() < 2)
                {
                    addVertex(path, Vec2{valueAt(values, 0), valueAt(values, 1)});
                }
                for (size_t i = 0; i + 1 < values.size(); i += 2)
                {
                    addVertex(path, Vec2{values[i], values[i + 1]});
                }
                break;
            }
            case 'C':
            case 'c':
            {
                BezierPath& path = current();
                const size_t groups = std::max<size_t>(1, values.size() / 6);
                for (size_t g = 0; g < groups; ++g)
                {
                    const size_t base = g * 6;
                    // 更新前一个顶点的出控制柄
                    path.outHandles.back() = Vec2{valueAt(values, base), valueAt(values, base + 1)};

                    const Vec2 vertex{valueAt(values, base + 4), valueAt(values, base + 5)};
                    path.vertices.push_back(vertex);
                    path.inHandles.emplace_back(valueAt(values, base + 2), valueAt(values, base + 3));
                    path.outHandles.push_back(vertex);
                }
                break;
            }
            case 'Z':
            case 'z':
                current().closed = true;
                break;
            default:
                break;
        }
    }

    return result;
}

std::optional<std::string_view> extractPathData(std::string_view text)
{
    if (text.starts_with("path(") && text.ends_with(")"))
    {
        return text.substr(5, text.size() - 6);
    }
    if (!text.empty())
    {
        switch (text.front())
        {
            case 'M':
            case 'm':
            case 'Z':
            case 'z':
            case 'L':
            case 'l':
            case 'H':
            case 'h':
            case 'V':
            case 'v':
            case 'C':
            case 'c':
            case 'S':
            case 's':
            case 'Q':
            case 'q':
            case 'T':
            case 't':
            case 'A':
            case 'a':
                return text;
            default:
                break;
        }
    }
    return std::nullopt;
}

std::string toSvgPathData(const BezierPath& path)
{
    const auto& v = path.vertices;
    if (v.empty()) return "";

    auto inHandle = [&](size_t idx) -> const Vec2& { return idx < path.inHandles.size() ? path.inHandles[idx] : v[idx]; };
    auto outHandle = [&](size_t idx) -> const Vec2&
    { return idx < path.outHandles.size() ? path.outHandles[idx] : v[idx]; };

    std::string d = "M" + point(v[0]);
    for (size_t idx = 1; idx < v.size(); ++idx)
    {
        const Vec2& prevV = v[idx - 1];
        const Vec2& prevO = outHandle(idx - 1);
        const Vec2& currI = inHandle(idx);
        const Vec2& currV = v[idx];

        if (isStraight(prevV, prevO, currI, currV))
        {
            d += "L" + point(currV);
        }
        else
        {
            d += "C" + point(prevO) + "," + point(currI) + "," + point(currV);
        }
    }

    if (path.closed.value_or(false))
    {
        const size_t last = v.size() - 1;
        if (!isStraight(v[last], outHandle(last), inHandle(0), v[0]))
        {
            d += "C" + point(outHandle(last)) + "," + point(inHandle(0)) + "," + point(v[0]);
        }
        d += "z";
    }

    return d;
}

std::string toSvgPathData(const PathSet& paths)
{
    std::string d;
    for (const auto& path : paths)
    {
        d += toSvgPathData(path);
    }
    return d;
}

} // namespace animator::interpolation
