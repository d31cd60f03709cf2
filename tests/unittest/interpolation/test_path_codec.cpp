/**
 * ************************************************************************
 *
 * @file test_path_codec.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-16
 * @version 0.1
 * @brief 路径编解码单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/interpolation/PathCodec.h"

using namespace animator;
using namespace animator::interpolation;

// 测试 1: 直线路径
TEST(PathCodecTest, ParsesMoveAndLines)
{
    const auto result = parseSvgPathData("M0,0 L10,0 L10,10 Z");
    ASSERT_EQ(result.paths.size(), 1U);
    const auto& path = result.paths.front();
    ASSERT_EQ(path.vertices.size(), 3U);
    EXPECT_EQ(path.vertices[2], Vec2(10.0, 10.0));
    EXPECT_EQ(path.inHandles[1], path.vertices[1]);
    ASSERT_TRUE(path.closed.has_value());
    EXPECT_TRUE(*path.closed);
    EXPECT_TRUE(result.ignoredCommands.empty());
}

// 测试 2: 曲线设置前一顶点的出控制柄
TEST(PathCodecTest, CurveSetsHandles)
{
    const auto result = parseSvgPathData("M0 0 C 1 2 3 4 5 6");
    ASSERT_EQ(result.paths.size(), 1U);
    const auto& path = result.paths.front();
    ASSERT_EQ(path.vertices.size(), 2U);
    EXPECT_EQ(path.outHandles[0], Vec2(1.0, 2.0));
    EXPECT_EQ(path.inHandles[1], Vec2(3.0, 4.0));
    EXPECT_EQ(path.vertices[1], Vec2(5.0, 6.0));
    EXPECT_FALSE(path.closed.value_or(true));
}

// 测试 3: 不支持的命令被忽略
TEST(PathCodecTest, IgnoresUnsupportedCommands)
{
    const auto result = parseSvgPathData("M0,0 H10 V10 L5,5");
    ASSERT_EQ(result.paths.size(), 1U);
    EXPECT_EQ(result.paths.front().vertices.size(), 2U);
    ASSERT_EQ(result.ignoredCommands.size(), 2U);
    EXPECT_EQ(result.ignoredCommands[0], 'H');
    EXPECT_EQ(result.ignoredCommands[1], 'V');
}

// 测试 4: 多个 M 产生多条子路径，科学计数法数值
TEST(PathCodecTest, MultipleSubpaths)
{
    const auto result = parseSvgPathData("M0,0L1e1,0M5,5L6,6");
    ASSERT_EQ(result.paths.size(), 2U);
    EXPECT_EQ(result.paths[0].vertices[1], Vec2(10.0, 0.0));
    EXPECT_EQ(result.paths[1].vertices[0], Vec2(5.0, 5.0));
}

// 测试 5: path(...) 包装与裸路径
TEST(PathCodecTest, ExtractPathData)
{
    EXPECT_EQ(extractPathData("path(M0,0 L1,1)"), std::optional<std::string_view>("M0,0 L1,1"));
    EXPECT_EQ(extractPathData("M0,0"), std::optional<std::string_view>("M0,0"));
    EXPECT_FALSE(extractPathData("red").has_value());
    EXPECT_FALSE(extractPathData("").has_value());
}

// 测试 6: 序列化区分直线与曲线
TEST(PathCodecTest, SerializesLinesAndCurves)
{
    const auto lines = parseSvgPathData("M0,0 L10,0 L10,10 Z");
    EXPECT_EQ(toSvgPathData(lines.paths), "M0,0L10,0L10,10z");

    const auto curve = parseSvgPathData("M0,0 C1,2 3,4 5,6");
    EXPECT_EQ(toSvgPathData(curve.paths), "M0,0C1,2,3,4,5,6");
}

// 测试 7: 闭合段不是直线时补一段曲线
TEST(PathCodecTest, ClosingCurveSegment)
{
    BezierPath path;
    path.vertices = {Vec2(0.0, 0.0), Vec2(10.0, 0.0)};
    path.inHandles = {Vec2(-5.0, 5.0), Vec2(10.0, 0.0)};
    path.outHandles = {Vec2(0.0, 0.0), Vec2(15.0, 5.0)};
    path.closed = true;

    EXPECT_EQ(toSvgPathData(path), "M0,0L10,0C15,5,-5,5,0,0z");
}
