/**
 * ************************************************************************
 *
 * @file test_cubic_bezier.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-16
 * @version 0.1
 * @brief 三次贝塞尔缓动单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "src/interpolation/CubicBezier.h"

using namespace animator;
using namespace animator::interpolation;

// 测试 1: 端点
TEST(CubicBezierTest, EndpointsAreExact)
{
    const CubicBezierEasing ease({0.25, 0.1, 0.25, 1.0});
    EXPECT_DOUBLE_EQ(ease(0.0), 0.0);
    EXPECT_DOUBLE_EQ(ease(1.0), 1.0);
    EXPECT_DOUBLE_EQ(ease(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(ease(2.0), 1.0);
}

// 测试 2: 线性曲线
TEST(CubicBezierTest, LinearCurveIsIdentity)
{
    for (double x : {0.1, 0.25, 0.5, 0.75, 0.9})
    {
        EXPECT_NEAR(solveCubicBezierEasing({0.0, 0.0, 1.0, 1.0}, x), x, 1e-5);
    }
}

// 测试 3: ease-in-out 关于中点对称
TEST(CubicBezierTest, EaseInOutIsSymmetric)
{
    const CubicBezierEasing ease({0.42, 0.0, 0.58, 1.0});
    EXPECT_NEAR(ease(0.5), 0.5, 1e-5);
    EXPECT_NEAR(ease(0.2) + ease(0.8), 1.0, 1e-5);
    EXPECT_LT(ease(0.2), 0.2);
}

// 测试 4: 导数接近 0 时走二分路径
TEST(CubicBezierTest, FlatStartUsesBisection)
{
    const CubicBezierEasing ease({0.0, 0.0, 0.0, 1.0});
    const double y = ease(0.5);
    EXPECT_GT(y, 0.5);
    EXPECT_LE(y, 1.0);
}

// 测试 5: 回弹曲线允许超出 1
TEST(CubicBezierTest, OvershootCurve)
{
    const CubicBezierEasing ease({0.34, 1.56, 0.64, 1.0});
    EXPECT_GT(ease(0.6), 1.0);
}

// 测试 6: 关键字缓动
TEST(CubicBezierTest, NamedEasings)
{
    const auto easeIn = namedEasing("ease-in");
    ASSERT_TRUE(easeIn.has_value());
    EXPECT_DOUBLE_EQ((*easeIn)[0], 0.42);
    EXPECT_EQ(namedEasing("easeInOut"), namedEasing("ease-in-out"));
    EXPECT_FALSE(namedEasing("bounce").has_value());
}
