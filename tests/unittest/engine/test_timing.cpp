/**
 * ************************************************************************
 *
 * @file test_timing.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-19
 * @version 0.1
 * @brief 迭代进度与时间约束单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "src/engine/Timing.h"

using namespace animator::engine;
using animator::model::Direction;

constexpr double INF = std::numeric_limits<double>::infinity();

// 测试 1: 正向播放，迭代边界停在上一次迭代末尾
TEST(TimingTest, NormalDirectionProgress)
{
    auto p = computeProgress(250.0, 1000.0, 1.0, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 0.0);
    EXPECT_DOUBLE_EQ(p.effectiveProgress, 0.25);

    p = computeProgress(1000.0, 1000.0, 1.0, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 0.0);
    EXPECT_DOUBLE_EQ(p.effectiveProgress, 1.0);

    p = computeProgress(0.0, 1000.0, 3.0, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 0.0);
    EXPECT_DOUBLE_EQ(p.effectiveProgress, 0.0);
}

// 测试 2: 多次迭代与超出总时长
TEST(TimingTest, IterationIndexIsClamped)
{
    auto p = computeProgress(1500.0, 1000.0, 3.0, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 1.0);
    EXPECT_DOUBLE_EQ(p.rawProgress, 0.5);

    p = computeProgress(9000.0, 1000.0, 3.0, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 2.0);
    EXPECT_DOUBLE_EQ(p.rawProgress, 1.0);

    p = computeProgress(4250.0, 1000.0, INF, Direction::Normal);
    EXPECT_DOUBLE_EQ(p.iteration, 4.0);
    EXPECT_DOUBLE_EQ(p.rawProgress, 0.25);
}

// 测试 3: 反向播放满足 E_reverse(t) = 1 - E_normal(t)
TEST(TimingTest, ReverseIsMirrorOfNormal)
{
    for (double t : {0.0, 120.0, 500.0, 999.0, 1000.0, 1730.0})
    {
        EXPECT_DOUBLE_EQ(computeEffectiveProgress(t, 1000.0, 2.0, Direction::Reverse),
                         1.0 - computeEffectiveProgress(t, 1000.0, 2.0, Direction::Normal))
            << "t=" << t;
    }
}

// 测试 4: 交替播放在奇数次迭代反向
TEST(TimingTest, AlternateDirections)
{
    EXPECT_DOUBLE_EQ(computeEffectiveProgress(250.0, 1000.0, 4.0, Direction::Alternate), 0.25);
    EXPECT_DOUBLE_EQ(computeEffectiveProgress(1250.0, 1000.0, 4.0, Direction::Alternate), 0.75);
    EXPECT_DOUBLE_EQ(computeEffectiveProgress(2250.0, 1000.0, 4.0, Direction::Alternate), 0.25);

    EXPECT_DOUBLE_EQ(computeEffectiveProgress(250.0, 1000.0, 4.0, Direction::AlternateReverse), 0.75);
    EXPECT_DOUBLE_EQ(computeEffectiveProgress(1250.0, 1000.0, 4.0, Direction::AlternateReverse), 0.25);
}

// 测试 5: 非法时长不产生进度
TEST(TimingTest, ZeroDurationYieldsZero)
{
    const auto p = computeProgress(500.0, 0.0, 1.0, Direction::Reverse);
    EXPECT_DOUBLE_EQ(p.iteration, 0.0);
    EXPECT_DOUBLE_EQ(p.effectiveProgress, 0.0);
}

// 测试 6: 延迟换算为起始时间
TEST(TimingTest, InitialTimeFromDelay)
{
    EXPECT_DOUBLE_EQ(initialTimeFromDelay(0.0, 1000.0), 0.0);
    EXPECT_DOUBLE_EQ(initialTimeFromDelay(300.0, 1000.0), -300.0);
    EXPECT_DOUBLE_EQ(initialTimeFromDelay(-500.0, 1000.0), 500.0);
    EXPECT_DOUBLE_EQ(initialTimeFromDelay(-2500.0, 1000.0), 500.0);
}

// 测试 7: 时间约束
TEST(TimingTest, ClampToTimeline)
{
    EXPECT_DOUBLE_EQ(clampToTimeline(-20.0, 1000.0), 0.0);
    EXPECT_DOUBLE_EQ(clampToTimeline(std::nan(""), 1000.0), 0.0);
    EXPECT_DOUBLE_EQ(clampToTimeline(1500.0, 1000.0), 1000.0);
    EXPECT_DOUBLE_EQ(clampToTimeline(1500.0, INF), 1500.0);
    EXPECT_DOUBLE_EQ(clampToTimeline(400.0, 1000.0), 400.0);
}
