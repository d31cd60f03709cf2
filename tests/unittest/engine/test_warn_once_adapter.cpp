/**
 * ************************************************************************
 *
 * @file test_warn_once_adapter.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-21
 * @version 0.1
 * @brief 目标缺失时只警告一次的适配器单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <set>
#include "src/engine/WarnOnceAdapter.h"
#include "RecordingAdapter.h"

using namespace animator::engine;
using ::testing::_;
using ::testing::Return;

// 测试 1: 已知目标的写入原样转发
TEST(WarnOnceAdapterTest, ForwardsKnownTargets)
{
    auto inner = std::make_shared<MockPlatformAdapter>();
    EXPECT_CALL(*inner, setAttribute("a", "opacity", "0.5")).Times(1);

    WarnOnceAdapter adapter(inner, [](const std::string& id) { return id == "a"; });
    adapter.setAttribute("a", "opacity", "0.5");
    EXPECT_FALSE(adapter.hasWarned("a"));
}

// 测试 2: 缺失目标被丢弃，只记录一次
TEST(WarnOnceAdapterTest, DropsMissingTargetsAndWarnsOnce)
{
    auto inner = std::make_shared<MockPlatformAdapter>();
    EXPECT_CALL(*inner, setAttribute("gone", _, _)).Times(0);

    WarnOnceAdapter adapter(inner, [](const std::string& id) { return id != "gone"; });
    EXPECT_FALSE(adapter.hasWarned("gone"));
    adapter.setAttribute("gone", "x", "1");
    adapter.setAttribute("gone", "y", "2");
    EXPECT_TRUE(adapter.hasWarned("gone"));
}

// 测试 3: 连接状态跟随内部适配器
TEST(WarnOnceAdapterTest, ConnectionFollowsInner)
{
    auto inner = std::make_shared<RecordingAdapter>();
    WarnOnceAdapter adapter(inner, {});
    EXPECT_TRUE(adapter.isConnected());

    inner->setConnected(false);
    EXPECT_FALSE(adapter.isConnected());

    WarnOnceAdapter detached(nullptr, {});
    EXPECT_FALSE(detached.isConnected());
    detached.setAttribute("a", "x", "1");
}

// 测试 4: 没有查询函数时全部转发
TEST(WarnOnceAdapterTest, ForwardsEverythingWithoutLookup)
{
    auto inner = std::make_shared<RecordingAdapter>();
    WarnOnceAdapter adapter(inner, {});
    adapter.setAttribute("anything", "fill", "red");
    EXPECT_EQ(inner->latest("anything", "fill"), "red");
}
