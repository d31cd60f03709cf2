/**
 * ************************************************************************
 *
 * @file test_asio_frame_scheduler.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-21
 * @version 0.1
 * @brief 基于 asio 定时器的帧调度器单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <asio.hpp>
#include <functional>
#include <memory>
#include <vector>
#include "src/engine/AsioFrameScheduler.h"

using namespace animator::engine;

class AsioFrameSchedulerTest : public ::testing::Test
{
protected:
    asio::io_context m_io;
};

// 测试 1: 回调在下一帧执行一次
TEST_F(AsioFrameSchedulerTest, RunsCallbackOnce)
{
    AsioFrameScheduler scheduler(m_io.get_executor(), 1.0);
    int calls = 0;

    const auto handle = scheduler.requestFrame([&calls]() { calls++; });
    EXPECT_NE(handle, 0U);
    EXPECT_EQ(scheduler.pendingCount(), 1U);
    EXPECT_EQ(calls, 0);

    m_io.run();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler.pendingCount(), 0U);
}

// 测试 2: 取消的帧不执行
TEST_F(AsioFrameSchedulerTest, CancelledFrameDoesNotRun)
{
    AsioFrameScheduler scheduler(m_io.get_executor(), 1.0);
    int calls = 0;

    const auto cancelled = scheduler.requestFrame([&calls]() { calls += 10; });
    scheduler.requestFrame([&calls]() { calls++; });
    scheduler.cancelFrame(cancelled);
    scheduler.cancelFrame(cancelled);
    scheduler.cancelFrame(9999);
    EXPECT_EQ(scheduler.pendingCount(), 1U);

    m_io.run();
    EXPECT_EQ(calls, 1);
}

// 测试 3: 回调中再次请求形成帧循环
TEST_F(AsioFrameSchedulerTest, CallbackCanRequestNextFrame)
{
    AsioFrameScheduler scheduler(m_io.get_executor(), 1.0);
    int frames = 0;
    std::vector<double> stamps;

    std::function<void()> frame = [&]()
    {
        stamps.push_back(scheduler.now());
        if (++frames < 3)
        {
            scheduler.requestFrame([&frame]() { frame(); });
        }
    };
    scheduler.requestFrame([&frame]() { frame(); });

    m_io.run();
    EXPECT_EQ(frames, 3);
    ASSERT_EQ(stamps.size(), 3U);
    EXPECT_LE(stamps[0], stamps[1]);
    EXPECT_LE(stamps[1], stamps[2]);
}

// 测试 4: 调度器先于事件循环销毁时挂起的回调不执行
TEST_F(AsioFrameSchedulerTest, DestroyedSchedulerDropsPendingFrames)
{
    int calls = 0;
    {
        AsioFrameScheduler scheduler(m_io.get_executor(), 1.0);
        scheduler.requestFrame([&calls]() { calls++; });
    }
    m_io.run();
    EXPECT_EQ(calls, 0);
}
