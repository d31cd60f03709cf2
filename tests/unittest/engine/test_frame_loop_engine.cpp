/**
 * ************************************************************************
 *
 * @file test_frame_loop_engine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-20
 * @version 0.1
 * @brief 帧循环引擎单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <memory>
#include "src/engine/FrameLoopEngine.h"
#include "ManualFrameScheduler.h"
#include "RecordingAdapter.h"

using namespace animator;
using namespace animator::engine;
using ::testing::_;
using ::testing::Return;

namespace
{
model::Binding translateBinding()
{
    model::PropertyAnimation translate{
        .property = "translate",
        .keyframes = {model::Keyframe{.t = 0.0, .v = std::vector<double>{200.0, 100.0}},
                      model::Keyframe{.t = 128.0, .v = std::vector<double>{200.0, 200.0}}},
    };
    return model::Binding{.targetId = "box", .animation = {translate}};
}

model::Binding linearBinding(std::string targetId, std::string property, double durationMs)
{
    model::PropertyAnimation track{
        .property = std::move(property),
        .keyframes = {model::Keyframe{.t = 0.0, .v = 0.0}, model::Keyframe{.t = durationMs, .v = durationMs}},
    };
    return model::Binding{.targetId = std::move(targetId), .animation = {track}};
}

struct CallbackCounts
{
    int play = 0;
    int pause = 0;
    int cancel = 0;
    int finish = 0;
};
} // namespace

class FrameLoopEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_adapter = std::make_shared<RecordingAdapter>();
        m_scheduler = std::make_shared<ManualFrameScheduler>();
    }

    std::unique_ptr<FrameLoopEngine> makeEngine(model::PlaybackConfig config, std::vector<model::Binding> bindings)
    {
        model::NormalizedDocument document;
        document.config = config;
        document.bindings = std::move(bindings);

        AnimatorCallbacks callbacks{
            .onPlay = [this]() { m_counts.play++; },
            .onPause = [this]() { m_counts.pause++; },
            .onCancel = [this]() { m_counts.cancel++; },
            .onFinish = [this]() { m_counts.finish++; },
        };
        return std::make_unique<FrameLoopEngine>(std::move(document), m_adapter, m_scheduler, std::move(callbacks));
    }

    std::unique_ptr<FrameLoopEngine> makeTranslateEngine(model::Direction direction = model::Direction::Normal)
    {
        model::PlaybackConfig config;
        config.durationMs = 128.0;
        config.direction = direction;
        return makeEngine(config, {translateBinding()});
    }

    [[nodiscard]] std::optional<std::string> transform() const { return m_adapter->latest("box", "transform"); }

    std::shared_ptr<RecordingAdapter> m_adapter;
    std::shared_ptr<ManualFrameScheduler> m_scheduler;
    CallbackCounts m_counts;
};

// 测试 1: 平移动画完整播放一次，结束时只通知一次
TEST_F(FrameLoopEngineTest, PlaysTranslateToCompletion)
{
    auto engine = makeTranslateEngine();
    EXPECT_EQ(m_adapter->writeCount(), 0U);

    engine->play();
    EXPECT_EQ(m_counts.play, 1);
    EXPECT_TRUE(engine->isPlaying());

    m_scheduler->step(0.0);
    EXPECT_EQ(transform(), "translate(200,100)");

    m_scheduler->step(64.0);
    EXPECT_EQ(transform(), "translate(200,150)");

    m_scheduler->step(64.0);
    EXPECT_EQ(transform(), "translate(200,200)");
    EXPECT_EQ(m_counts.finish, 1);
    EXPECT_FALSE(engine->isPlaying());
    EXPECT_EQ(m_scheduler->pendingCount(), 0U);

    m_scheduler->step(100.0);
    EXPECT_EQ(m_counts.finish, 1);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 128.0);
}

// 测试 2: 交替方向的多次迭代
TEST_F(FrameLoopEngineTest, AlternateIterations)
{
    model::PlaybackConfig config;
    config.durationMs = 100.0;
    config.iterations = 3.0;
    config.direction = model::Direction::Alternate;
    auto engine = makeEngine(config, {linearBinding("dot", "x", 100.0)});

    engine->setCurrentTime(150.0);
    EXPECT_EQ(m_adapter->latest("dot", "x"), "50");

    engine->setCurrentTime(120.0);
    EXPECT_EQ(m_adapter->latest("dot", "x"), "80");

    engine->setCurrentTime(250.0);
    EXPECT_EQ(m_adapter->latest("dot", "x"), "50");

    engine->setCurrentTime(300.0);
    EXPECT_EQ(m_adapter->latest("dot", "x"), "100");
}

// 测试 3: 反向播放是正向的镜像
TEST_F(FrameLoopEngineTest, ReverseDirectionMirrorsNormal)
{
    auto engine = makeTranslateEngine(model::Direction::Reverse);
    engine->setCurrentTime(32.0);
    EXPECT_EQ(transform(), "translate(200,175)");

    engine->setCurrentTime(0.0);
    EXPECT_EQ(transform(), "translate(200,200)");
}

// 测试 4: 暂停冻结时间，重复暂停不改变状态
TEST_F(FrameLoopEngineTest, PauseFreezesTime)
{
    auto engine = makeTranslateEngine();
    engine->play();
    m_scheduler->step(40.0);

    engine->pause();
    EXPECT_EQ(m_counts.pause, 1);
    EXPECT_FALSE(engine->isPlaying());
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 40.0);
    EXPECT_EQ(m_scheduler->pendingCount(), 0U);

    m_scheduler->step(50.0);
    engine->pause();
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 40.0);
    EXPECT_DOUBLE_EQ(engine->state().accumulatedMs, 40.0);

    // 恢复后从暂停处继续
    engine->play();
    m_scheduler->step(24.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 64.0);
    EXPECT_EQ(transform(), "translate(200,150)");
}

// 测试 5: finish 跳到终点且只通知一次，cancel 之后可以再次通知
TEST_F(FrameLoopEngineTest, FinishSignalsOnce)
{
    auto engine = makeTranslateEngine();
    engine->play();
    engine->finish();
    engine->finish();

    EXPECT_EQ(m_counts.finish, 1);
    EXPECT_FALSE(engine->isPlaying());
    EXPECT_EQ(transform(), "translate(200,200)");
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 128.0);

    engine->cancel();
    EXPECT_EQ(m_counts.cancel, 1);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 0.0);
    EXPECT_EQ(transform(), "translate(200,100)");

    engine->finish();
    EXPECT_EQ(m_counts.finish, 2);
}

// 测试 6: 设置时间被约束到时间轴范围内
TEST_F(FrameLoopEngineTest, SetCurrentTimeClamps)
{
    auto engine = makeTranslateEngine();

    engine->setCurrentTime(37.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 37.0);

    engine->setCurrentTime(-50.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 0.0);

    engine->setCurrentTime(1.0e9);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 128.0);

    engine->setCurrentTime(std::nan(""));
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 0.0);
}

// 测试 7: 播放中的时间单调不减
TEST_F(FrameLoopEngineTest, TimeIsMonotonicWhilePlaying)
{
    model::PlaybackConfig config;
    config.durationMs = 1000.0;
    auto engine = makeEngine(config, {linearBinding("dot", "opacity", 1000.0)});
    engine->play();

    double previous = 0.0;
    for (int frame = 0; frame < 40; ++frame)
    {
        m_scheduler->step(33.0);
        const double now = engine->getCurrentTime().value_or(-1.0);
        EXPECT_GE(now, previous);
        EXPECT_LE(now, 1000.0);
        previous = now;
    }
    EXPECT_DOUBLE_EQ(previous, 1000.0);
    EXPECT_EQ(m_counts.finish, 1);
}

// 测试 8: 渲染面卸载时隐式暂停，不触发 onPause
TEST_F(FrameLoopEngineTest, DisconnectedAdapterStopsLoop)
{
    auto engine = makeTranslateEngine();
    engine->play();
    m_scheduler->step(10.0);

    m_adapter->setConnected(false);
    EXPECT_FALSE(engine->isPlaying());
    const auto writes = m_adapter->writeCount();

    m_scheduler->step(10.0);
    EXPECT_EQ(m_adapter->writeCount(), writes);
    EXPECT_EQ(m_scheduler->pendingCount(), 0U);
    EXPECT_EQ(m_counts.pause, 0);
    EXPECT_FALSE(engine->state().isPlaying);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 20.0);
}

// 测试 9: 帧率上限跳过过密的帧
TEST_F(FrameLoopEngineTest, FrameRateCapThrottlesRendering)
{
    model::PlaybackConfig config;
    config.durationMs = 1000.0;
    config.frameRateCapHz = 10.0;
    auto engine = makeEngine(config, {linearBinding("dot", "opacity", 1000.0)});
    engine->play();

    m_scheduler->step(0.0);
    EXPECT_EQ(m_adapter->writeCount(), 1U);

    m_scheduler->step(50.0);
    EXPECT_EQ(m_adapter->writeCount(), 1U);

    m_scheduler->step(50.0);
    EXPECT_EQ(m_adapter->writeCount(), 2U);
    EXPECT_EQ(m_adapter->latest("dot", "opacity"), "100");
}

// 测试 10: 播放速率
TEST_F(FrameLoopEngineTest, PlaybackRate)
{
    model::PlaybackConfig config;
    config.durationMs = 1000.0;
    auto engine = makeEngine(config, {linearBinding("dot", "opacity", 1000.0)});

    engine->setPlaybackRate(0.0);
    engine->setPlaybackRate(std::nan(""));
    EXPECT_DOUBLE_EQ(engine->state().playbackRate, 1.0);

    engine->play();
    m_scheduler->step(10.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 10.0);

    engine->setPlaybackRate(2.0);
    m_scheduler->step(10.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 30.0);
    EXPECT_DOUBLE_EQ(engine->state().playbackRate, 2.0);
}

// 测试 11: 正延迟在开始前保持第 0 帧
TEST_F(FrameLoopEngineTest, PositiveDelayHoldsFirstFrame)
{
    model::PlaybackConfig config;
    config.durationMs = 128.0;
    config.delayMs = 50.0;
    auto engine = makeEngine(config, {translateBinding()});
    EXPECT_EQ(transform(), "translate(200,100)");

    engine->play();
    m_scheduler->step(30.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 0.0);

    m_scheduler->step(40.0);
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 20.0);
}

// 测试 12: 负延迟在构造时已经前进
TEST_F(FrameLoopEngineTest, NegativeDelayStartsAhead)
{
    model::PlaybackConfig config;
    config.durationMs = 128.0;
    config.delayMs = -64.0;
    auto engine = makeEngine(config, {translateBinding()});

    EXPECT_EQ(transform(), "translate(200,150)");
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 64.0);
}

// 测试 13: 无限循环时 finish 保持当前时间
TEST_F(FrameLoopEngineTest, FinishOnInfiniteKeepsTime)
{
    model::PlaybackConfig config;
    config.durationMs = 100.0;
    config.iterations = model::INFINITE_ITERATIONS;
    auto engine = makeEngine(config, {linearBinding("dot", "x", 100.0)});
    engine->play();
    m_scheduler->step(250.0);
    EXPECT_TRUE(engine->isPlaying());

    engine->finish();
    EXPECT_DOUBLE_EQ(engine->getCurrentTime().value_or(-1.0), 250.0);
    EXPECT_FALSE(engine->isPlaying());
    EXPECT_EQ(m_adapter->latest("dot", "x"), "50");
}

// 测试 14: 销毁后所有操作无效
TEST_F(FrameLoopEngineTest, DestroyIsTerminal)
{
    auto engine = makeTranslateEngine();
    EXPECT_EQ(engine->bindingCount(), 1U);
    engine->play();

    engine->destroy();
    EXPECT_EQ(m_counts.cancel, 1);
    EXPECT_FALSE(engine->isReady());
    EXPECT_FALSE(engine->isPlaying());
    EXPECT_FALSE(engine->getCurrentTime().has_value());
    EXPECT_EQ(engine->bindingCount(), 0U);
    EXPECT_EQ(m_scheduler->pendingCount(), 0U);

    const auto writes = m_adapter->writeCount();
    engine->play();
    engine->setCurrentTime(10.0);
    engine->destroy();
    EXPECT_EQ(m_counts.play, 1);
    EXPECT_EQ(m_counts.cancel, 1);
    EXPECT_EQ(m_adapter->writeCount(), writes);
}

// 测试 15: 每帧每个属性只写一次
TEST(FrameLoopEngineMockTest, WritesEachAttributeOncePerFrame)
{
    auto adapter = std::make_shared<MockPlatformAdapter>();
    auto scheduler = std::make_shared<ManualFrameScheduler>();
    EXPECT_CALL(*adapter, isConnected()).WillRepeatedly(Return(true));
    EXPECT_CALL(*adapter, setAttribute("box", "transform", "translate(200,100)")).Times(1);
    EXPECT_CALL(*adapter, setAttribute("box", "transform", "translate(200,150)")).Times(1);
    EXPECT_CALL(*adapter, setAttribute(_, "opacity", _)).Times(0);

    model::NormalizedDocument document;
    document.config.durationMs = 128.0;
    document.bindings = {translateBinding()};
    FrameLoopEngine engine(std::move(document), adapter, scheduler);

    engine.play();
    scheduler->step(0.0);
    scheduler->step(64.0);
}
