/**
 * ************************************************************************
 *
 * @file IAnimationEngine.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-10
 * @version 0.1
 * @brief 播放引擎统一接口
    原生时间线与帧循环两种后端对外暴露相同的控制接口
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <functional>
#include <optional>

namespace animator::engine
{

/**
 * @brief 生命周期回调，均可为空，在调度线程上同步触发
 */
struct AnimatorCallbacks
{
    std::function<void()> onPlay;
    std::function<void()> onPause;
    std::function<void()> onCancel;
    std::function<void()> onFinish;
    std::function<void()> onRemove;
};

class IAnimationEngine
{
public:
    IAnimationEngine() = default;
    IAnimationEngine(const IAnimationEngine&) = delete;
    IAnimationEngine& operator=(const IAnimationEngine&) = delete;
    IAnimationEngine(IAnimationEngine&&) = delete;
    IAnimationEngine& operator=(IAnimationEngine&&) = delete;
    virtual ~IAnimationEngine() = default;

    [[nodiscard]] virtual bool isReady() const = 0;
    [[nodiscard]] virtual bool isPlaying() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void cancel() = 0;
    virtual void finish() = 0;

    /**
     * @brief 设置播放速率，0 与非有限值被拒绝并记录警告
     */
    virtual void setPlaybackRate(double rate) = 0;

    /**
     * @brief 当前播放时间（毫秒），销毁后或无可用时间时返回 std::nullopt
     */
    [[nodiscard]] virtual std::optional<double> getCurrentTime() const = 0;

    /**
     * @brief 跳转，时间被约束到 [0, 总时长]
     */
    virtual void setCurrentTime(double timeMs) = 0;

    /**
     * @brief 等价于 cancel() 并释放资源，之后所有调用均为空操作
     */
    virtual void destroy() = 0;
};

/**
 * @brief 安全触发回调
 */
inline void invokeCallback(const std::function<void()>& callback)
{
    if (callback)
    {
        callback();
    }
}

} // namespace animator::engine
