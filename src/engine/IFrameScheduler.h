/**
 * ************************************************************************
 *
 * @file IFrameScheduler.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 帧调度抽象
    单线程协作式调度，与显示刷新同步
    requestFrame 的回调只触发一次，需要持续运行时由回调内部再次请求
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <functional>

namespace animator::engine
{
using FrameHandle = std::uint64_t;
using FrameCallback = std::move_only_function<void()>;

class IFrameScheduler
{
public:
    IFrameScheduler() = default;
    IFrameScheduler(const IFrameScheduler&) = delete;
    IFrameScheduler& operator=(const IFrameScheduler&) = delete;
    IFrameScheduler(IFrameScheduler&&) = default;
    IFrameScheduler& operator=(IFrameScheduler&&) = default;
    virtual ~IFrameScheduler() = default;

    /**
     * @brief 单调时钟，单位毫秒
     */
    [[nodiscard]] virtual double now() const = 0;

    /**
     * @brief 在下一帧执行回调
     * @return 用于取消的句柄，非 0
     */
    virtual FrameHandle requestFrame(FrameCallback callback) = 0;

    /**
     * @brief 取消尚未执行的回调，句柄无效或已执行时无操作
     */
    virtual void cancelFrame(FrameHandle handle) = 0;
};

} // namespace animator::engine
