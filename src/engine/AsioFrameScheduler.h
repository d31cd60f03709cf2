/**
 * ************************************************************************
 *
 * @file AsioFrameScheduler.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 基于 ASIO steady_timer 的帧调度实现
    在 io_context 所在线程上以固定帧间隔派发回调
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <memory>
#include "IFrameScheduler.h"

// 前向声明
namespace asio
{
class any_io_executor;
}

namespace animator::engine
{

class AsioFrameScheduler final : public IFrameScheduler
{
public:
    static constexpr double DEFAULT_FRAME_INTERVAL_MS = 1000.0 / 60.0;

    explicit AsioFrameScheduler(const asio::any_io_executor& exec, double frameIntervalMs = DEFAULT_FRAME_INTERVAL_MS);
    ~AsioFrameScheduler() override;

    [[nodiscard]] double now() const override;

    FrameHandle requestFrame(FrameCallback callback) override;

    void cancelFrame(FrameHandle handle) override;

    /**
     * @brief 当前尚未执行的帧请求数量
     */
    [[nodiscard]] std::size_t pendingCount() const;

private:
    // Pimpl 模式：隐藏 ASIO 实现
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace animator::engine
