/**
 * ************************************************************************
 *
 * @file AsioFrameScheduler.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 基于 ASIO steady_timer 的帧调度实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "AsioFrameScheduler.h"
#include <asio.hpp>
#include <chrono>
#include <unordered_map>

namespace animator::engine
{

// Pimpl 实现
struct AsioFrameScheduler::Impl
{
    asio::any_io_executor executor;
    std::chrono::steady_clock::duration interval;
    std::unordered_map<FrameHandle, std::unique_ptr<asio::steady_timer>> timers;
    FrameHandle nextHandle = 1;

    Impl(const asio::any_io_executor& exec, double frameIntervalMs)
        : executor(exec),
          interval(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
              std::chrono::duration<double, std::milli>(frameIntervalMs)))
    {
    }
};

AsioFrameScheduler::AsioFrameScheduler(const asio::any_io_executor& exec, double frameIntervalMs)
    : m_impl(std::make_unique<Impl>(exec, frameIntervalMs))
{
}

// 定时器析构时挂起的回调以 operation_aborted 结束，不会再访问 this
AsioFrameScheduler::~AsioFrameScheduler() = default;

double AsioFrameScheduler::now() const
{
    const auto elapsed = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

FrameHandle AsioFrameScheduler::requestFrame(FrameCallback callback)
{
    const FrameHandle handle = m_impl->nextHandle++;
    auto timer = std::make_unique<asio::steady_timer>(m_impl->executor, m_impl->interval);

    timer->async_wait(
        [this, handle, callback = std::move(callback)](const asio::error_code& ec) mutable
        {
            if (ec)
            {
                return;
            }
            m_impl->timers.erase(handle);
            callback();
        });

    m_impl->timers.emplace(handle, std::move(timer));
    return handle;
}

void AsioFrameScheduler::cancelFrame(FrameHandle handle)
{
    auto iter = m_impl->timers.find(handle);
    if (iter == m_impl->timers.end())
    {
        return;
    }
    iter->second->cancel();
    m_impl->timers.erase(iter);
}

std::size_t AsioFrameScheduler::pendingCount() const
{
    return m_impl->timers.size();
}

} // namespace animator::engine
