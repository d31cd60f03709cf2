/**
 * ************************************************************************
 *
 * @file IPlatformAdapter.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 平台适配器抽象
    引擎不直接接触任何元素，计算出的属性值全部通过适配器写出
    目标 id 的解析由适配器负责
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>

namespace animator::engine
{

class IPlatformAdapter
{
public:
    IPlatformAdapter() = default;
    IPlatformAdapter(const IPlatformAdapter&) = default;
    IPlatformAdapter& operator=(const IPlatformAdapter&) = delete;
    IPlatformAdapter(IPlatformAdapter&&) = default;
    IPlatformAdapter& operator=(IPlatformAdapter&&) = default;
    virtual ~IPlatformAdapter() = default;

    /**
     * @brief 目标渲染面是否仍然挂载，返回 false 时帧循环隐式暂停
     */
    [[nodiscard]] virtual bool isConnected() const = 0;

    /**
     * @brief 写入一个属性值，每帧每个 (元素, 属性) 调用一次
     */
    virtual void setAttribute(const std::string& targetId, const std::string& attrName, const std::string& value) = 0;
};

} // namespace animator::engine
