/**
 * ************************************************************************
 *
 * @file WarnOnceAdapter.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 目标缺失时只警告一次的适配器包装
    目标元素已经消失时：首次写入记录一条警告，之后对该 id 静默忽略
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include "IPlatformAdapter.h"

namespace animator::engine
{

class WarnOnceAdapter final : public IPlatformAdapter
{
public:
    using TargetLookup = std::function<bool(const std::string&)>;

    /**
     * @param inner 实际执行写入的适配器
     * @param hasTarget 判断目标 id 是否存在
     */
    WarnOnceAdapter(std::shared_ptr<IPlatformAdapter> inner, TargetLookup hasTarget);

    [[nodiscard]] bool isConnected() const override;

    void setAttribute(const std::string& targetId, const std::string& attrName, const std::string& value) override;

    [[nodiscard]] bool hasWarned(const std::string& targetId) const { return m_warned.contains(targetId); }

private:
    std::shared_ptr<IPlatformAdapter> m_inner;
    TargetLookup m_hasTarget;
    std::unordered_set<std::string> m_warned;
};

} // namespace animator::engine
