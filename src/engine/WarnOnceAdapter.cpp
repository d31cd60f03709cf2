/**
 * ************************************************************************
 *
 * @file WarnOnceAdapter.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-09
 * @version 0.1
 * @brief 目标缺失时只警告一次的适配器包装实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "WarnOnceAdapter.h"
#include "src/utils/Logger.h"

namespace animator::engine
{
using utils::Logger;

WarnOnceAdapter::WarnOnceAdapter(std::shared_ptr<IPlatformAdapter> inner, TargetLookup hasTarget)
    : m_inner(std::move(inner)), m_hasTarget(std::move(hasTarget))
{
}

bool WarnOnceAdapter::isConnected() const
{
    return m_inner != nullptr && m_inner->isConnected();
}

void WarnOnceAdapter::setAttribute(const std::string& targetId, const std::string& attrName, const std::string& value)
{
    if (m_inner == nullptr) return;

    if (m_hasTarget && !m_hasTarget(targetId))
    {
        if (m_warned.insert(targetId).second)
        {
            Logger::warn("setAttribute: no element found for id \"{}\"", targetId);
        }
        return;
    }

    m_inner->setAttribute(targetId, attrName, value);
}

} // namespace animator::engine
