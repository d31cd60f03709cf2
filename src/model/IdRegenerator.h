/**
 * ************************************************************************
 *
 * @file IdRegenerator.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 节点 id 重新生成与引用改写
    同一文档创建多个实例时，各实例的元素 id 互不冲突
    分两步执行:
    1. 遍历节点树，为每个 id 生成新值，记录 旧 -> 新 映射
    2. 再次遍历，改写所有引用旧 id 的字符串属性
        - href / xlink:href 中的 "#id"
        - fill / stroke / clip-path / mask / marker / filter 等属性中的 "url(#id)"
        - baseId / targetId / boundElementId 中的裸 id
        - 其它字符串及 style 对象中出现的 "url(#id)"
    animate 字段是动画数据，不参与改写
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include "Document.h"
#include "src/utils/IdGenerator.h"

namespace animator::model
{
using IdMap = std::unordered_map<std::string, std::string>;

class IdRegenerator
{
public:
    /**
     * @param generator 为空时使用 utils::GenerateUniqueId
     */
    explicit IdRegenerator(utils::IdGenerator generator = {});

    /**
     * @brief 返回节点树的副本，id 全部替换为新值，引用同步改写
     * 输入节点树保持不变
     */
    [[nodiscard]] Node regenerate(const Node& root);

    /**
     * @brief 第一步：为树中所有 id 生成新值（原地修改）
     */
    void collectIds(Node& node);

    /**
     * @brief 第二步：改写引用（原地修改）
     */
    void rewriteReferences(Node& node) const;

    /**
     * @brief 通过映射查找新 id，不存在时返回原值
     */
    [[nodiscard]] std::string translate(const std::string& oldId) const;

    [[nodiscard]] std::string generate() const { return m_generator(); }

    [[nodiscard]] const IdMap& mapping() const { return m_idMap; }

private:
    void rewriteJson(Json& object) const;
    void rewriteString(std::string_view key, Json& value) const;

    utils::IdGenerator m_generator;
    IdMap m_idMap;
};

/**
 * @brief 替换字符串中所有 url(#old) 为 url(#new)，映射中没有的 id 保持不变
 */
[[nodiscard]] std::string replaceUrlRefs(std::string_view value, const IdMap& ids);

} // namespace animator::model
