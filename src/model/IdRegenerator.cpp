/**
 * ************************************************************************
 *
 * @file IdRegenerator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-03-07
 * @version 0.1
 * @brief 节点 id 重新生成实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#include "IdRegenerator.h"
#include <array>
#include <algorithm>
#include <utility>

namespace animator::model
{
namespace
{
constexpr std::string_view URL_PREFIX = "url(#";

constexpr std::array<std::string_view, 2> HASH_REF_ATTRS = {"href", "xlink:href"};

constexpr std::array<std::string_view, 12> URL_REF_ATTRS = {"fill",
                                                            "stroke",
                                                            "clip-path",
                                                            "clipPath",
                                                            "mask",
                                                            "marker",
                                                            "marker-start",
                                                            "marker-mid",
                                                            "marker-end",
                                                            "filter",
                                                            "flood-color",
                                                            "lighting-color"};

constexpr std::array<std::string_view, 3> DIRECT_REF_ATTRS = {"baseId", "targetId", "boundElementId"};

template <size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view key)
{
    return std::ranges::find(names, key) != names.end();
}
} // namespace

std::string replaceUrlRefs(std::string_view value, const IdMap& ids)
{
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size())
    {
        const size_t start = value.find(URL_PREFIX, pos);
        if (start == std::string_view::npos) break;

        const size_t idStart = start + URL_PREFIX.size();
        const size_t close = value.find(')', idStart);
        if (close == std::string_view::npos || close == idStart) break;

        result.append(value.substr(pos, idStart - pos));
        const std::string oldId(value.substr(idStart, close - idStart));
        auto it = ids.find(oldId);
        result.append(it != ids.end() ? it->second : oldId);
        result.push_back(')');
        pos = close + 1;
    }
    result.append(value.substr(std::min(pos, value.size())));
    return result;
}

IdRegenerator::IdRegenerator(utils::IdGenerator generator) : m_generator(std::move(generator))
{
    if (!m_generator)
    {
        m_generator = utils::GenerateUniqueId;
    }
}

Node IdRegenerator::regenerate(const Node& root)
{
    Node cloned = root;
    collectIds(cloned);
    rewriteReferences(cloned);
    return cloned;
}

void IdRegenerator::collectIds(Node& node)
{
    if (node.id && !node.id->empty())
    {
        std::string newId = m_generator();
        m_idMap[*node.id] = newId;
        node.id = std::move(newId);
    }

    for (auto& child : node.children)
    {
        collectIds(child);
    }
}

void IdRegenerator::rewriteReferences(Node& node) const
{
    rewriteJson(node.attributes);
    for (auto& child : node.children)
    {
        rewriteReferences(child);
    }
}

std::string IdRegenerator::translate(const std::string& oldId) const
{
    auto it = m_idMap.find(oldId);
    return it != m_idMap.end() ? it->second : oldId;
}

void IdRegenerator::rewriteJson(Json& object) const
{
    if (object.is_array())
    {
        for (auto& item : object)
        {
            if (item.is_string())
            {
                rewriteString({}, item);
            }
            else if (item.is_structured())
            {
                rewriteJson(item);
            }
        }
        return;
    }

    if (!object.is_object()) return;

    for (auto it = object.begin(); it != object.end(); ++it)
    {
        const std::string& key = it.key();
        Json& value = it.value();

        if (value.is_string())
        {
            rewriteString(key, value);
        }
        else if (key == "style" && value.is_object())
        {
            for (auto& styleValue : value)
            {
                if (styleValue.is_string())
                {
                    styleValue = replaceUrlRefs(styleValue.get<std::string>(), m_idMap);
                }
            }
        }
        else if (value.is_structured() && key != "animate")
        {
            rewriteJson(value);
        }
    }
}

void IdRegenerator::rewriteString(std::string_view key, Json& value) const
{
    const auto text = value.get<std::string>();

    if (contains(HASH_REF_ATTRS, key))
    {
        if (text.starts_with('#'))
        {
            auto it = m_idMap.find(text.substr(1));
            if (it != m_idMap.end()) value = "#" + it->second;
        }
    }
    else if (contains(URL_REF_ATTRS, key))
    {
        value = replaceUrlRefs(text, m_idMap);
    }
    else if (contains(DIRECT_REF_ATTRS, key))
    {
        auto it = m_idMap.find(text);
        if (it != m_idMap.end()) value = it->second;
    }
    else if (text.find(URL_PREFIX) != std::string::npos)
    {
        value = replaceUrlRefs(text, m_idMap);
    }
}

} // namespace animator::model
